#pragma once

#include <string>

#include <httplib.h>

#include "types.hpp"

namespace autocorrect {

inline void enable_cors(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
}

inline void send_json(httplib::Response& res, const json& j, int status = 200) {
    res.status = status;
    res.set_content(j.dump(2), "application/json");
}

inline void send_error(httplib::Response& res, int status, const std::string& message) {
    json err;
    err["error"] = message;
    send_json(res, err, status);
}

} // namespace autocorrect

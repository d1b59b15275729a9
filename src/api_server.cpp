#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include "api_engine.hpp"
#include "api_http.hpp"
#include "config.hpp"
#include "env_loader.hpp"
#include "errors.hpp"

using autocorrect::Engine;
using autocorrect::json;

int main(int argc, char** argv) {
    if (argc > 3) {
        std::cerr << "Usage: api_server [ENV_FILE] [port]\n"
                  << "Example: api_server .env 8080\n";
        return 1;
    }

    std::filesystem::path env_file = argc >= 2 ? argv[1] : ".env";

    Engine engine;
    try {
        auto vars = autocorrect::load_env_with_overrides(env_file, autocorrect::kConfigKeys);
        engine.config = autocorrect::load_app_config(vars);
        if (argc >= 3) engine.config.port = autocorrect::parse_port("port", argv[2]);
    } catch (const autocorrect::ConfigurationError& e) {
        std::cerr << "[config] " << e.what() << "\n";
        return 1;
    }
    std::cout << "[config] " << autocorrect::config_to_json(engine.config).dump() << "\n";

    if (!engine.reload()) {
        std::cerr << "Failed to load vocabulary from: "
                  << (engine.config.vocab.empty() ? engine.config.dataset : engine.config.vocab) << "\n";
        return 1;
    }

    httplib::Server svr;

    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cerr << "[http] " << req.method << " " << req.path << " -> " << res.status << "\n";
    });

    svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            std::cerr << "[exception] " << req.method << " " << req.path << " : " << e.what() << "\n";
        }
        res.status = 500;
        res.set_content(R"({"error":"internal server error"})", "application/json");
    });

    svr.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        std::cerr << "[error] " << req.method << " " << req.path << " -> " << res.status << "\n";
    });

    // CORS preflight handler (OPTIONS) for all routes
    svr.Options(R"(.*)", [](const httplib::Request& req, httplib::Response& res) {
        autocorrect::enable_cors(res);

        if (req.has_header("Access-Control-Request-Headers")) {
            res.set_header("Access-Control-Allow-Headers",
                           req.get_header_value("Access-Control-Request-Headers"));
        }

        res.status = 204;
    });

    svr.Get("/api/health", [&](const httplib::Request&, httplib::Response& res) {
        autocorrect::enable_cors(res);
        json j = engine.stats();
        j["ok"] = j["loaded"];
        autocorrect::send_json(res, j);
    });

    svr.Get("/api/suggest", [&](const httplib::Request& req, httplib::Response& res) {
        autocorrect::enable_cors(res);

        using clock = std::chrono::steady_clock;
        auto t0 = clock::now();

        if (!req.has_param("q")) {
            autocorrect::send_error(res, 400, "missing q param");
            return;
        }

        std::string q = req.get_param_value("q");
        int k = engine.config.k;
        try {
            if (req.has_param("k")) k = autocorrect::parse_int("k", req.get_param_value("k"));
        } catch (const autocorrect::ConfigurationError&) {
            autocorrect::send_error(res, 400, "k must be an integer");
            return;
        }

        json j;
        try {
            j = engine.suggest(q, k);
        } catch (const autocorrect::InvalidArgument& e) {
            autocorrect::send_error(res, 400, e.what());
            return;
        } catch (const autocorrect::ConfigurationError& e) {
            autocorrect::send_error(res, 503, e.what());
            return;
        }

        double ms = std::chrono::duration<double, std::milli>(clock::now() - t0).count();
        j["time_ms"] = ms;
        std::cerr << "[suggest] q=\"" << q << "\" k=" << k << " tier=" << j["tier"].get<std::string>()
                  << " results=" << j["suggestions"].size() << " time=" << ms << "ms\n";

        autocorrect::send_json(res, j);
    });

    svr.Get("/api/word", [&](const httplib::Request& req, httplib::Response& res) {
        autocorrect::enable_cors(res);

        if (!req.has_param("w")) {
            autocorrect::send_error(res, 400, "missing w param");
            return;
        }

        try {
            autocorrect::send_json(res, engine.word_info(req.get_param_value("w")));
        } catch (const autocorrect::ConfigurationError& e) {
            autocorrect::send_error(res, 503, e.what());
        }
    });

    svr.Post("/api/reload", [&](const httplib::Request&, httplib::Response& res) {
        autocorrect::enable_cors(res);
        bool ok = engine.reload();
        json j = engine.stats();
        j["reloaded"] = ok;
        autocorrect::send_json(res, j, ok ? 200 : 500);
    });

    std::cout << "API running on http://127.0.0.1:" << engine.config.port << "\n";
    std::cout << "Try: /api/suggest?q=teh&k=3\n";
    if (!svr.listen("0.0.0.0", engine.config.port)) {
        std::cerr << "[http] failed to listen on port " << engine.config.port << "\n";
        return 1;
    }
    return 0;
}

#pragma once

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

// Write `content` to a fresh file under the system temp directory
inline fs::path write_temp_file(const std::string& name, const std::string& content) {
    fs::path p = fs::temp_directory_path() / ("autocorrect_test_" + name);
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
    return p;
}

inline fs::path missing_temp_path(const std::string& name) {
    fs::path p = fs::temp_directory_path() / ("autocorrect_missing_" + name);
    fs::remove(p);
    return p;
}

#include "env_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

#include "textutil.hpp"

namespace autocorrect {

EnvMap load_env_file(const std::filesystem::path& path) {
    EnvMap vars;
    std::ifstream in(path);
    if (!in) return vars;

    std::string line;
    while (std::getline(in, line)) {
        std::string t = trim_ascii(line);
        if (t.empty() || t[0] == '#') continue;
        if (t.rfind("export ", 0) == 0) t = trim_ascii(t.substr(7));

        size_t eq = t.find('=');
        if (eq == std::string::npos) {
            std::cerr << "[config] ignoring malformed line in " << path.string() << ": " << t << "\n";
            continue;
        }

        std::string key = trim_ascii(t.substr(0, eq));
        std::string value = trim_ascii(t.substr(eq + 1));
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }
        if (!key.empty()) vars[key] = value;
    }
    return vars;
}

EnvMap load_env_with_overrides(const std::filesystem::path& path,
                               const std::vector<std::string>& keys) {
    EnvMap vars = load_env_file(path);
    for (const auto& key : keys) {
        if (const char* v = std::getenv(key.c_str())) vars[key] = v;
    }
    return vars;
}

} // namespace autocorrect

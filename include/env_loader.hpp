#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace autocorrect {

using EnvMap = std::unordered_map<std::string, std::string>;

// Parse a .env file: KEY=VALUE per line, '#' comments, optional single or
// double quotes around the value. A missing file yields an empty map.
EnvMap load_env_file(const std::filesystem::path& path);

// Values from `path`, overridden by any process environment variable with
// the same name for each of `keys`.
EnvMap load_env_with_overrides(const std::filesystem::path& path,
                               const std::vector<std::string>& keys);

} // namespace autocorrect

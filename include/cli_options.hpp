#pragma once

#include <optional>
#include <string>

#include "config.hpp"

namespace autocorrect {

// Command-line flags of the interactive corrector. Unset values fall back
// to the configuration file/environment.
struct CliOptions {
    fs::path env_file = ".env";
    std::optional<fs::path> dataset;
    std::optional<fs::path> vocab;
    std::optional<int> k;
    bool lemmatize = false;
    bool help = false;
};

// Accepts "--flag value" and "--flag=value".
// Throws InvalidArgument on unknown flags, missing values or a bad --k.
CliOptions parse_cli_options(int argc, const char* const argv[]);

void apply_cli_options(const CliOptions& opts, AppConfig& cfg);

std::string cli_usage(const std::string& program);

} // namespace autocorrect

#pragma once

#include <stdexcept>
#include <string>

namespace autocorrect {

// Caller passed a value the pipeline cannot work with (e.g. n <= 0).
class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& what) : std::invalid_argument(what) {}
};

// Vocabulary or settings are unusable; raised at construction/load time,
// never per query.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace autocorrect

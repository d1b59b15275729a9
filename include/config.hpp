#pragma once

#include <string>
#include <vector>

#include "env_loader.hpp"
#include "types.hpp"

namespace autocorrect {

enum class AlphabetSource {
    Ascii,
    Vocabulary
};

struct AppConfig {
    fs::path dataset = "final.txt";   // raw text corpus
    fs::path vocab;                   // JSON frequency table, wins over dataset when set
    int k = 3;
    int max_k = 10;
    int max_word_len = 32;            // longer queries are refused by the service
    bool lemmatize = false;
    AlphabetSource alphabet = AlphabetSource::Ascii;
    int port = 8080;
};

// Every key load_app_config understands
inline const std::vector<std::string> kConfigKeys = {
    "AUTOCORRECT_DATASET",
    "AUTOCORRECT_VOCAB",
    "AUTOCORRECT_K",
    "AUTOCORRECT_MAX_K",
    "AUTOCORRECT_MAX_WORD_LEN",
    "AUTOCORRECT_LEMMATIZE",
    "AUTOCORRECT_ALPHABET",
    "AUTOCORRECT_PORT",
};

// Map env-style variables onto AppConfig, keeping defaults for absent keys.
// Throws ConfigurationError for unparsable or out-of-range values.
AppConfig load_app_config(const EnvMap& vars);

// "1", "true", "yes", "on" (any case) -> true; "0", "false", "no", "off" -> false
bool parse_flag(const std::string& key, const std::string& value);

// Whole-string integer parse; trailing characters are an error.
// Throws ConfigurationError.
int parse_int(const std::string& key, const std::string& value);

int parse_positive_int(const std::string& key, const std::string& value);

// 1..65535
int parse_port(const std::string& key, const std::string& value);

json config_to_json(const AppConfig& cfg);

} // namespace autocorrect

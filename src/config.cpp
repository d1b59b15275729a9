#include "config.hpp"

#include <stdexcept>

#include "errors.hpp"
#include "textutil.hpp"

namespace autocorrect {

bool parse_flag(const std::string& key, const std::string& value) {
    std::string v = case_fold(value);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off" || v.empty()) return false;
    throw ConfigurationError(key + ": expected a boolean, got \"" + value + "\"");
}

int parse_int(const std::string& key, const std::string& value) {
    int n = 0;
    size_t used = 0;
    try {
        n = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw ConfigurationError(key + ": expected an integer, got \"" + value + "\"");
    }
    if (used != value.size()) {
        throw ConfigurationError(key + ": expected an integer, got \"" + value + "\"");
    }
    return n;
}

int parse_positive_int(const std::string& key, const std::string& value) {
    int n = parse_int(key, value);
    if (n <= 0) {
        throw ConfigurationError(key + ": must be positive, got " + value);
    }
    return n;
}

int parse_port(const std::string& key, const std::string& value) {
    int port = parse_positive_int(key, value);
    if (port > 65535) throw ConfigurationError(key + ": out of range: " + value);
    return port;
}

AppConfig load_app_config(const EnvMap& vars) {
    AppConfig cfg;

    auto get = [&](const char* key, std::string& out) {
        auto it = vars.find(key);
        if (it == vars.end() || it->second.empty()) return false;
        out = it->second;
        return true;
    };

    std::string v;
    if (get("AUTOCORRECT_DATASET", v)) cfg.dataset = v;
    if (get("AUTOCORRECT_VOCAB", v)) cfg.vocab = v;
    if (get("AUTOCORRECT_K", v)) cfg.k = parse_positive_int("AUTOCORRECT_K", v);
    if (get("AUTOCORRECT_MAX_K", v)) cfg.max_k = parse_positive_int("AUTOCORRECT_MAX_K", v);
    if (get("AUTOCORRECT_LEMMATIZE", v)) cfg.lemmatize = parse_flag("AUTOCORRECT_LEMMATIZE", v);
    if (get("AUTOCORRECT_MAX_WORD_LEN", v)) {
        cfg.max_word_len = parse_positive_int("AUTOCORRECT_MAX_WORD_LEN", v);
    }
    if (get("AUTOCORRECT_PORT", v)) cfg.port = parse_port("AUTOCORRECT_PORT", v);
    if (get("AUTOCORRECT_ALPHABET", v)) {
        std::string a = case_fold(v);
        if (a == "ascii") {
            cfg.alphabet = AlphabetSource::Ascii;
        } else if (a == "vocabulary") {
            cfg.alphabet = AlphabetSource::Vocabulary;
        } else {
            throw ConfigurationError("AUTOCORRECT_ALPHABET: expected ascii or vocabulary, got \"" + v + "\"");
        }
    }

    if (cfg.k > cfg.max_k) cfg.max_k = cfg.k;
    return cfg;
}

json config_to_json(const AppConfig& cfg) {
    json j;
    j["dataset"] = cfg.dataset.string();
    j["vocab"] = cfg.vocab.string();
    j["k"] = cfg.k;
    j["max_k"] = cfg.max_k;
    j["max_word_len"] = cfg.max_word_len;
    j["lemmatize"] = cfg.lemmatize;
    j["alphabet"] = cfg.alphabet == AlphabetSource::Vocabulary ? "vocabulary" : "ascii";
    j["port"] = cfg.port;
    return j;
}

} // namespace autocorrect

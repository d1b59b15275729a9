#include "vocab_io.hpp"

#include <fstream>
#include <iostream>
#include <limits>

#include "corpus.hpp"
#include "errors.hpp"

namespace autocorrect {

json vocabulary_to_json(const Vocabulary& vocab) {
    json j;
    j["total_count"] = vocab.total_count();
    j["words"] = json::object();
    for (const auto& kv : vocab.counts()) j["words"][kv.first] = kv.second;
    return j;
}

Vocabulary vocabulary_from_json(const json& j) {
    if (!j.is_object() || !j.contains("words") || !j["words"].is_object()) {
        throw ConfigurationError("frequency table must be an object with a \"words\" object");
    }

    WordCounts counts;
    uint64_t sum = 0;
    for (auto it = j["words"].begin(); it != j["words"].end(); ++it) {
        if (!it.value().is_number_unsigned()) {
            throw ConfigurationError("count for \"" + it.key() + "\" must be a non-negative integer");
        }
        uint64_t c = it.value().get<uint64_t>();
        if (c > std::numeric_limits<uint64_t>::max() - sum) {
            throw ConfigurationError("sum of counts overflows 64 bits at \"" + it.key() + "\"");
        }
        counts[it.key()] += c;
        sum += c;
    }

    if (j.contains("total_count")) {
        const json& t = j["total_count"];
        if (!t.is_number_unsigned()) {
            throw ConfigurationError("total_count must be a non-negative integer");
        }
        if (t.get<uint64_t>() != sum) {
            throw ConfigurationError("total_count " + std::to_string(t.get<uint64_t>()) +
                                     " does not match the sum of counts " + std::to_string(sum));
        }
    }

    return Vocabulary(counts);
}

bool save_vocabulary_json(const fs::path& path, const Vocabulary& vocab) {
    std::ofstream out(path);
    if (!out) return false;
    out << vocabulary_to_json(vocab).dump(2) << "\n";
    return (bool)out;
}

Vocabulary load_vocabulary_json(const fs::path& path) {
    std::ifstream in(path);
    if (!in) throw ConfigurationError("cannot open frequency table: " + path.string());

    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw ConfigurationError("invalid JSON in " + path.string() + ": " + e.what());
    }
    return vocabulary_from_json(j);
}

std::shared_ptr<const Vocabulary> load_vocabulary_source(const AppConfig& cfg) {
    std::shared_ptr<const Vocabulary> vocab;
    fs::path source;

    if (!cfg.vocab.empty()) {
        source = cfg.vocab;
        vocab = std::make_shared<const Vocabulary>(load_vocabulary_json(cfg.vocab));
    } else {
        source = cfg.dataset;
        WordCounts counts;
        if (!load_corpus_counts(cfg.dataset, counts)) {
            throw ConfigurationError("dataset not found: " + cfg.dataset.string());
        }
        vocab = std::make_shared<const Vocabulary>(counts);
    }

    std::cerr << "[vocab] loaded " << vocab->size() << " words (total="
              << vocab->total_count() << ") from " << source.string() << "\n";
    return vocab;
}

} // namespace autocorrect

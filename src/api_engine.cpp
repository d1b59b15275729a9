#include "api_engine.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "errors.hpp"
#include "normalizer.hpp"
#include "vocab_io.hpp"

namespace autocorrect {

std::shared_ptr<const Suggester> build_suggester(const AppConfig& cfg,
                                                 std::shared_ptr<const Vocabulary> vocab) {
    std::shared_ptr<const Normalizer> normalizer;
    if (cfg.lemmatize) {
        normalizer = std::make_shared<const LemmaNormalizer>(vocab);
    } else {
        normalizer = std::make_shared<const CaseFoldNormalizer>();
    }

    std::string alphabet = kAsciiLowercase;
    if (cfg.alphabet == AlphabetSource::Vocabulary && vocab) alphabet = vocab->alphabet();

    return std::make_shared<const Suggester>(std::move(vocab), std::move(normalizer), std::move(alphabet));
}

// Rebuild the pipeline from the configured source
bool Engine::reload() {
    std::shared_ptr<const Suggester> fresh;
    try {
        fresh = build_suggester(config, load_vocabulary_source(config));
    } catch (const ConfigurationError& e) {
        std::cerr << "[reload] failed: " << e.what() << "\n";
        return false;
    }

    // Lock only for the swap so in-flight queries are never blocked by I/O
    std::lock_guard<std::mutex> lock(mtx);
    suggester_ = std::move(fresh);
    return true;
}

std::shared_ptr<const Suggester> Engine::current() {
    std::lock_guard<std::mutex> lock(mtx);
    return suggester_;
}

// Return ranked corrections as JSON
json Engine::suggest(const std::string& query, int k) {
    auto s = current();
    if (!s) throw ConfigurationError("no vocabulary loaded");

    // Two-edit generation grows steeply with length, so bound the word first
    const std::string normalized = s->normalize(query);
    if ((int)normalized.size() > config.max_word_len) {
        throw InvalidArgument("word longer than " + std::to_string(config.max_word_len) + " characters");
    }

    // Cap k at max_k; k <= 0 is left for the pipeline to reject
    const int L = std::min(k, config.max_k);
    SuggestionResult r = s->lookup(query, L);

    json out;
    out["query"] = r.query;
    out["normalized"] = r.normalized;
    out["k"] = L;
    out["tier"] = tier_name(r.tier);
    out["suggestions"] = json::array();

    const Vocabulary& vocab = s->vocabulary();
    for (const auto& sug : r.suggestions) {
        json item;
        item["word"] = sug.word;
        item["probability"] = sug.probability;
        item["count"] = vocab.count(sug.word);
        out["suggestions"].push_back(item);
    }
    return out;
}

json Engine::word_info(const std::string& word) {
    auto s = current();
    if (!s) throw ConfigurationError("no vocabulary loaded");

    std::string w = s->normalize(word);
    const Vocabulary& vocab = s->vocabulary();

    json out;
    out["word"] = w;
    out["known"] = vocab.contains(w);
    out["count"] = vocab.count(w);
    out["probability"] = vocab.probability(w);
    return out;
}

json Engine::stats() {
    auto s = current();

    json out;
    out["loaded"] = (bool)s;
    out["lemmatize"] = config.lemmatize;
    if (!s) return out;

    out["words"] = s->vocabulary().size();
    out["total_count"] = s->vocabulary().total_count();
    out["alphabet"] = s->alphabet();
    return out;
}

} // namespace autocorrect

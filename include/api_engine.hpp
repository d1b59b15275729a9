#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "config.hpp"
#include "suggester.hpp"
#include "types.hpp"
#include "vocabulary.hpp"

namespace autocorrect {

// Wire the pipeline the configuration asks for (normalizer, alphabet) on
// top of an already loaded vocabulary.
std::shared_ptr<const Suggester> build_suggester(const AppConfig& cfg,
                                                 std::shared_ptr<const Vocabulary> vocab);

struct Engine {
    AppConfig config;

    // Guards the pointer swap only; queries run on their own copy.
    std::mutex mtx;

    // Reload the vocabulary named by config and swap in a new pipeline.
    // On failure the previous pipeline (if any) keeps serving.
    bool reload();

    // Current pipeline, null before the first successful reload
    std::shared_ptr<const Suggester> current();

    // {"query","normalized","k","tier","suggestions":[{"word","probability","count"}]}
    // k is capped at config.max_k. Throws InvalidArgument for k <= 0 or a
    // normalized word longer than config.max_word_len, and ConfigurationError
    // when nothing is loaded.
    json suggest(const std::string& query, int k);

    // {"word","known","count","probability"} for one normalized word
    json word_info(const std::string& word);

    // {"loaded","words","total_count","alphabet","lemmatize"}
    json stats();

private:
    std::shared_ptr<const Suggester> suggester_;
};

} // namespace autocorrect

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "candidates.hpp"
#include "normalizer.hpp"
#include "ranker.hpp"
#include "types.hpp"
#include "vocabulary.hpp"

namespace autocorrect {

struct SuggestionResult {
    std::string query;
    std::string normalized;
    MatchTier tier = MatchTier::None;
    std::vector<Suggestion> suggestions;
};

// normalize -> generate -> staged filter -> rank -> top-n.
//
// Immutable once built: every method is const and touches no shared mutable
// state, so one instance can serve concurrent callers.
class Suggester {
public:
    // A null normalizer means CaseFoldNormalizer.
    // Throws ConfigurationError for an empty vocabulary.
    explicit Suggester(std::shared_ptr<const Vocabulary> vocab,
                       std::shared_ptr<const Normalizer> normalizer = nullptr,
                       std::string alphabet = kAsciiLowercase);

    // Ranked suggestions, at most n. Empty when nothing is within two edits.
    // Throws InvalidArgument when n <= 0.
    std::vector<Suggestion> suggest(const std::string& word, int n) const;

    // Same as suggest() but also reports the normalized query and the tier
    // that produced the result.
    SuggestionResult lookup(const std::string& word, int n) const;

    std::string normalize(const std::string& word) const;

    const Vocabulary& vocabulary() const { return *vocab_; }
    const std::string& alphabet() const { return generator_.alphabet(); }

private:
    std::shared_ptr<const Vocabulary> vocab_;
    std::shared_ptr<const Normalizer> normalizer_;
    CandidateGenerator generator_;
    FrequencyRanker ranker_;
};

} // namespace autocorrect

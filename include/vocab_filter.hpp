#pragma once

#include <string>

#include "candidates.hpp"
#include "types.hpp"
#include "vocabulary.hpp"

namespace autocorrect {

struct FilterResult {
    MatchTier tier = MatchTier::None;
    CandidateSet survivors;
};

// Plain intersection: candidates that are vocabulary keys
CandidateSet intersect_known(const CandidateSet& candidates, const Vocabulary& vocab);

// Staged filter:
// 1. word itself is known        -> {word}         (Exact)
// 2. known one-edit candidates   -> those          (OneEdit)
// 3. known two-edit candidates   -> those          (TwoEdit)
// 4. nothing                     -> empty          (None)
// A later stage runs only when every earlier stage came up empty.
FilterResult filter_known(const std::string& word,
                          const CandidateGenerator& generator,
                          const Vocabulary& vocab);

} // namespace autocorrect

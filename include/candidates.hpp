#pragma once

#include <functional>
#include <string>

#include "types.hpp"

namespace autocorrect {

// Builds the bounded edit neighborhoods of a query word.
//
// Notes:
// - Tier 1 is edits1(word).
// - Tier 2 is edits1 applied to every tier-1 string, plus tier 1 itself and
//   the word. There is no tier 3.
// - Tiers are exposed separately so the filter can prefer closer edits.
class CandidateGenerator {
public:
    explicit CandidateGenerator(std::string alphabet = kAsciiLowercase);

    const std::string& alphabet() const { return alphabet_; }

    CandidateSet one_edit(const std::string& word) const;

    // Materializes the full two-edit tier. Grows quadratically with
    // L*|alphabet|; prefer for_each_two_edit when only membership matters.
    CandidateSet two_edit(const std::string& word) const;
    CandidateSet two_edit(const std::string& word, const CandidateSet& one_edit) const;

    // Streams the two-edit tier to visit() without building the set.
    // A string may be visited more than once.
    void for_each_two_edit(const std::string& word,
                           const CandidateSet& one_edit,
                           const std::function<void(const std::string&)>& visit) const;

private:
    std::string alphabet_;
};

} // namespace autocorrect

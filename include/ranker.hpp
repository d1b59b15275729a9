#pragma once

#include <memory>
#include <vector>

#include "types.hpp"
#include "vocabulary.hpp"

namespace autocorrect {

// Orders surviving words by corpus probability.
//
// Ordering is probability descending, then word ascending, which gives a
// total order and a stable top-N cut.
class FrequencyRanker {
public:
    // Throws ConfigurationError for a null/empty vocabulary or a zero total.
    explicit FrequencyRanker(std::shared_ptr<const Vocabulary> vocab);

    std::vector<Suggestion> rank(const CandidateSet& survivors) const;

    const Vocabulary& vocabulary() const { return *vocab_; }

private:
    std::shared_ptr<const Vocabulary> vocab_;
};

} // namespace autocorrect

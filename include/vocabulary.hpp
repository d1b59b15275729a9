#pragma once

#include <cstdint>
#include <string>

#include "types.hpp"

namespace autocorrect {

// Immutable word -> count table.
//
// Notes:
// - Keys are case-folded on construction; counts of keys that fold to the
//   same word are summed. Keys that fold to "" are dropped.
// - Throws ConfigurationError when the total does not fit in 64 bits.
// - The total count is computed once here and never per query.
// - An empty table is representable; the ranker refuses it.
class Vocabulary {
public:
    Vocabulary() = default;
    explicit Vocabulary(const WordCounts& counts);

    bool empty() const { return counts_.empty(); }
    size_t size() const { return counts_.size(); }

    bool contains(const std::string& word) const;

    // 0 for unknown words
    uint64_t count(const std::string& word) const;
    uint64_t total_count() const { return total_; }

    // count / total_count, 0.0 for unknown words or a zero total
    double probability(const std::string& word) const;

    // Sorted distinct characters used by all keys
    std::string alphabet() const;

    const WordCounts& counts() const { return counts_; }

private:
    WordCounts counts_;
    uint64_t total_ = 0;
};

} // namespace autocorrect

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace autocorrect {

// Word -> occurrence count
WordCounts count_word_frequency(const std::vector<std::string>& words);

// Word -> count / total. Empty when the total is zero.
std::unordered_map<std::string, double> calculate_probability(const WordCounts& counts);

// Read a text corpus, tokenize it and accumulate counts into `counts`.
// Returns false when the file cannot be opened.
bool load_corpus_counts(const fs::path& corpus_path, WordCounts& counts);

} // namespace autocorrect

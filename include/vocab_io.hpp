#pragma once

#include <memory>

#include "config.hpp"
#include "types.hpp"
#include "vocabulary.hpp"

namespace autocorrect {

// JSON frequency table:
//   {"total_count": 118, "words": {"the": 100, "threw": 10, ...}}

json vocabulary_to_json(const Vocabulary& vocab);

// Throws ConfigurationError on a malformed table or a total_count that does
// not match the sum of the counts.
Vocabulary vocabulary_from_json(const json& j);

// Returns false when the file cannot be written.
bool save_vocabulary_json(const fs::path& path, const Vocabulary& vocab);

// Throws ConfigurationError when the file is missing or malformed.
Vocabulary load_vocabulary_json(const fs::path& path);

// Load the vocabulary named by the configuration: the JSON table when
// cfg.vocab is set, otherwise the raw text corpus cfg.dataset.
// Throws ConfigurationError when the source is missing.
std::shared_ptr<const Vocabulary> load_vocabulary_source(const AppConfig& cfg);

} // namespace autocorrect

#pragma once

#include <string>
#include <vector>

#include "types.hpp"

namespace autocorrect {

// Single-edit operators. Each returns candidates in generation order
// (position-major, then alphabet order); duplicates are possible, e.g.
// deleting either 'l' of "hello".

// L candidates: one character removed
std::vector<std::string> deletes(const std::string& word);

// (L+1)*|alphabet| candidates: one character inserted at every gap
std::vector<std::string> inserts(const std::string& word, const std::string& alphabet);

// One character replaced by every other alphabet character. Never yields
// the word itself.
std::vector<std::string> substitutes(const std::string& word, const std::string& alphabet);

// Adjacent characters swapped; swaps of equal characters are skipped.
std::vector<std::string> transposes(const std::string& word);

// Complete one-edit neighborhood (all four operators, deduplicated)
CandidateSet edits1(const std::string& word, const std::string& alphabet);

} // namespace autocorrect

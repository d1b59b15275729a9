#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

namespace autocorrect {

namespace fs = std::filesystem;
using json = nlohmann::json;

// Unique candidate strings produced for a single query (no ordering)
using CandidateSet = std::unordered_set<std::string>;

// Raw word -> occurrence count mapping as produced by the corpus reader
using WordCounts = std::unordered_map<std::string, uint64_t>;

// The 26 lowercase ASCII letters, the reference edit alphabet
inline const std::string kAsciiLowercase = "abcdefghijklmnopqrstuvwxyz";

struct Suggestion {
    std::string word;
    double probability = 0.0;

    bool operator==(const Suggestion& o) const {
        return word == o.word && probability == o.probability;
    }
    bool operator!=(const Suggestion& o) const { return !(*this == o); }
};

// Which stage of the staged filter produced the surviving set
enum class MatchTier {
    None,
    Exact,
    OneEdit,
    TwoEdit
};

const char* tier_name(MatchTier tier);

} // namespace autocorrect

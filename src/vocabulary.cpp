#include "vocabulary.hpp"

#include <limits>
#include <set>

#include "errors.hpp"
#include "textutil.hpp"

namespace autocorrect {

Vocabulary::Vocabulary(const WordCounts& counts) {
    counts_.reserve(counts.size());
    for (const auto& kv : counts) {
        std::string w = case_fold(kv.first);
        if (w.empty()) continue;

        if (kv.second > std::numeric_limits<uint64_t>::max() - total_) {
            throw ConfigurationError("total word count overflows 64 bits");
        }
        counts_[w] += kv.second;
        total_ += kv.second;
    }
}

bool Vocabulary::contains(const std::string& word) const {
    return counts_.find(word) != counts_.end();
}

uint64_t Vocabulary::count(const std::string& word) const {
    auto it = counts_.find(word);
    return it == counts_.end() ? 0 : it->second;
}

double Vocabulary::probability(const std::string& word) const {
    if (total_ == 0) return 0.0;
    return (double)count(word) / (double)total_;
}

std::string Vocabulary::alphabet() const {
    std::set<char> chars;
    for (const auto& kv : counts_) {
        chars.insert(kv.first.begin(), kv.first.end());
    }
    return std::string(chars.begin(), chars.end());
}

} // namespace autocorrect

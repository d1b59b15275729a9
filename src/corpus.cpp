#include "corpus.hpp"

#include <fstream>
#include <iostream>

#include "textutil.hpp"

namespace autocorrect {

WordCounts count_word_frequency(const std::vector<std::string>& words) {
    WordCounts counts;
    for (const auto& w : words) counts[w]++;
    return counts;
}

std::unordered_map<std::string, double> calculate_probability(const WordCounts& counts) {
    std::unordered_map<std::string, double> probs;

    uint64_t total = 0;
    for (const auto& kv : counts) total += kv.second;
    if (total == 0) return probs;

    probs.reserve(counts.size());
    for (const auto& kv : counts) {
        probs[kv.first] = (double)kv.second / (double)total;
    }
    return probs;
}

bool load_corpus_counts(const fs::path& corpus_path, WordCounts& counts) {
    std::ifstream in(corpus_path, std::ios::binary);
    if (!in) return false;

    // Tokenize line by line so large corpora are never held in memory whole
    std::string line;
    uint64_t tokens = 0;
    while (std::getline(in, line)) {
        for (auto& t : tokenize(line)) {
            counts[t]++;
            tokens++;
        }
    }

    std::cerr << "[corpus] " << corpus_path.string() << ": " << tokens
              << " tokens, " << counts.size() << " distinct words\n";
    return true;
}

} // namespace autocorrect

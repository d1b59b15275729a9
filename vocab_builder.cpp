#include <filesystem>
#include <iostream>

#include "corpus.hpp"
#include "vocab_io.hpp"
#include "vocabulary.hpp"

namespace fs = std::filesystem;
using namespace autocorrect;

int main(int argc, char** argv) {

    // Read corpus and output paths from CLI
    if (argc < 3) {
        std::cerr << "Usage: vocab_builder <CORPUS_TXT> <OUT_JSON>\n";
        return 1;
    }

    fs::path corpus_path = fs::path(argv[1]);
    fs::path out_path = fs::path(argv[2]);

    // Count word frequencies
    WordCounts counts;
    if (!load_corpus_counts(corpus_path, counts)) {
        std::cerr << "Failed to open: " << corpus_path << "\n";
        return 1;
    }
    if (counts.empty()) {
        std::cerr << "No words found in: " << corpus_path << "\n";
        return 1;
    }

    // Write the frequency table
    Vocabulary vocab(counts);
    if (!save_vocabulary_json(out_path, vocab)) {
        std::cerr << "Failed to write: " << out_path << "\n";
        return 1;
    }

    std::cerr << "Built frequency table (" << vocab.size() << " words, total="
              << vocab.total_count() << ") in: " << out_path << "\n";
    return 0;
}

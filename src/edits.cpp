#include "edits.hpp"

#include <utility>

namespace autocorrect {

std::vector<std::string> deletes(const std::string& word) {
    std::vector<std::string> out;
    out.reserve(word.size());
    for (size_t i = 0; i < word.size(); i++) {
        std::string s = word;
        s.erase(i, 1);
        out.push_back(std::move(s));
    }
    return out;
}

std::vector<std::string> inserts(const std::string& word, const std::string& alphabet) {
    std::vector<std::string> out;
    out.reserve((word.size() + 1) * alphabet.size());
    for (size_t i = 0; i <= word.size(); i++) {
        for (char c : alphabet) {
            std::string s;
            s.reserve(word.size() + 1);
            s.append(word, 0, i);
            s.push_back(c);
            s.append(word, i, std::string::npos);
            out.push_back(std::move(s));
        }
    }
    return out;
}

std::vector<std::string> substitutes(const std::string& word, const std::string& alphabet) {
    std::vector<std::string> out;
    out.reserve(word.size() * alphabet.size());
    for (size_t i = 0; i < word.size(); i++) {
        for (char c : alphabet) {
            // identity replacement would just reproduce the word
            if (c == word[i]) continue;
            std::string s = word;
            s[i] = c;
            out.push_back(std::move(s));
        }
    }
    return out;
}

std::vector<std::string> transposes(const std::string& word) {
    std::vector<std::string> out;
    if (word.size() < 2) return out;
    out.reserve(word.size() - 1);
    for (size_t i = 0; i + 1 < word.size(); i++) {
        if (word[i] == word[i + 1]) continue;
        std::string s = word;
        std::swap(s[i], s[i + 1]);
        out.push_back(std::move(s));
    }
    return out;
}

CandidateSet edits1(const std::string& word, const std::string& alphabet) {
    CandidateSet out;
    // Upper bound: 2*L*|S| + |S| + L
    out.reserve(2 * (word.size() + 1) * alphabet.size() + word.size());

    for (auto& s : deletes(word)) out.insert(std::move(s));
    for (auto& s : transposes(word)) out.insert(std::move(s));
    for (auto& s : substitutes(word, alphabet)) out.insert(std::move(s));
    for (auto& s : inserts(word, alphabet)) out.insert(std::move(s));
    return out;
}

} // namespace autocorrect

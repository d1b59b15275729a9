#include "candidates.hpp"

#include <utility>

#include "edits.hpp"

namespace autocorrect {

CandidateGenerator::CandidateGenerator(std::string alphabet)
    : alphabet_(std::move(alphabet)) {}

CandidateSet CandidateGenerator::one_edit(const std::string& word) const {
    return edits1(word, alphabet_);
}

CandidateSet CandidateGenerator::two_edit(const std::string& word) const {
    return two_edit(word, one_edit(word));
}

CandidateSet CandidateGenerator::two_edit(const std::string& word,
                                          const CandidateSet& one_edit) const {
    CandidateSet out;
    out.reserve(one_edit.size() * one_edit.size() / 2 + 1);
    for_each_two_edit(word, one_edit, [&](const std::string& s) { out.insert(s); });
    return out;
}

void CandidateGenerator::for_each_two_edit(const std::string& word,
                                           const CandidateSet& one_edit,
                                           const std::function<void(const std::string&)>& visit) const {
    // zero-edit and one-edit strings are part of the tier as well
    visit(word);
    for (const auto& w1 : one_edit) {
        visit(w1);
        for (const auto& w2 : edits1(w1, alphabet_)) visit(w2);
    }
}

} // namespace autocorrect

#include "normalizer.hpp"

#include <utility>
#include <vector>

#include "errors.hpp"
#include "textutil.hpp"

namespace autocorrect {

namespace {

struct DetachRule {
    const char* suffix;
    const char* replacement;
};

// Noun detachment rules in the spirit of WordNet's morphy
const DetachRule kNounRules[] = {
    {"s", ""},
    {"ses", "s"},
    {"xes", "x"},
    {"zes", "z"},
    {"ches", "ch"},
    {"shes", "sh"},
    {"men", "man"},
    {"ies", "y"},
};

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool better_lemma(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return a.size() < b.size();
    return a < b;
}

} // namespace

std::string CaseFoldNormalizer::normalize(const std::string& word) const {
    return case_fold(word);
}

LemmaNormalizer::LemmaNormalizer(std::shared_ptr<const Vocabulary> dictionary)
    : dictionary_(std::move(dictionary)) {
    if (!dictionary_) throw ConfigurationError("lemmatizer needs a dictionary");
}

std::string LemmaNormalizer::normalize(const std::string& word) const {
    std::string folded = case_fold(word);

    std::vector<std::string> forms;
    if (dictionary_->contains(folded)) forms.push_back(folded);

    for (const auto& rule : kNounRules) {
        const std::string suffix = rule.suffix;
        if (!ends_with(folded, suffix) || folded.size() == suffix.size()) continue;
        std::string base = folded.substr(0, folded.size() - suffix.size()) + rule.replacement;
        if (dictionary_->contains(base)) forms.push_back(std::move(base));
    }

    if (forms.empty()) return folded;

    std::string best = forms.front();
    for (const auto& f : forms) {
        if (better_lemma(f, best)) best = f;
    }
    return best;
}

} // namespace autocorrect

#include "suggester.hpp"

#include <string>
#include <utility>

#include "errors.hpp"
#include "vocab_filter.hpp"

namespace autocorrect {

static std::shared_ptr<const Normalizer> or_case_fold(std::shared_ptr<const Normalizer> n) {
    if (n) return n;
    return std::make_shared<const CaseFoldNormalizer>();
}

Suggester::Suggester(std::shared_ptr<const Vocabulary> vocab,
                     std::shared_ptr<const Normalizer> normalizer,
                     std::string alphabet)
    : vocab_(vocab),
      normalizer_(or_case_fold(std::move(normalizer))),
      generator_(std::move(alphabet)),
      ranker_(std::move(vocab)) {}

std::string Suggester::normalize(const std::string& word) const {
    return normalizer_->normalize(word);
}

std::vector<Suggestion> Suggester::suggest(const std::string& word, int n) const {
    return lookup(word, n).suggestions;
}

SuggestionResult Suggester::lookup(const std::string& word, int n) const {
    if (n <= 0) {
        throw InvalidArgument("number of suggestions must be positive, got " + std::to_string(n));
    }

    SuggestionResult r;
    r.query = word;
    r.normalized = normalize(word);

    FilterResult known = filter_known(r.normalized, generator_, *vocab_);
    r.tier = known.tier;
    if (known.survivors.empty()) return r;

    r.suggestions = ranker_.rank(known.survivors);
    if (r.suggestions.size() > (size_t)n) r.suggestions.resize((size_t)n);
    return r;
}

} // namespace autocorrect

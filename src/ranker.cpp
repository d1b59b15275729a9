#include "ranker.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

#include "errors.hpp"

namespace autocorrect {

FrequencyRanker::FrequencyRanker(std::shared_ptr<const Vocabulary> vocab)
    : vocab_(std::move(vocab)) {
    if (!vocab_ || vocab_->empty()) {
        throw ConfigurationError("vocabulary is empty");
    }
    if (vocab_->total_count() == 0) {
        throw ConfigurationError("vocabulary total count is zero");
    }
}

std::vector<Suggestion> FrequencyRanker::rank(const CandidateSet& survivors) const {
    struct Scored {
        const std::string* word;
        uint64_t count;
    };

    std::vector<Scored> scored;
    scored.reserve(survivors.size());
    for (const auto& w : survivors) scored.push_back(Scored{&w, vocab_->count(w)});

    // Same denominator for every word, so compare exact counts
    std::sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) {
        if (a.count != b.count) return a.count > b.count;
        return *a.word < *b.word;
    });

    const double total = (double)vocab_->total_count();
    std::vector<Suggestion> out;
    out.reserve(scored.size());
    for (const auto& s : scored) {
        out.push_back(Suggestion{*s.word, (double)s.count / total});
    }
    return out;
}

} // namespace autocorrect

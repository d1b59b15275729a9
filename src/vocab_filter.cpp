#include "vocab_filter.hpp"

namespace autocorrect {

const char* tier_name(MatchTier tier) {
    switch (tier) {
    case MatchTier::Exact:   return "exact";
    case MatchTier::OneEdit: return "one_edit";
    case MatchTier::TwoEdit: return "two_edit";
    case MatchTier::None:    break;
    }
    return "none";
}

CandidateSet intersect_known(const CandidateSet& candidates, const Vocabulary& vocab) {
    CandidateSet out;
    for (const auto& c : candidates) {
        if (vocab.contains(c)) out.insert(c);
    }
    return out;
}

FilterResult filter_known(const std::string& word,
                          const CandidateGenerator& generator,
                          const Vocabulary& vocab) {
    FilterResult r;

    // Already correct
    if (vocab.contains(word)) {
        r.tier = MatchTier::Exact;
        r.survivors.insert(word);
        return r;
    }

    CandidateSet level1 = generator.one_edit(word);
    r.survivors = intersect_known(level1, vocab);
    if (!r.survivors.empty()) {
        r.tier = MatchTier::OneEdit;
        return r;
    }

    // Tier 1 is fully known to be empty here; only now look two edits away
    generator.for_each_two_edit(word, level1, [&](const std::string& s) {
        if (vocab.contains(s)) r.survivors.insert(s);
    });
    r.tier = r.survivors.empty() ? MatchTier::None : MatchTier::TwoEdit;
    return r;
}

} // namespace autocorrect

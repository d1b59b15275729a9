#pragma once

#include <memory>
#include <string>

#include "vocabulary.hpp"

namespace autocorrect {

// Query normalization step injected into the pipeline. Implementations must
// fold words the same way the vocabulary keys were folded.
class Normalizer {
public:
    virtual ~Normalizer() = default;
    virtual std::string normalize(const std::string& word) const = 0;
};

// Trim + ASCII lowercase (idempotent)
class CaseFoldNormalizer : public Normalizer {
public:
    std::string normalize(const std::string& word) const override;
};

// Case-folds, then reduces plural/inflected nouns to a base form that
// exists in the dictionary vocabulary ("cats" -> "cat", "boxes" -> "box",
// "ponies" -> "pony", "women" -> "woman").
//
// The shortest known form wins, ties go to the lexicographically smaller one.
// Unknown words come back case-folded but otherwise untouched.
class LemmaNormalizer : public Normalizer {
public:
    explicit LemmaNormalizer(std::shared_ptr<const Vocabulary> dictionary);

    std::string normalize(const std::string& word) const override;

private:
    std::shared_ptr<const Vocabulary> dictionary_;
};

} // namespace autocorrect

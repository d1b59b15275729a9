#include <catch2/catch.hpp>

#include <memory>

#include "errors.hpp"
#include "normalizer.hpp"

using namespace autocorrect;

TEST_CASE("Case folding trims and lowercases.", "[normalizer]") {
    CaseFoldNormalizer n;
    REQUIRE(n.normalize("  HeLLo \n") == "hello");
    REQUIRE(n.normalize("") == "");
    REQUIRE(n.normalize("don't") == "don't");

    SECTION("Folding twice changes nothing.") {
        for (const std::string w : {"ABC", " x ", "already", "MiXeD123"}) {
            REQUIRE(n.normalize(n.normalize(w)) == n.normalize(w));
        }
    }
}

TEST_CASE("The lemmatizer maps inflected nouns to known base forms.", "[normalizer]") {
    auto dict = std::make_shared<const Vocabulary>(WordCounts{
        {"cat", 1}, {"cats", 1}, {"box", 1}, {"pony", 1}, {"woman", 1},
        {"dish", 1}, {"dishe", 1}, {"church", 1}, {"glass", 1}});
    LemmaNormalizer lemma(dict);

    REQUIRE(lemma.normalize("cats") == "cat");
    REQUIRE(lemma.normalize("Boxes") == "box");
    REQUIRE(lemma.normalize("ponies") == "pony");
    REQUIRE(lemma.normalize("women") == "woman");
    REQUIRE(lemma.normalize("churches") == "church");
    REQUIRE(lemma.normalize("glasses") == "glass");

    SECTION("The shortest known form wins.") {
        REQUIRE(lemma.normalize("dishes") == "dish");
    }
    SECTION("Base forms and unknown words pass through case-folded.") {
        REQUIRE(lemma.normalize("Cat") == "cat");
        REQUIRE(lemma.normalize("Zzzs") == "zzzs");
        REQUIRE(lemma.normalize("s") == "s");
    }
}

TEST_CASE("The lemmatizer needs a dictionary.", "[normalizer]") {
    REQUIRE_THROWS_AS(LemmaNormalizer(nullptr), ConfigurationError);
}

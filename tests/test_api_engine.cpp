#include <catch2/catch.hpp>

#include "api_engine.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace autocorrect;

TEST_CASE("The engine serves JSON suggestions from its configured vocabulary.", "[engine]") {
    fs::path table = write_temp_file("engine.json",
        R"({"total_count": 118, "words": {"the": 100, "threw": 10, "there": 5, "three": 3}})");

    Engine engine;
    engine.config.vocab = table;
    engine.config.max_k = 2;

    SECTION("Nothing is served before the first reload.") {
        REQUIRE_FALSE(engine.current());
        REQUIRE_THROWS_AS(engine.suggest("teh", 3), ConfigurationError);
        REQUIRE(engine.stats()["loaded"] == false);
    }

    REQUIRE(engine.reload());
    REQUIRE(engine.current());

    SECTION("Suggestions carry tier, probability and count.") {
        json j = engine.suggest("Teh", 1);
        REQUIRE(j["query"] == "Teh");
        REQUIRE(j["normalized"] == "teh");
        REQUIRE(j["tier"] == "one_edit");
        REQUIRE(j["k"] == 1);
        REQUIRE(j["suggestions"].size() == 1);
        REQUIRE(j["suggestions"][0]["word"] == "the");
        REQUIRE(j["suggestions"][0]["count"] == 100);
        REQUIRE(j["suggestions"][0]["probability"].get<double>() == Approx(100.0 / 118.0));
    }
    SECTION("k is capped at max_k.") {
        json j = engine.suggest("thre", 50);
        REQUIRE(j["k"] == 2);
        REQUIRE(j["suggestions"].size() <= 2);
    }
    SECTION("k <= 0 is rejected.") {
        REQUIRE_THROWS_AS(engine.suggest("teh", 0), InvalidArgument);
    }
    SECTION("Over-long words are rejected before any candidates are built.") {
        engine.config.max_word_len = 8;
        REQUIRE_NOTHROW(engine.suggest("thhhhree", 3));
        REQUIRE_THROWS_AS(engine.suggest("thhhhhree", 3), InvalidArgument);
        REQUIRE_THROWS_AS(engine.suggest(std::string(4096, 'q'), 3), InvalidArgument);
        // Length is measured after normalization
        REQUIRE_NOTHROW(engine.suggest("  THHHHREE  ", 3));
    }
    SECTION("No match is an empty list, not an error.") {
        json j = engine.suggest("qqqqqq", 3);
        REQUIRE(j["tier"] == "none");
        REQUIRE(j["suggestions"].empty());
    }
    SECTION("Single words can be inspected.") {
        json w = engine.word_info(" THREW ");
        REQUIRE(w["word"] == "threw");
        REQUIRE(w["known"] == true);
        REQUIRE(w["count"] == 10);

        REQUIRE(engine.word_info("teh")["known"] == false);
    }
    SECTION("Stats describe the loaded vocabulary.") {
        json s = engine.stats();
        REQUIRE(s["loaded"] == true);
        REQUIRE(s["words"] == 4);
        REQUIRE(s["total_count"] == 118);
        REQUIRE(s["alphabet"] == "abcdefghijklmnopqrstuvwxyz");
    }
    SECTION("A failed reload keeps the previous vocabulary serving.") {
        engine.config.vocab = missing_temp_path("gone.json");
        REQUIRE_FALSE(engine.reload());
        REQUIRE(engine.suggest("teh", 1)["suggestions"][0]["word"] == "the");
    }
    fs::remove(table);
}

TEST_CASE("build_suggester honours lemmatize and alphabet settings.", "[engine]") {
    auto vocab = std::make_shared<const Vocabulary>(WordCounts{{"cat", 5}, {"cats", 1}, {"dog", 2}});

    AppConfig cfg;
    cfg.lemmatize = true;
    cfg.alphabet = AlphabetSource::Vocabulary;
    auto s = build_suggester(cfg, vocab);

    REQUIRE(s->alphabet() == "acdgost");
    REQUIRE(s->normalize("Cats") == "cat");
    REQUIRE(s->suggest("cats", 3)[0].word == "cat");

    AppConfig plain;
    auto p = build_suggester(plain, vocab);
    REQUIRE(p->alphabet() == kAsciiLowercase);
    REQUIRE(p->normalize("Cats") == "cats");
}

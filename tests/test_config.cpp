#include <catch2/catch.hpp>

#include "config.hpp"
#include "env_loader.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace autocorrect;

TEST_CASE(".env files are parsed into key/value pairs.", "[config]") {
    fs::path p = write_temp_file("settings.env",
                                 "# comment\n"
                                 "AUTOCORRECT_K=5\n"
                                 "  AUTOCORRECT_DATASET = \"books.txt\"  \n"
                                 "export AUTOCORRECT_LEMMATIZE='yes'\n"
                                 "\n"
                                 "not a pair\n"
                                 "EMPTY=\n");
    EnvMap vars = load_env_file(p);
    REQUIRE(vars["AUTOCORRECT_K"] == "5");
    REQUIRE(vars["AUTOCORRECT_DATASET"] == "books.txt");
    REQUIRE(vars["AUTOCORRECT_LEMMATIZE"] == "yes");
    REQUIRE(vars.count("EMPTY") == 1);
    REQUIRE(vars.size() == 4);
    fs::remove(p);

    REQUIRE(load_env_file(missing_temp_path("x.env")).empty());
}

TEST_CASE("Defaults apply when nothing is configured.", "[config]") {
    AppConfig cfg = load_app_config({});
    REQUIRE(cfg.dataset == fs::path("final.txt"));
    REQUIRE(cfg.vocab.empty());
    REQUIRE(cfg.k == 3);
    REQUIRE(cfg.max_k == 10);
    REQUIRE_FALSE(cfg.lemmatize);
    REQUIRE(cfg.alphabet == AlphabetSource::Ascii);
    REQUIRE(cfg.max_word_len == 32);
    REQUIRE(cfg.port == 8080);
}

TEST_CASE("Configured values are typed and validated.", "[config]") {
    EnvMap vars = {
        {"AUTOCORRECT_DATASET", "books.txt"},
        {"AUTOCORRECT_VOCAB", "vocab.json"},
        {"AUTOCORRECT_K", "12"},
        {"AUTOCORRECT_MAX_K", "5"},
        {"AUTOCORRECT_LEMMATIZE", "On"},
        {"AUTOCORRECT_ALPHABET", "Vocabulary"},
        {"AUTOCORRECT_PORT", "9000"},
        {"AUTOCORRECT_MAX_WORD_LEN", "20"},
    };
    AppConfig cfg = load_app_config(vars);
    REQUIRE(cfg.dataset == fs::path("books.txt"));
    REQUIRE(cfg.vocab == fs::path("vocab.json"));
    REQUIRE(cfg.k == 12);
    REQUIRE(cfg.max_k == 12);
    REQUIRE(cfg.lemmatize);
    REQUIRE(cfg.alphabet == AlphabetSource::Vocabulary);
    REQUIRE(cfg.port == 9000);
    REQUIRE(cfg.max_word_len == 20);

    json j = config_to_json(cfg);
    REQUIRE(j["alphabet"] == "vocabulary");
    REQUIRE(j["k"] == 12);

    SECTION("Bad values are rejected.") {
        REQUIRE_THROWS_AS(load_app_config({{"AUTOCORRECT_K", "0"}}), ConfigurationError);
        REQUIRE_THROWS_AS(load_app_config({{"AUTOCORRECT_K", "three"}}), ConfigurationError);
        REQUIRE_THROWS_AS(load_app_config({{"AUTOCORRECT_K", "3x"}}), ConfigurationError);
        REQUIRE_THROWS_AS(load_app_config({{"AUTOCORRECT_PORT", "70000"}}), ConfigurationError);
        REQUIRE_THROWS_AS(load_app_config({{"AUTOCORRECT_MAX_WORD_LEN", "0"}}), ConfigurationError);
        REQUIRE_THROWS_AS(load_app_config({{"AUTOCORRECT_LEMMATIZE", "maybe"}}), ConfigurationError);
        REQUIRE_THROWS_AS(load_app_config({{"AUTOCORRECT_ALPHABET", "greek"}}), ConfigurationError);
    }
}

TEST_CASE("Flags accept the usual spellings.", "[config]") {
    for (const std::string v : {"1", "true", "YES", "on"}) REQUIRE(parse_flag("F", v));
    for (const std::string v : {"0", "false", "No", "off", ""}) REQUIRE_FALSE(parse_flag("F", v));
}

TEST_CASE("Integers must use the whole string.", "[config]") {
    REQUIRE(parse_int("k", "3") == 3);
    REQUIRE(parse_int("k", "0") == 0);
    REQUIRE(parse_int("k", "-2") == -2);
    REQUIRE_THROWS_AS(parse_int("k", "3abc"), ConfigurationError);
    REQUIRE_THROWS_AS(parse_int("k", ""), ConfigurationError);
    REQUIRE_THROWS_AS(parse_int("k", "99999999999"), ConfigurationError);
}

TEST_CASE("Ports are limited to 1..65535.", "[config]") {
    REQUIRE(parse_port("port", "1") == 1);
    REQUIRE(parse_port("port", "65535") == 65535);
    REQUIRE_THROWS_AS(parse_port("port", "65536"), ConfigurationError);
    REQUIRE_THROWS_AS(parse_port("port", "0"), ConfigurationError);
    REQUIRE_THROWS_AS(parse_port("port", "80x"), ConfigurationError);
}

#include <catch2/catch_test_macros.hpp>
#include "lilychord/chord_extractor.hpp"

using namespace lilychord;

TEST_CASE("Chord extraction", "[chord_extractor]") {
    SECTION("empty notation has no chords") {
        CHECK(extract_chords("").empty());
    }

    SECTION("text without brackets has no chords") {
        CHECK(extract_chords("c4 d4 e4").empty());
    }

    SECTION("single chord") {
        auto chords = extract_chords("<c e g>");
        REQUIRE(chords.size() == 1);
        CHECK(chords[0].text == "c e g");
    }

    SECTION("durations and bar lines are discarded") {
        auto chords = extract_chords("<e c' g' bf'>1 | <f a>2.");
        REQUIRE(chords.size() == 2);
        CHECK(chords[0].text == "e c' g' bf'");
        CHECK(chords[1].text == "f a");
    }

    SECTION("chords keep their order across lines") {
        auto chords = extract_chords("<e c' g' bf'>1\n<f \\xNote c' \\xNote f' a'>1");
        REQUIRE(chords.size() == 2);
        CHECK(chords[0].text == "e c' g' bf'");
        CHECK(chords[1].text == "f \\xNote c' \\xNote f' a'");
    }

    SECTION("empty brackets are skipped") {
        auto chords = extract_chords("<> <c>");
        REQUIRE(chords.size() == 1);
        CHECK(chords[0].text == "c");
    }

    SECTION("whitespace-only brackets are a chord") {
        auto chords = extract_chords("< >");
        REQUIRE(chords.size() == 1);
        CHECK(chords[0].text == " ");
    }

    SECTION("unterminated chord is ignored") {
        auto chords = extract_chords("<c e> <g");
        REQUIRE(chords.size() == 1);
        CHECK(chords[0].text == "c e");
    }

    SECTION("brackets do not nest") {
        auto chords = extract_chords("<a <b> c>");
        REQUIRE(chords.size() == 1);
        CHECK(chords[0].text == "a <b");
    }
}

TEST_CASE("Chord extraction locations", "[chord_extractor]") {
    auto chords = extract_chords("<e c' g' bf'>1\n<f a'>1");
    REQUIRE(chords.size() == 2);

    SECTION("first chord") {
        CHECK(chords[0].location.line == 1);
        CHECK(chords[0].location.column == 2);
        CHECK(chords[0].location.offset == 1);
        CHECK(chords[0].location.length == 11);
    }

    SECTION("chord on second line") {
        CHECK(chords[1].location.line == 2);
        CHECK(chords[1].location.column == 2);
        CHECK(chords[1].location.offset == 16);
        CHECK(chords[1].location.length == 4);
    }
}

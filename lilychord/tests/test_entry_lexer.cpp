#include <catch2/catch_test_macros.hpp>
#include "lilychord/entry_lexer.hpp"

using namespace lilychord;

namespace {

ChordSpan chord_at_start(std::string_view text) {
    return ChordSpan{
        .text = text,
        .location = {.line = 1, .column = 2, .offset = 1,
                     .length = static_cast<std::uint32_t>(text.size())}
    };
}

} // namespace

TEST_CASE("Entry lexer splits on whitespace", "[entry_lexer]") {
    SECTION("simple triad") {
        auto [entries, normalized] = lex_entries(chord_at_start("c e g"));
        REQUIRE(entries.size() == 3);
        CHECK(entries[0].text == "c");
        CHECK(entries[1].text == "e");
        CHECK(entries[2].text == "g");
        CHECK(normalized == "c e g");
    }

    SECTION("runs of whitespace and surrounding blanks") {
        auto [entries, normalized] = lex_entries(chord_at_start("  c'  ef \t g,, "));
        REQUIRE(entries.size() == 3);
        CHECK(entries[0].text == "c'");
        CHECK(entries[1].text == "ef");
        CHECK(entries[2].text == "g,,");
        CHECK(normalized == "c'  ef \t g,,");
    }

    SECTION("whitespace-only chord has no entries") {
        auto [entries, normalized] = lex_entries(chord_at_start("   "));
        CHECK(entries.empty());
        CHECK(normalized.empty());
    }

    SECTION("entries are lower-cased") {
        auto [entries, normalized] = lex_entries(chord_at_start("C Bf' Xg"));
        REQUIRE(entries.size() == 3);
        CHECK(entries[0].text == "c");
        CHECK(entries[1].text == "bf'");
        CHECK(entries[2].text == "xg");
    }
}

TEST_CASE("Entry lexer hidden-note escape", "[entry_lexer]") {
    SECTION("escape attaches to the following note") {
        auto [entries, normalized] = lex_entries(chord_at_start("f \\xNote c' \\xNote f' a'"));
        REQUIRE(entries.size() == 4);
        CHECK(entries[0].text == "f");
        CHECK(entries[1].text == "xc'");
        CHECK(entries[2].text == "xf'");
        CHECK(entries[3].text == "a'");
        CHECK(normalized == "f xc' xf' a'");
    }

    SECTION("escape without whitespace") {
        auto [entries, normalized] = lex_entries(chord_at_start("\\xNotec"));
        REQUIRE(entries.size() == 1);
        CHECK(entries[0].text == "xc");
    }

    SECTION("escape at the end of a chord stands alone") {
        auto [entries, normalized] = lex_entries(chord_at_start("c \\xNote"));
        REQUIRE(entries.size() == 2);
        CHECK(entries[1].text == "x");
    }

    SECTION("escape is case-sensitive") {
        auto [entries, normalized] = lex_entries(chord_at_start("\\XNOTE c"));
        REQUIRE(entries.size() == 2);
        CHECK(entries[0].text == "\\xnote");
    }
}

TEST_CASE("Entry lexer locations", "[entry_lexer]") {
    SECTION("offsets are relative to the notation string") {
        auto [entries, normalized] = lex_entries(chord_at_start("c ees"));
        REQUIRE(entries.size() == 2);
        CHECK(entries[0].location.offset == 1);
        CHECK(entries[0].location.column == 2);
        CHECK(entries[0].location.length == 1);
        CHECK(entries[1].location.offset == 3);
        CHECK(entries[1].location.column == 4);
        CHECK(entries[1].location.length == 3);
    }

    SECTION("entries on a new line restart the column") {
        auto [entries, normalized] = lex_entries(chord_at_start("c\n  e"));
        REQUIRE(entries.size() == 2);
        CHECK(entries[1].location.line == 2);
        CHECK(entries[1].location.column == 3);
        CHECK(entries[1].location.offset == 5);
    }

    SECTION("hidden entry spans its escape") {
        auto [entries, normalized] = lex_entries(chord_at_start("\\xNote c"));
        REQUIRE(entries.size() == 1);
        CHECK(entries[0].location.offset == 1);
        CHECK(entries[0].location.length == 8);
    }
}

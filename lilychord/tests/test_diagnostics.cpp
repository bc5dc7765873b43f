#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "lilychord/diagnostics.hpp"
#include "lilychord/lilychord.hpp"
#include <nlohmann/json.hpp>

using Catch::Matchers::ContainsSubstring;

TEST_CASE("Diagnostic formatting", "[diagnostics]") {
    lilychord::Diagnostic diag{
        .severity = lilychord::Severity::Error,
        .code = "L002",
        .message = "unrecognized symbols: q",
        .filename = "exercise.ly",
        .location = {.line = 2, .column = 4, .offset = 9, .length = 1}
    };
    diag.related.push_back({.message = "in chord <g q>", .location = {.line = 2, .column = 2}});

    SECTION("terminal format includes location") {
        std::string source = "<c e>\n<g q>";
        auto output = lilychord::format_diagnostic(diag, source);

        CHECK_THAT(output, ContainsSubstring("exercise.ly:2:4"));
        CHECK_THAT(output, ContainsSubstring("error"));
        CHECK_THAT(output, ContainsSubstring("L002"));
        CHECK_THAT(output, ContainsSubstring("unrecognized symbols: q"));
        CHECK_THAT(output, ContainsSubstring("2 | <g q>"));
        CHECK_THAT(output, ContainsSubstring("note: in chord <g q>"));
    }

    SECTION("first line of source") {
        diag.location = {.line = 1, .column = 2, .offset = 1, .length = 1};
        auto output = lilychord::format_diagnostic(diag, "<z>\n<c>");
        CHECK_THAT(output, ContainsSubstring("1 | <z>"));
    }

    SECTION("JSON format") {
        auto json = lilychord::format_diagnostic_json(diag);

        CHECK_THAT(json, ContainsSubstring(R"("severity":"error")"));
        CHECK_THAT(json, ContainsSubstring(R"("code":"L002")"));
        CHECK_THAT(json, ContainsSubstring(R"("line":1)")); // 0-indexed
        CHECK_THAT(json, ContainsSubstring(R"("character":3)")); // 0-indexed
        CHECK_THAT(json, ContainsSubstring(R"("message":"in chord <g q>")"));

        auto parsed = nlohmann::json::parse(json);
        REQUIRE(parsed["related"].size() == 1);
        CHECK(parsed["related"][0]["offset"] == 0);
    }

    SECTION("JSON escapes messages") {
        diag.message = "Pitch [\\xnote] is \"odd\"";
        auto json = lilychord::format_diagnostic_json(diag);
        CHECK_THAT(json, ContainsSubstring(R"(Pitch [\\xnote] is \"odd\")"));
    }
}

TEST_CASE("Diagnostics from the parser format cleanly", "[diagnostics]") {
    const std::string source = "<c e>\n<g q>";
    auto result = lilychord::parse(source);
    REQUIRE(result.diagnostics.size() == 1);

    auto output = lilychord::format_diagnostic(result.diagnostics[0], source);
    CHECK_THAT(output, ContainsSubstring("<notation>:2:4"));
    CHECK_THAT(output, ContainsSubstring("missing or invalid note name"));
}

TEST_CASE("JSON diagnostics with control and non-UTF-8 bytes", "[diagnostics]") {
    lilychord::ParseOptions options;
    options.error_policy = lilychord::ErrorPolicy::Accumulate;

    SECTION("control bytes are escaped") {
        auto result = lilychord::parse("<c\x01 e>\n<c\v\x02q>", options);
        REQUIRE(result.diagnostics.size() == 2);

        for (const auto& diag : result.diagnostics) {
            auto text = lilychord::format_diagnostic_json(diag);
            for (char c : text) {
                CHECK(static_cast<unsigned char>(c) >= 0x20);
            }
            auto parsed = nlohmann::json::parse(text);
            CHECK(parsed["message"].get<std::string>() == diag.message);
            CHECK(parsed["code"].get<std::string>() == diag.code);
        }
    }

    SECTION("invalid UTF-8 is replaced") {
        auto result = lilychord::parse("<c\xE9>", options);
        REQUIRE(result.diagnostics.size() == 1);

        std::string text;
        REQUIRE_NOTHROW(text = lilychord::format_diagnostic_json(result.diagnostics[0]));
        auto parsed = nlohmann::json::parse(text);
        CHECK_THAT(parsed["message"].get<std::string>(),
                   ContainsSubstring("unrecognized symbols: \xEF\xBF\xBD"));
    }
}

TEST_CASE("has_errors helper", "[diagnostics]") {
    SECTION("empty list has no errors") {
        std::vector<lilychord::Diagnostic> diags;
        CHECK_FALSE(lilychord::has_errors(diags));
    }

    SECTION("warnings are not errors") {
        std::vector<lilychord::Diagnostic> diags{
            {.severity = lilychord::Severity::Warning},
            {.severity = lilychord::Severity::Warning}
        };
        CHECK_FALSE(lilychord::has_errors(diags));
    }

    SECTION("detects errors") {
        std::vector<lilychord::Diagnostic> diags{
            {.severity = lilychord::Severity::Warning},
            {.severity = lilychord::Severity::Error}
        };
        CHECK(lilychord::has_errors(diags));
    }
}

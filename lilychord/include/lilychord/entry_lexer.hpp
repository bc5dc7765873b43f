#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "chord_extractor.hpp"
#include "pitch_token.hpp"

namespace lilychord {

/// Splits the text of one chord into whitespace-separated pitch entries
///
/// While scanning, the lexer normalizes the chord:
/// - the hidden-note escape "\xNote" and any whitespace after it collapse
///   to the single hidden symbol 'x', which then prefixes the next entry
/// - every other character is lower-cased
///
/// Example:
///   "F \xNote C' a'"  ->  ["f", "xc'", "a'"]
class EntryLexer {
public:
    /// @param chord The chord to split (its text must remain valid during lexing)
    explicit EntryLexer(const ChordSpan& chord);

    /// Lex all entries of the chord
    /// @return Entries in order; empty for an empty or whitespace-only chord
    [[nodiscard]] std::vector<EntryLexeme> lex_all();

    /// The whole chord after normalization, trimmed (valid after lex_all)
    [[nodiscard]] const std::string& normalized() const { return normalized_; }

private:
    [[nodiscard]] bool is_at_end() const;
    [[nodiscard]] char peek() const;
    [[nodiscard]] bool at_hidden_escape() const;
    char advance();

    [[nodiscard]] static bool is_whitespace(char c);
    [[nodiscard]] static char to_lower(char c);

    void skip_whitespace();
    void consume_hidden_escape();
    EntryLexeme lex_entry();

    [[nodiscard]] SourceLocation current_location(std::uint32_t line, std::uint32_t column) const;

    std::string_view text_;
    SourceLocation base_location_;
    std::string normalized_;

    std::uint32_t start_ = 0;    // Start of current entry
    std::uint32_t current_ = 0;  // Current position
    std::uint32_t line_ = 1;     // Line relative to the chord start (1-based)
    std::uint32_t column_ = 1;   // Column relative to the line start (1-based)
};

/// Convenience function to split a chord into entries
/// @return Pair of entries and the normalized chord text
std::pair<std::vector<EntryLexeme>, std::string> lex_entries(const ChordSpan& chord);

} // namespace lilychord

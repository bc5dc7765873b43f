#pragma once

#include <string_view>
#include <variant>
#include "diagnostics.hpp"
#include "pitch_token.hpp"

namespace lilychord {

/// The chord an entry belongs to, for error messages
struct ChordContext {
    std::string_view normalized;   // Normalized chord text, as shown to authors
    SourceLocation location{};     // Location of the chord in the notation string
    std::string_view filename = "<notation>";
};

/// Result of parsing one entry: the token, or the diagnostic explaining why not
using EntryParseResult = std::variant<PitchEntry, Diagnostic>;

/// Parse one normalized pitch entry
///
/// Grammar: [x] letter (' | , | s | f | digit)*
/// The letter is validated before anything else. Every character after it
/// must be an octave mark, an accidental, or a digit; all offending
/// characters are reported together.
///
/// @param lexeme The entry from EntryLexer
/// @param chord The enclosing chord
/// @return PitchEntry on success, Diagnostic (L001, L002 or L003) otherwise
[[nodiscard]] EntryParseResult parse_entry(const EntryLexeme& lexeme, const ChordContext& chord);

} // namespace lilychord

#pragma once

#include <string_view>
#include <vector>
#include "diagnostics.hpp"

namespace lilychord {

/// Text between one pair of chord delimiters
struct ChordSpan {
    std::string_view text;      // View into the notation string, without < and >
    SourceLocation location{};  // Location of the chord text (first character after <)
};

inline constexpr char CHORD_OPEN = '<';
inline constexpr char CHORD_CLOSE = '>';

/// Split a notation string into its bracketed chords
///
/// Each chord is the text between a '<' and the next '>'. Delimiters do not
/// nest. Text outside brackets (durations, bar lines) is discarded, as are
/// empty pairs "<>" and a trailing '<' that is never closed.
///
/// Example:
///   "<e c' g' bf'>1 <f \xNote c' a'>1"  ->  ["e c' g' bf'", "f \xNote c' a'"]
///
/// @param notation The notation string (must outlive the returned views)
/// @return Chords in order of appearance
[[nodiscard]] std::vector<ChordSpan> extract_chords(std::string_view notation);

} // namespace lilychord

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "diagnostics.hpp"

namespace lilychord {

/// The seven diatonic note names, in scale order starting from C
enum class NoteLetter : std::uint8_t {
    C, D, E, F, G, A, B,
};

/// Character classes that may follow the note letter of a pitch entry
enum class Symbol : std::uint8_t {
    Raise,      // '  (one octave up)
    Lower,      // ,  (one octave down)
    Sharp,      // s
    Flat,       // f
    Digit,      // 0-9 (explicit octave)
    Unknown,
};

/// Marker that flags a pitch entry as hidden, after normalization
inline constexpr char HIDDEN_NOTE_SYMBOL = 'x';

/// Escape sequence authors write for hidden notes
inline constexpr std::string_view HIDDEN_NOTE_ESCAPE = "\\xNote";

/// Convert note letter to string for debugging
constexpr std::string_view note_letter_name(NoteLetter letter) {
    switch (letter) {
        case NoteLetter::C: return "c";
        case NoteLetter::D: return "d";
        case NoteLetter::E: return "e";
        case NoteLetter::F: return "f";
        case NoteLetter::G: return "g";
        case NoteLetter::A: return "a";
        case NoteLetter::B: return "b";
    }
    return "?";
}

/// Convert symbol class to string for debugging
constexpr std::string_view symbol_name(Symbol symbol) {
    switch (symbol) {
        case Symbol::Raise:   return "Raise";
        case Symbol::Lower:   return "Lower";
        case Symbol::Sharp:   return "Sharp";
        case Symbol::Flat:    return "Flat";
        case Symbol::Digit:   return "Digit";
        case Symbol::Unknown: return "Unknown";
    }
    return "Unknown";
}

/// Map a lower-case character to a note letter
constexpr std::optional<NoteLetter> note_letter_from_char(char c) {
    switch (c) {
        case 'c': return NoteLetter::C;
        case 'd': return NoteLetter::D;
        case 'e': return NoteLetter::E;
        case 'f': return NoteLetter::F;
        case 'g': return NoteLetter::G;
        case 'a': return NoteLetter::A;
        case 'b': return NoteLetter::B;
        default:  return std::nullopt;
    }
}

/// Classify a character following the note letter
constexpr Symbol classify_symbol(char c) {
    switch (c) {
        case '\'': return Symbol::Raise;
        case ',':  return Symbol::Lower;
        case 's':  return Symbol::Sharp;
        case 'f':  return Symbol::Flat;
        case '0': case '1': case '2': case '3': case '4':
        case '5': case '6': case '7': case '8': case '9':
            return Symbol::Digit;
        default:   return Symbol::Unknown;
    }
}

/// One octave-placing mark of a pitch entry
struct OctaveMark {
    enum class Kind : std::uint8_t { Raise, Lower, Digit };
    Kind kind = Kind::Raise;
    std::uint8_t digit = 0;    // Only meaningful for Kind::Digit

    bool operator==(const OctaveMark&) const = default;
};

/// One accidental of a pitch entry
enum class Accidental : std::uint8_t {
    Sharp,
    Flat,
};

/// A whitespace-delimited pitch entry, after normalization
struct EntryLexeme {
    std::string text;            // Normalized text: lower-case, hidden escape collapsed
    SourceLocation location{};   // Span of the raw entry in the notation string
};

/// A parsed pitch entry
struct PitchEntry {
    bool hidden = false;
    NoteLetter letter = NoteLetter::C;
    std::vector<OctaveMark> octave_marks;
    std::vector<Accidental> accidentals;

    /// Sum of accidentals in semitones (each sharp +1, each flat -1)
    [[nodiscard]] int accidental_offset() const {
        int offset = 0;
        for (auto acc : accidentals) {
            offset += (acc == Accidental::Sharp) ? 1 : -1;
        }
        return offset;
    }

    /// Whether any octave mark (relative or explicit) is present
    [[nodiscard]] bool has_octave_marks() const { return !octave_marks.empty(); }
};

} // namespace lilychord

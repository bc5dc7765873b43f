#pragma once

#include <array>
#include <cstdint>
#include "pitch_token.hpp"

namespace lilychord {

/// Octave used when an entry carries no octave information (c4 = 48)
inline constexpr int DEFAULT_OCTAVE = 4;

inline constexpr int SEMITONES_PER_OCTAVE = 12;
inline constexpr int LETTERS_PER_OCTAVE = 7;

/// Semitones above C for each note letter (diatonic, no default accidental)
inline constexpr std::array<int, LETTERS_PER_OCTAVE> PITCH_CLASSES = {
    0,   // c
    2,   // d
    4,   // e
    5,   // f
    7,   // g
    9,   // a
    11,  // b
};

/// Semitones above C for a note letter
constexpr int pitch_class(NoteLetter letter) {
    return PITCH_CLASSES[static_cast<std::size_t>(letter)];
}

/// Scale-step index of a note letter (c=0 ... b=6)
constexpr int letter_index(NoteLetter letter) {
    return static_cast<int>(letter);
}

/// Pitch number for a letter in an absolute octave
/// pitch = octave * 12 + pitch_class + accidental. Not clamped to the MIDI range.
constexpr int pitch_number(NoteLetter letter, int octave, int accidental) {
    return octave * SEMITONES_PER_OCTAVE + pitch_class(letter) + accidental;
}

/// Octave containing a pitch number (floor division, so -1 is octave -1)
constexpr int octave_of(int pitch) {
    return (pitch >= 0) ? pitch / SEMITONES_PER_OCTAVE
                        : -((-pitch + SEMITONES_PER_OCTAVE - 1) / SEMITONES_PER_OCTAVE);
}

/// Semitone within its octave (0-11)
constexpr int semitone_of(int pitch) {
    return pitch - octave_of(pitch) * SEMITONES_PER_OCTAVE;
}

} // namespace lilychord

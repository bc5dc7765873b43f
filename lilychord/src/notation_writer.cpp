#include "lilychord/notation_writer.hpp"
#include "lilychord/chord_extractor.hpp"
#include "lilychord/music_theory.hpp"
#include "lilychord/pitch_token.hpp"
#include <array>

namespace lilychord {

namespace {

// Sharp spelling of each semitone above C
constexpr std::array<std::string_view, SEMITONES_PER_OCTAVE> SHARP_SPELLINGS = {
    "c", "cs", "d", "ds", "e", "f", "fs", "g", "gs", "a", "as", "b",
};

constexpr int MIN_DIGIT_OCTAVE = 0;
constexpr int MAX_DIGIT_OCTAVE = 9;

} // namespace

std::string pitch_to_notation(int pitch) {
    const int octave = octave_of(pitch);
    std::string out(SHARP_SPELLINGS[static_cast<std::size_t>(semitone_of(pitch))]);

    if (octave < MIN_DIGIT_OCTAVE) {
        out += static_cast<char>('0' + MIN_DIGIT_OCTAVE);
        out.append(static_cast<std::size_t>(MIN_DIGIT_OCTAVE - octave), ',');
    } else if (octave > MAX_DIGIT_OCTAVE) {
        out += static_cast<char>('0' + MAX_DIGIT_OCTAVE);
        out.append(static_cast<std::size_t>(octave - MAX_DIGIT_OCTAVE), '\'');
    } else {
        out += static_cast<char>('0' + octave);
    }

    return out;
}

std::string chord_to_notation(const MidiChord& chord) {
    std::string out;
    out += CHORD_OPEN;

    if (chord.visible.empty() && chord.hidden.empty()) {
        // "<>" would not be read back as a chord
        out += ' ';
        out += CHORD_CLOSE;
        return out;
    }

    bool first = true;
    for (int pitch : chord.visible) {
        if (!first) out += ' ';
        out += pitch_to_notation(pitch);
        first = false;
    }
    for (int pitch : chord.hidden) {
        if (!first) out += ' ';
        out += HIDDEN_NOTE_ESCAPE;
        out += ' ';
        out += pitch_to_notation(pitch);
        first = false;
    }

    out += CHORD_CLOSE;
    return out;
}

std::string to_notation(const std::vector<MidiChord>& chords) {
    std::string out;
    for (std::size_t i = 0; i < chords.size(); ++i) {
        if (i > 0) out += ' ';
        out += chord_to_notation(chords[i]);
    }
    return out;
}

} // namespace lilychord

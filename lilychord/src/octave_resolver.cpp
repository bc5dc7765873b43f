#include "lilychord/octave_resolver.hpp"

namespace lilychord {

int nearest_octave(NoteLetter letter, const OctaveContext& context) {
    if (!context.previous) {
        return context.octave;
    }

    // Steps from the reference letter to this letter within the same octave
    const int steps = letter_index(letter) - letter_index(*context.previous);
    if (steps >= RELATIVE_STEP_LIMIT) {
        return context.octave - 1;
    }
    if (steps <= -RELATIVE_STEP_LIMIT) {
        return context.octave + 1;
    }
    return context.octave;
}

int resolve_octave(const PitchEntry& entry, const OctaveContext& context, OctaveMode mode) {
    int base = DEFAULT_OCTAVE;
    switch (mode) {
        case OctaveMode::Absolute:
            base = DEFAULT_OCTAVE;
            break;
        case OctaveMode::Relative:
            base = nearest_octave(entry.letter, context);
            break;
    }

    int octave_change = 0;
    for (const auto& mark : entry.octave_marks) {
        switch (mark.kind) {
            case OctaveMark::Kind::Raise:
                ++octave_change;
                break;
            case OctaveMark::Kind::Lower:
                --octave_change;
                break;
            case OctaveMark::Kind::Digit:
                base = mark.digit;
                octave_change = 0;
                break;
        }
    }

    return base + octave_change;
}

OctaveContext advance_context(const PitchEntry& entry, int octave) {
    return OctaveContext{.octave = octave, .previous = entry.letter};
}

} // namespace lilychord

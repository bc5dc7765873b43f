#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include "music_theory.hpp"
#include "pitch_token.hpp"

namespace lilychord {

/// How an entry without explicit octave digits finds its octave
enum class OctaveMode : std::uint8_t {
    /// Every entry starts from octave 4; ' and , move it from there
    Absolute,
    /// Every entry starts from the octave that puts it within a fifth of the
    /// reference note (LilyPond \relative); ' and , move it from there
    Relative,
};

constexpr std::string_view octave_mode_name(OctaveMode mode) {
    switch (mode) {
        case OctaveMode::Absolute: return "absolute";
        case OctaveMode::Relative: return "relative";
    }
    return "unknown";
}

/// Octave state carried from one entry to the next within a single parse
///
/// This is a plain value: the parse loop threads it through the entries and
/// never shares it between calls.
struct OctaveContext {
    int octave = DEFAULT_OCTAVE;
    std::optional<NoteLetter> previous;    // Reference letter, none before the first note

    bool operator==(const OctaveContext&) const = default;
};

/// Scale steps that trigger an octave jump in relative mode.
/// An interval of a sixth or wider is written in the other direction.
inline constexpr int RELATIVE_STEP_LIMIT = 5;

/// Octave that keeps `letter` within a fifth of the reference note
/// @return context.octave, or one octave above/below it
[[nodiscard]] int nearest_octave(NoteLetter letter, const OctaveContext& context);

/// Resolve the absolute octave of a pitch entry
///
/// The base octave comes from the mode (4, or the nearest octave to the
/// reference). Each ' adds one and each , subtracts one. A digit replaces the
/// base and discards marks seen before it in the same entry; marks after the
/// digit still apply.
[[nodiscard]] int resolve_octave(const PitchEntry& entry, const OctaveContext& context,
                                 OctaveMode mode);

/// Context for the entry that follows `entry` placed in `octave`
[[nodiscard]] OctaveContext advance_context(const PitchEntry& entry, int octave);

} // namespace lilychord

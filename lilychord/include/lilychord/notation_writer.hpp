#pragma once

#include <string>
#include <vector>
#include "lilychord.hpp"

namespace lilychord {

/// Spell a single pitch number as a notation entry (sharps, explicit octave)
/// Examples: 48 -> "c4", 61 -> "cs5", 131 -> "b9'" , -1 -> "b0,"
[[nodiscard]] std::string pitch_to_notation(int pitch);

/// Write one chord as "<visible... \xNote hidden...>"
[[nodiscard]] std::string chord_to_notation(const MidiChord& chord);

/// Write chords as notation that parses back to the same pitch numbers
///
/// Every entry carries an explicit octave digit, so the output reads the
/// same in absolute and relative octave mode. Visible entries precede hidden
/// ones within each chord.
[[nodiscard]] std::string to_notation(const std::vector<MidiChord>& chords);

} // namespace lilychord

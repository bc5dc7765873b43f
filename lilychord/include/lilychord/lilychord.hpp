#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "diagnostics.hpp"
#include "octave_resolver.hpp"

namespace lilychord {

/// Lilychord version information
struct Version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    static constexpr std::string_view string() { return "0.1.0"; }
};

/// What happens to the rest of the notation after an entry error
enum class ErrorPolicy : std::uint8_t {
    /// Stop at the first bad entry; the result carries no chords
    FailFast,
    /// Drop the chord holding the bad entry and keep parsing later chords
    Accumulate,
};

constexpr std::string_view error_policy_name(ErrorPolicy policy) {
    switch (policy) {
        case ErrorPolicy::FailFast:   return "fail-fast";
        case ErrorPolicy::Accumulate: return "accumulate";
    }
    return "unknown";
}

/// Parse configuration
struct ParseOptions {
    OctaveMode octave_mode = OctaveMode::Absolute;
    ErrorPolicy error_policy = ErrorPolicy::FailFast;
    std::string filename = "<notation>";    // Name used in diagnostics
};

/// Pitch numbers of one chord, split by visibility, in entry order
struct MidiChord {
    std::vector<int> visible;
    std::vector<int> hidden;

    bool operator==(const MidiChord&) const = default;
};

/// Result of parsing a notation string
struct ParseResult {
    bool is_valid = true;
    std::vector<MidiChord> chords;
    std::vector<Diagnostic> diagnostics;

    /// Messages of all error diagnostics, in the order they were reported
    [[nodiscard]] std::vector<std::string> errors() const;
};

/// Parse a notation string into chords of pitch numbers
///
/// Malformed notation never throws: the result is marked invalid and carries
/// one diagnostic per offending entry.
///
/// @param notation Notation such as "<e c' g' bf'>1 <f \xNote c' a'>1"
/// @param options Octave mode, error policy and diagnostic filename
/// @return Chords, diagnostics and validity
ParseResult parse(std::string_view notation, const ParseOptions& options = {});

/// Parse a C string
/// @throws std::invalid_argument if notation is null
ParseResult parse(const char* notation, const ParseOptions& options = {});

/// Parse the contents of a file
/// @param path Path to a file holding notation
/// @param options Parse options; the filename defaults to `path`
/// @return Parse result, or an invalid result with an L000 diagnostic if the file cannot be read
ParseResult parse_file(const std::string& path, ParseOptions options = {});

} // namespace lilychord

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lilychord {

/// Location of a span inside a notation string
struct SourceLocation {
    std::uint32_t line = 1;      // 1-based line number
    std::uint32_t column = 1;    // 1-based column number
    std::uint32_t offset = 0;    // 0-based byte offset
    std::uint32_t length = 0;    // Length of the span
};

/// Diagnostic severity levels
enum class Severity {
    Error,      // Notation is invalid
    Warning,    // Suspicious input, result still valid
};

/// Diagnostic codes reported by the engine
namespace codes {
inline constexpr std::string_view FileNotFound       = "L000";
inline constexpr std::string_view InvalidNoteName    = "L001";
inline constexpr std::string_view UnrecognizedSymbol = "L002";
inline constexpr std::string_view EngineInternal     = "L003";
inline constexpr std::string_view EmptyChord         = "L004";
inline constexpr std::string_view InvalidExercise    = "L005";
} // namespace codes

/// A single diagnostic message
struct Diagnostic {
    Severity severity = Severity::Error;
    std::string code;           // Diagnostic code (e.g., "L001")
    std::string message;        // Human-readable message
    std::string filename;       // Name of the notation source
    SourceLocation location;    // Location of the offending entry

    /// Related information (e.g., the chord an entry belongs to)
    struct Related {
        std::string message;
        SourceLocation location;
    };
    std::vector<Related> related;
};

/// Format a diagnostic for terminal output
std::string format_diagnostic(const Diagnostic& diag, std::string_view source);

/// Format a diagnostic as JSON (for editors and tooling)
std::string format_diagnostic_json(const Diagnostic& diag);

/// Check if any diagnostic is an error
bool has_errors(const std::vector<Diagnostic>& diagnostics);

} // namespace lilychord

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "diagnostics.hpp"
#include "lilychord.hpp"

namespace lilychord {

/// Field names of an exercise record
namespace exercise_keys {
inline constexpr const char* Type = "type";
inline constexpr const char* Notation = "lilypond_chords";
inline constexpr const char* Chord = "chord";
} // namespace exercise_keys

/// Exercise type assigned when a record names none
inline constexpr const char* DEFAULT_EXERCISE_TYPE = "matching";

/// An exercise record after its notation has been translated to pitches
///
/// Processing fills in defaults and, when the record carries notation,
/// stores the parsed chords under "chord" as
///   [{"visible": [...], "hidden": [...]}, ...]
/// A record whose notation is invalid keeps its errors and must not be saved.
class ExerciseDefinition {
public:
    /// Process a record (a JSON object)
    explicit ExerciseDefinition(nlohmann::json data, const ParseOptions& options = {});

    /// Process a record given as JSON text
    static ExerciseDefinition from_json(std::string_view text, const ParseOptions& options = {});

    [[nodiscard]] bool is_valid() const { return !has_errors(diagnostics_); }
    [[nodiscard]] const nlohmann::json& data() const { return data_; }
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }

    /// Error messages, in the order they were reported
    [[nodiscard]] std::vector<std::string> errors() const;

    /// The processed record as indented JSON with sorted keys
    [[nodiscard]] std::string to_json() const;

private:
    ExerciseDefinition() = default;

    void process(const ParseOptions& options);
    void add_error(std::string message);

    nlohmann::json data_ = nlohmann::json::object();
    std::vector<Diagnostic> diagnostics_;
};

/// Convert parsed chords to their JSON form
[[nodiscard]] nlohmann::json chords_to_json(const std::vector<MidiChord>& chords);

/// A parse result as {"is_valid": ..., "chords": [...], "errors": [...]}
[[nodiscard]] nlohmann::json result_to_json(const ParseResult& result);

/// Serialize JSON text; bytes that are not valid UTF-8 become U+FFFD
/// @param indent -1 for a single line
[[nodiscard]] std::string dump_json(const nlohmann::json& value, int indent = -1);

/// Where processed exercises are persisted; implemented by the host application
class ExerciseStore {
public:
    virtual ~ExerciseStore() = default;

    /// Persist a processed record
    /// @return false if the record could not be stored
    virtual bool save(const nlohmann::json& record) = 0;
};

/// Process a record and hand it to the store if it is valid
///
/// Invalid records never reach the store.
/// @return {"status": "success"|"error", "message": ..., "data"|"errors": ...}
nlohmann::json submit_exercise(ExerciseStore& store, nlohmann::json record,
                               const ParseOptions& options = {});

} // namespace lilychord

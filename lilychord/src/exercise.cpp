#include "lilychord/exercise.hpp"

namespace lilychord {

ExerciseDefinition::ExerciseDefinition(nlohmann::json data, const ParseOptions& options)
    : data_(std::move(data))
{
    process(options);
}

ExerciseDefinition ExerciseDefinition::from_json(std::string_view text, const ParseOptions& options) {
    auto data = nlohmann::json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
    if (data.is_discarded()) {
        ExerciseDefinition def;
        def.add_error("Exercise definition is not valid JSON");
        return def;
    }
    return ExerciseDefinition(std::move(data), options);
}

void ExerciseDefinition::add_error(std::string message) {
    diagnostics_.push_back(Diagnostic{
        .severity = Severity::Error,
        .code = std::string(codes::InvalidExercise),
        .message = std::move(message),
        .filename = "<exercise>",
        .location = {}
    });
}

void ExerciseDefinition::process(const ParseOptions& options) {
    if (!data_.is_object()) {
        add_error("Exercise definition must be a JSON object");
        return;
    }

    if (!data_.contains(exercise_keys::Type)) {
        data_[exercise_keys::Type] = DEFAULT_EXERCISE_TYPE;
    }

    if (!data_.contains(exercise_keys::Notation)) {
        return;
    }

    const auto& notation = data_[exercise_keys::Notation];
    if (!notation.is_string()) {
        add_error(std::string("Field \"") + exercise_keys::Notation + "\" must be a string");
        return;
    }

    auto result = parse(notation.get<std::string>(), options);
    diagnostics_.insert(diagnostics_.end(),
                        result.diagnostics.begin(), result.diagnostics.end());
    if (result.is_valid) {
        data_[exercise_keys::Chord] = chords_to_json(result.chords);
    }
}

std::vector<std::string> ExerciseDefinition::errors() const {
    std::vector<std::string> messages;
    for (const auto& diag : diagnostics_) {
        if (diag.severity == Severity::Error) {
            messages.push_back(diag.message);
        }
    }
    return messages;
}

std::string ExerciseDefinition::to_json() const {
    return dump_json(data_, 4);
}

nlohmann::json chords_to_json(const std::vector<MidiChord>& chords) {
    auto out = nlohmann::json::array();
    for (const auto& chord : chords) {
        auto entry = nlohmann::json::object();
        entry["visible"] = chord.visible;
        entry["hidden"] = chord.hidden;
        out.push_back(std::move(entry));
    }
    return out;
}

nlohmann::json result_to_json(const ParseResult& result) {
    return {
        {"is_valid", result.is_valid},
        {"chords", chords_to_json(result.chords)},
        {"errors", result.errors()}
    };
}

std::string dump_json(const nlohmann::json& value, int indent) {
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json submit_exercise(ExerciseStore& store, nlohmann::json record,
                               const ParseOptions& options) {
    ExerciseDefinition def(std::move(record), options);

    if (def.is_valid() && store.save(def.data())) {
        return {
            {"status", "success"},
            {"message", "Exercise created successfully!"},
            {"data", {{"exercise", def.data()}}}
        };
    }

    auto errors = def.errors();
    if (def.is_valid()) {
        errors.emplace_back("Exercise could not be stored");
    }
    return {
        {"status", "error"},
        {"message", "Exercise failed to save."},
        {"errors", errors}
    };
}

} // namespace lilychord

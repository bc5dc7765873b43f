#include "lilychord/lilychord.hpp"
#include "lilychord/chord_extractor.hpp"
#include "lilychord/entry_lexer.hpp"
#include "lilychord/entry_parser.hpp"
#include "lilychord/music_theory.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <variant>

namespace lilychord {

namespace {

/// Outcome of a chord whose entries all parsed
struct ResolvedChord {
    MidiChord chord;
    OctaveContext next_reference;   // Reference for the first entry of the next chord
};

/// Parse and resolve every entry of one chord
///
/// The octave context is folded through the entries; within the chord each
/// entry is placed relative to the one before it, and the chord's first
/// entry becomes the reference for the next chord.
std::variant<ResolvedChord, Diagnostic>
resolve_chord(const std::vector<EntryLexeme>& entries, const ChordContext& chord,
              const OctaveContext& reference, OctaveMode mode) {
    ResolvedChord resolved{.chord = {}, .next_reference = reference};
    OctaveContext context = reference;

    for (std::size_t i = 0; i < entries.size(); ++i) {
        auto parsed = parse_entry(entries[i], chord);
        if (auto* diag = std::get_if<Diagnostic>(&parsed)) {
            return std::move(*diag);
        }
        const auto& entry = std::get<PitchEntry>(parsed);

        const int octave = resolve_octave(entry, context, mode);
        const int pitch = pitch_number(entry.letter, octave, entry.accidental_offset());

        auto& target = entry.hidden ? resolved.chord.hidden : resolved.chord.visible;
        target.push_back(pitch);

        context = advance_context(entry, octave);
        if (i == 0) {
            resolved.next_reference = context;
        }
    }

    return resolved;
}

Diagnostic make_empty_chord_warning(const ChordSpan& span, std::string_view filename) {
    return Diagnostic{
        .severity = Severity::Warning,
        .code = std::string(codes::EmptyChord),
        .message = "Chord contains no pitch entries",
        .filename = std::string(filename),
        .location = span.location
    };
}

} // namespace

std::vector<std::string> ParseResult::errors() const {
    std::vector<std::string> messages;
    for (const auto& diag : diagnostics) {
        if (diag.severity == Severity::Error) {
            messages.push_back(diag.message);
        }
    }
    return messages;
}

ParseResult parse(std::string_view notation, const ParseOptions& options) {
    ParseResult result;
    OctaveContext reference{};

    for (const auto& span : extract_chords(notation)) {
        auto [entries, normalized] = lex_entries(span);

        if (entries.empty()) {
            result.diagnostics.push_back(make_empty_chord_warning(span, options.filename));
            result.chords.emplace_back();
            continue;
        }

        const ChordContext chord{
            .normalized = normalized,
            .location = span.location,
            .filename = options.filename
        };

        auto outcome = resolve_chord(entries, chord, reference, options.octave_mode);
        if (auto* diag = std::get_if<Diagnostic>(&outcome)) {
            result.diagnostics.push_back(std::move(*diag));
            if (options.error_policy == ErrorPolicy::FailFast) {
                result.chords.clear();
                result.is_valid = false;
                return result;
            }
            continue;
        }

        auto& resolved = std::get<ResolvedChord>(outcome);
        result.chords.push_back(std::move(resolved.chord));
        reference = resolved.next_reference;
    }

    result.is_valid = !has_errors(result.diagnostics);
    return result;
}

ParseResult parse(const char* notation, const ParseOptions& options) {
    if (notation == nullptr) {
        throw std::invalid_argument("lilychord::parse: notation must not be null");
    }
    return parse(std::string_view(notation), options);
}

ParseResult parse_file(const std::string& path, ParseOptions options) {
    if (options.filename == ParseOptions{}.filename) {
        options.filename = path;
    }

    std::ifstream file(path);
    if (!file) {
        ParseResult result;
        result.diagnostics.push_back(Diagnostic{
            .severity = Severity::Error,
            .code = std::string(codes::FileNotFound),
            .message = "Could not open file: " + path,
            .filename = path,
            .location = {}
        });
        result.is_valid = false;
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), options);
}

} // namespace lilychord

#include "lilychord/entry_parser.hpp"
#include <string>

namespace lilychord {

namespace {

Diagnostic make_entry_error(std::string_view code, std::string message,
                            const EntryLexeme& lexeme, const ChordContext& chord) {
    Diagnostic diag{
        .severity = Severity::Error,
        .code = std::string(code),
        .message = std::move(message),
        .filename = std::string(chord.filename),
        .location = lexeme.location
    };
    diag.related.push_back(Diagnostic::Related{
        .message = "in chord <" + std::string(chord.normalized) + ">",
        .location = chord.location
    });
    return diag;
}

} // namespace

EntryParseResult parse_entry(const EntryLexeme& lexeme, const ChordContext& chord) {
    std::string_view text = lexeme.text;

    if (text.empty()) {
        // The lexer never yields empty entries
        return make_entry_error(codes::EngineInternal,
            "Internal error: empty pitch entry in chord [" + std::string(chord.normalized) + "]",
            lexeme, chord);
    }

    PitchEntry entry;
    std::size_t pos = 0;

    if (text[pos] == HIDDEN_NOTE_SYMBOL) {
        entry.hidden = true;
        ++pos;
    }

    std::optional<NoteLetter> letter;
    if (pos < text.size()) {
        letter = note_letter_from_char(text[pos]);
    }
    if (!letter) {
        return make_entry_error(codes::InvalidNoteName,
            "Pitch [" + lexeme.text + "] in chord [" + std::string(chord.normalized) +
            "] is invalid: missing or invalid note name",
            lexeme, chord);
    }
    entry.letter = *letter;
    ++pos;

    std::string residue;
    for (; pos < text.size(); ++pos) {
        const char c = text[pos];
        switch (classify_symbol(c)) {
            case Symbol::Raise:
                entry.octave_marks.push_back({OctaveMark::Kind::Raise, 0});
                break;
            case Symbol::Lower:
                entry.octave_marks.push_back({OctaveMark::Kind::Lower, 0});
                break;
            case Symbol::Digit:
                entry.octave_marks.push_back(
                    {OctaveMark::Kind::Digit, static_cast<std::uint8_t>(c - '0')});
                break;
            case Symbol::Sharp:
                entry.accidentals.push_back(Accidental::Sharp);
                break;
            case Symbol::Flat:
                entry.accidentals.push_back(Accidental::Flat);
                break;
            case Symbol::Unknown:
                residue.push_back(c);
                break;
        }
    }

    if (!residue.empty()) {
        return make_entry_error(codes::UnrecognizedSymbol,
            "Pitch entry [" + lexeme.text + "] in chord [" + std::string(chord.normalized) +
            "] contains unrecognized symbols: " + residue,
            lexeme, chord);
    }

    return entry;
}

} // namespace lilychord

#include "lilychord/entry_lexer.hpp"

namespace lilychord {

EntryLexer::EntryLexer(const ChordSpan& chord)
    : text_(chord.text)
    , base_location_(chord.location)
{}

std::vector<EntryLexeme> EntryLexer::lex_all() {
    std::vector<EntryLexeme> entries;
    normalized_.clear();
    normalized_.reserve(text_.size());

    while (true) {
        skip_whitespace();
        if (is_at_end()) {
            break;
        }
        entries.push_back(lex_entry());
    }

    // Trim whitespace kept between entries
    auto last = normalized_.find_last_not_of(" \t\r\n");
    normalized_.erase(last == std::string::npos ? 0 : last + 1);
    auto first = normalized_.find_first_not_of(" \t\r\n");
    normalized_.erase(0, first == std::string::npos ? normalized_.size() : first);

    return entries;
}

bool EntryLexer::is_at_end() const {
    return current_ >= text_.size();
}

char EntryLexer::peek() const {
    if (is_at_end()) return '\0';
    return text_[current_];
}

bool EntryLexer::at_hidden_escape() const {
    return text_.substr(current_).starts_with(HIDDEN_NOTE_ESCAPE);
}

char EntryLexer::advance() {
    char c = text_[current_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

bool EntryLexer::is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

char EntryLexer::to_lower(char c) {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c - 'A' + 'a');
    }
    return c;
}

void EntryLexer::skip_whitespace() {
    while (!is_at_end() && is_whitespace(peek())) {
        normalized_.push_back(advance());
    }
}

void EntryLexer::consume_hidden_escape() {
    for (std::size_t i = 0; i < HIDDEN_NOTE_ESCAPE.size(); ++i) {
        advance();
    }
    // The escape swallows the whitespace that separates it from its note
    while (!is_at_end() && is_whitespace(peek())) {
        advance();
    }
    normalized_.push_back(HIDDEN_NOTE_SYMBOL);
}

EntryLexeme EntryLexer::lex_entry() {
    start_ = current_;
    const std::uint32_t start_line = line_;
    const std::uint32_t start_column = column_;

    std::string text;
    std::uint32_t end = current_;

    while (!is_at_end()) {
        if (at_hidden_escape()) {
            consume_hidden_escape();
            text.push_back(HIDDEN_NOTE_SYMBOL);
            end = current_;
            continue;
        }
        if (is_whitespace(peek())) {
            break;
        }
        char c = to_lower(advance());
        text.push_back(c);
        normalized_.push_back(c);
        end = current_;
    }

    SourceLocation location = current_location(start_line, start_column);
    location.length = end - start_;
    return EntryLexeme{std::move(text), location};
}

SourceLocation EntryLexer::current_location(std::uint32_t line, std::uint32_t column) const {
    return {
        .line = base_location_.line + line - 1,
        .column = (line == 1) ? base_location_.column + column - 1 : column,
        .offset = base_location_.offset + start_,
        .length = 0
    };
}

std::pair<std::vector<EntryLexeme>, std::string> lex_entries(const ChordSpan& chord) {
    EntryLexer lexer(chord);
    auto entries = lexer.lex_all();
    return {std::move(entries), lexer.normalized()};
}

} // namespace lilychord

#include "lilychord/diagnostics.hpp"
#include <algorithm>
#include <sstream>
#include <nlohmann/json.hpp>

namespace lilychord {

namespace {

std::string_view severity_string(Severity s) {
    switch (s) {
        case Severity::Error:   return "error";
        case Severity::Warning: return "warning";
    }
    return "unknown";
}

std::string_view severity_color(Severity s) {
    switch (s) {
        case Severity::Error:   return "\033[1;31m"; // Bold red
        case Severity::Warning: return "\033[1;33m"; // Bold yellow
    }
    return "";
}

constexpr std::string_view RESET = "\033[0m";
constexpr std::string_view BOLD = "\033[1m";

// Get the line from source at the given line number (1-based)
std::string_view get_line(std::string_view source, std::uint32_t line_num) {
    std::uint32_t current_line = 1;
    std::size_t line_start = 0;

    for (std::size_t i = 0; i < source.size() && current_line < line_num; ++i) {
        if (source[i] == '\n') {
            ++current_line;
            line_start = i + 1;
        }
    }

    if (current_line != line_num) {
        return {};
    }

    auto line_end = source.find('\n', line_start);
    if (line_end == std::string_view::npos) {
        line_end = source.size();
    }

    return source.substr(line_start, line_end - line_start);
}

void write_caret(std::ostringstream& out, Severity severity, const SourceLocation& loc) {
    out << "      | ";
    for (std::uint32_t i = 1; i < loc.column; ++i) {
        out << ' ';
    }
    out << severity_color(severity) << "^";
    for (std::uint32_t i = 1; i < loc.length && i < 80; ++i) {
        out << "~";
    }
    out << RESET << "\n";
}

} // namespace

std::string format_diagnostic(const Diagnostic& diag, std::string_view source) {
    std::ostringstream out;

    // Header: filename:line:column: severity[code]: message
    out << BOLD << diag.filename << ":"
        << diag.location.line << ":"
        << diag.location.column << ": " << RESET;

    out << severity_color(diag.severity) << severity_string(diag.severity);
    if (!diag.code.empty()) {
        out << "[" << diag.code << "]";
    }
    out << RESET << ": " << BOLD << diag.message << RESET << "\n";

    if (!source.empty() && diag.location.line > 0) {
        auto line = get_line(source, diag.location.line);
        if (!line.empty()) {
            out << "    " << diag.location.line << " | " << line << "\n";
            write_caret(out, diag.severity, diag.location);
        }
    }

    for (const auto& rel : diag.related) {
        out << BOLD << diag.filename << ":"
            << rel.location.line << ":"
            << rel.location.column << ": " << RESET
            << "note: " << rel.message << "\n";
    }

    return out.str();
}

std::string format_diagnostic_json(const Diagnostic& diag) {
    const auto& loc = diag.location;
    nlohmann::json out{
        {"severity", std::string(severity_string(diag.severity))},
        {"code", diag.code},
        {"message", diag.message},
        {"file", diag.filename},
        {"range", {
            {"start", {{"line", loc.line - 1}, {"character", loc.column - 1}}},
            {"end", {{"line", loc.line - 1}, {"character", loc.column - 1 + loc.length}}}
        }}
    };

    if (!diag.related.empty()) {
        auto related = nlohmann::json::array();
        for (const auto& rel : diag.related) {
            related.push_back(nlohmann::json{
                {"message", rel.message},
                {"offset", rel.location.offset},
                {"length", rel.location.length}
            });
        }
        out["related"] = std::move(related);
    }

    // Notation bytes are copied into messages as-is and need not be UTF-8
    return out.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool has_errors(const std::vector<Diagnostic>& diagnostics) {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
        [](const Diagnostic& d) { return d.severity == Severity::Error; });
}

} // namespace lilychord

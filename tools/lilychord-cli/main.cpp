#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include "lilychord/exercise.hpp"
#include "lilychord/lilychord.hpp"
#include "lilychord/notation_writer.hpp"

namespace {

void print_usage(const char* program) {
    std::cout << "Lilychord v" << lilychord::Version::string() << "\n\n"
              << "Usage: " << program << " [options] <notation-file>\n"
              << "       " << program << " [options] -e <notation>\n\n"
              << "Options:\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n"
              << "  -e, --eval <text>    Parse notation given on the command line\n"
              << "  --relative           Place unmarked notes within a fifth of the previous note\n"
              << "  --accumulate         Keep parsing later chords after an error\n"
              << "  --exercise           Input is an exercise record (JSON)\n"
              << "  --json               Output diagnostics and results as JSON\n"
              << std::endl;
}

void print_version() {
    std::cout << "lilychord " << lilychord::Version::string() << std::endl;
}

void print_list(std::ostream& out, const std::vector<int>& pitches) {
    out << "[";
    for (std::size_t i = 0; i < pitches.size(); ++i) {
        if (i > 0) out << ", ";
        out << pitches[i];
    }
    out << "]";
}

void print_chords(const lilychord::ParseResult& result) {
    for (std::size_t i = 0; i < result.chords.size(); ++i) {
        const auto& chord = result.chords[i];
        std::cout << "chord " << (i + 1) << ": visible ";
        print_list(std::cout, chord.visible);
        std::cout << " hidden ";
        print_list(std::cout, chord.hidden);
        std::cout << "  " << lilychord::chord_to_notation(chord) << "\n";
    }
}

void print_diagnostics(const std::vector<lilychord::Diagnostic>& diagnostics,
                       const std::string& source, bool json_output) {
    for (const auto& diag : diagnostics) {
        if (json_output) {
            std::cout << lilychord::format_diagnostic_json(diag) << "\n";
        } else {
            std::cerr << lilychord::format_diagnostic(diag, source);
        }
    }
}

int run_exercise(const std::string& source, const lilychord::ParseOptions& options,
                 bool json_output) {
    auto def = lilychord::ExerciseDefinition::from_json(source, options);
    print_diagnostics(def.diagnostics(), {}, json_output);

    if (!def.is_valid()) {
        return EXIT_FAILURE;
    }

    std::cout << def.to_json() << "\n";
    return EXIT_SUCCESS;
}

int run_notation(const std::string& source, const lilychord::ParseOptions& options,
                 bool json_output) {
    auto result = lilychord::parse(source, options);
    print_diagnostics(result.diagnostics, source, json_output);

    if (json_output) {
        std::cout << lilychord::dump_json(lilychord::result_to_json(result)) << "\n";
    } else {
        print_chords(result);
    }

    return result.is_valid ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    std::string input_file;
    std::string inline_source;
    bool has_inline = false;
    bool json_output = false;
    bool exercise_input = false;
    lilychord::ParseOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }

        if (arg == "-v" || arg == "--version") {
            print_version();
            return EXIT_SUCCESS;
        }

        if (arg == "--json") {
            json_output = true;
            continue;
        }

        if (arg == "--relative") {
            options.octave_mode = lilychord::OctaveMode::Relative;
            continue;
        }

        if (arg == "--accumulate") {
            options.error_policy = lilychord::ErrorPolicy::Accumulate;
            continue;
        }

        if (arg == "--exercise") {
            exercise_input = true;
            continue;
        }

        if (arg == "-e" || arg == "--eval") {
            if (i + 1 >= argc) {
                std::cerr << "error: " << arg << " requires an argument\n";
                return EXIT_FAILURE;
            }
            inline_source = argv[++i];
            has_inline = true;
            continue;
        }

        // Assume it's the input file
        if (input_file.empty()) {
            input_file = arg;
        } else {
            std::cerr << "error: multiple input files not supported\n";
            return EXIT_FAILURE;
        }
    }

    if (input_file.empty() && !has_inline) {
        std::cerr << "error: no input specified\n";
        return EXIT_FAILURE;
    }

    if (!input_file.empty() && has_inline) {
        std::cerr << "error: give either a file or -e, not both\n";
        return EXIT_FAILURE;
    }

    std::string source = inline_source;
    if (!has_inline) {
        std::ifstream file(input_file);
        if (!file) {
            std::cerr << "error: could not open " << input_file << "\n";
            return EXIT_FAILURE;
        }
        source.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        options.filename = input_file;
    }

    if (exercise_input) {
        return run_exercise(source, options, json_output);
    }
    return run_notation(source, options, json_output);
}

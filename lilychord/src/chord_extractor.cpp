#include "lilychord/chord_extractor.hpp"

namespace lilychord {

namespace {

// Line/column of a byte offset, tracked incrementally while scanning forward
class LocationTracker {
public:
    explicit LocationTracker(std::string_view source) : source_(source) {}

    SourceLocation at(std::size_t offset, std::size_t length) {
        while (pos_ < offset && pos_ < source_.size()) {
            if (source_[pos_] == '\n') {
                ++line_;
                column_ = 1;
            } else {
                ++column_;
            }
            ++pos_;
        }
        return {
            .line = line_,
            .column = column_,
            .offset = static_cast<std::uint32_t>(offset),
            .length = static_cast<std::uint32_t>(length)
        };
    }

private:
    std::string_view source_;
    std::size_t pos_ = 0;
    std::uint32_t line_ = 1;
    std::uint32_t column_ = 1;
};

} // namespace

std::vector<ChordSpan> extract_chords(std::string_view notation) {
    std::vector<ChordSpan> chords;
    LocationTracker tracker(notation);

    std::size_t pos = 0;
    while (pos < notation.size()) {
        std::size_t open = notation.find(CHORD_OPEN, pos);
        if (open == std::string_view::npos) {
            break;
        }

        std::size_t start = open + 1;
        std::size_t close = notation.find(CHORD_CLOSE, start);
        if (close == std::string_view::npos) {
            break;  // Unterminated chord
        }

        if (close == start) {
            // "<>" holds no chord; resume after the closing bracket
            pos = close + 1;
            continue;
        }

        std::size_t length = close - start;
        chords.push_back(ChordSpan{
            .text = notation.substr(start, length),
            .location = tracker.at(start, length)
        });
        pos = close + 1;
    }

    return chords;
}

} // namespace lilychord

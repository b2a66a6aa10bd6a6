#include "patterns.h"

#include <algorithm>
#include <charconv>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace {

Pattern make_pulsar() {
    // One quadrant arm repeated by symmetry: bars of three at offsets 2-4 and 8-10,
    // placed on rows/columns 0, 5, 7 and 12.
    constexpr int64_t kBars[] = {2, 3, 4, 8, 9, 10};
    constexpr int64_t kLines[] = {0, 5, 7, 12};

    Pattern cells;
    cells.reserve(48);
    for (int64_t line : kLines) {
        for (int64_t bar : kBars) {
            cells.push_back({line, bar});
        }
    }
    for (int64_t bar : kBars) {
        for (int64_t line : kLines) {
            cells.push_back({bar, line});
        }
    }
    return cells;
}

bool is_blank(char c) noexcept {
    return c == ' ' || c == '\t';
}

} // namespace

const Pattern& glider_pattern() {
    static const Pattern kGlider = {{0, 1}, {1, 2}, {2, 0}, {2, 1}, {2, 2}};
    return kGlider;
}

const Pattern& pulsar_pattern() {
    static const Pattern kPulsar = make_pulsar();
    return kPulsar;
}

Pattern parse_life106(std::istream& input) {
    Pattern cells;
    std::string line;
    bool header_found = false;

    while (std::getline(input, line)) {
        size_t end = line.find_last_not_of(" \t\r\n");
        if (end == std::string::npos) {
            continue;
        }
        line.resize(end + 1);

        if (!header_found) {
            if (line != "#Life 1.06") {
                throw std::runtime_error(
                    "Invalid Life 1.06 file: missing or invalid header (expected '#Life 1.06')");
            }
            header_found = true;
            continue;
        }

        const char* ptr = line.data();
        const char* const line_end = ptr + line.size();
        while (ptr < line_end && is_blank(*ptr)) ++ptr;

        int64_t x, y;
        auto [p1, ec1] = std::from_chars(ptr, line_end, x);
        if (ec1 != std::errc{}) {
            throw std::runtime_error(
                "Invalid Life 1.06 file: malformed coordinate line '" + line + "'");
        }

        ptr = p1;
        while (ptr < line_end && is_blank(*ptr)) ++ptr;
        if (ptr == p1) {
            throw std::runtime_error(
                "Invalid Life 1.06 file: malformed coordinate line '" + line + "'");
        }

        auto [p2, ec2] = std::from_chars(ptr, line_end, y);
        if (ec2 != std::errc{}) {
            throw std::runtime_error(
                "Invalid Life 1.06 file: malformed coordinate line '" + line + "'");
        }

        ptr = p2;
        while (ptr < line_end && is_blank(*ptr)) ++ptr;
        if (ptr != line_end) {
            throw std::runtime_error(
                "Invalid Life 1.06 file: unexpected content after coordinates '" + line + "'");
        }

        cells.push_back({y, x});
    }

    if (!header_found) {
        throw std::runtime_error("Invalid Life 1.06 file: empty or missing header");
    }
    if (cells.empty()) {
        return cells;
    }

    int64_t min_row = std::numeric_limits<int64_t>::max();
    int64_t min_col = std::numeric_limits<int64_t>::max();
    for (const auto& cell : cells) {
        min_row = std::min(min_row, cell.row);
        min_col = std::min(min_col, cell.col);
    }

    // Normalizing must not overflow: reject patterns spanning more than int64_t.
    for (auto& cell : cells) {
        if ((min_row < 0 && cell.row > std::numeric_limits<int64_t>::max() + min_row) ||
            (min_col < 0 && cell.col > std::numeric_limits<int64_t>::max() + min_col)) {
            throw std::runtime_error("Invalid Life 1.06 file: pattern extent too large");
        }
        cell.row -= min_row;
        cell.col -= min_col;
    }

    std::sort(cells.begin(), cells.end(), [](const PatternCell& a, const PatternCell& b) {
        if (a.row != b.row) return a.row < b.row;
        return a.col < b.col;
    });
    cells.erase(std::unique(cells.begin(), cells.end()), cells.end());
    return cells;
}

Pattern parse_life106(const std::string& input) {
    std::istringstream stream(input);
    return parse_life106(stream);
}

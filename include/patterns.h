#ifndef PATTERNS_H
#define PATTERNS_H

#include <cstdint>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

/**
 * Offset of a live cell from the top-left corner of a pattern's bounding box.
 */
struct PatternCell {
    int64_t row;
    int64_t col;

    bool operator==(const PatternCell& other) const noexcept {
        return row == other.row && col == other.col;
    }
};

using Pattern = std::vector<PatternCell>;

/**
 * Glider in a 3x3 box, travelling +1 row and +1 column every 4 generations:
 *   .O.
 *   ..O
 *   OOO
 */
const Pattern& glider_pattern();

/** Period-3 pulsar, 48 cells in a 13x13 box. */
const Pattern& pulsar_pattern();

/**
 * Check if filename has valid Life 1.06 extension (.life or .lif).
 * @param filename The filename to check
 * @return true if extension is valid
 */
inline bool has_valid_life_extension(std::string_view filename) noexcept {
    size_t dot_pos = filename.rfind('.');
    if (dot_pos == std::string_view::npos) return false;
    std::string_view ext = filename.substr(dot_pos);
    return ext == ".life" || ext == ".lif";
}

/**
 * Parse a Life 1.06 pattern. Each "x y" line becomes {row = y, col = x};
 * the result is shifted so its bounding box starts at (0, 0).
 * @throws std::runtime_error on invalid format
 */
[[nodiscard]] Pattern parse_life106(std::istream& input);
[[nodiscard]] Pattern parse_life106(const std::string& input);

#endif // PATTERNS_H

#ifndef UNIVERSE_H
#define UNIVERSE_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "patterns.h"

/**
 * State of a single cell. One byte per cell so the whole grid can be
 * handed to a renderer as a flat byte buffer.
 */
enum class CellState : uint8_t {
    Dead = 0,
    Alive = 1
};

using CellBuffer = std::vector<CellState>;
using DiffBuffer = std::vector<int32_t>;

/** Terminates the list of changed indices in the diff buffer. */
constexpr int32_t kDiffSentinel = -1;

/** How a freshly constructed universe is populated. */
enum class InitialState {
    Dead,
    Random
};

// Forward declaration
class SimulationEngine;
enum class EngineType;

/**
 * Conway's Game of Life on a fixed-size toroidal grid.
 *
 * Cells are stored row-major (index = row * width + column). Rows and
 * columns wrap around, so the grid has no edges. Every row/column passed
 * to an accessor or mutator is wrapped onto the torus the same way.
 *
 * After each tick() the diff buffer lists, in ascending order, every cell
 * index whose state changed, followed by kDiffSentinel. Any other mutation
 * resets the diff to empty; callers must re-read cells() instead.
 *
 * Views returned by cells()/diff() are valid until the next mutating call.
 * A moved-from universe may only be assigned to or destroyed.
 *
 * Thread safety: Not thread-safe. External synchronization required for concurrent access.
 */
class Universe {
public:
    static constexpr int kDefaultWidth = 64;
    static constexpr int kDefaultHeight = 64;

    /** 64x64 universe with a random starting generation. */
    Universe();

    /**
     * @throws std::invalid_argument if width or height is not positive, or
     *         width * height does not fit a 32-bit diff index
     */
    Universe(int width, int height, InitialState init = InitialState::Dead);
    Universe(int width, int height, InitialState init, EngineType engine);

    ~Universe();

    Universe(const Universe& other);
    Universe& operator=(const Universe& other);

    Universe(Universe&& other) noexcept;
    Universe& operator=(Universe&& other) noexcept;

    int width() const noexcept { return width_; }
    int height() const noexcept { return height_; }

    /** Generation counter, starts at 1. */
    uint32_t generation() const noexcept { return generation_; }

    /** Number of alive cells. */
    size_t living() const noexcept;

    /** Read-only view of the current generation. */
    const CellBuffer& cells() const noexcept { return cells_; }
    const uint8_t* cells_data() const noexcept {
        return reinterpret_cast<const uint8_t*>(cells_.data());
    }

    /**
     * Sentinel-terminated list of indices changed by the last tick().
     * Holds width * height + 1 slots; entries past the sentinel are stale.
     */
    const DiffBuffer& diff() const noexcept { return diff_; }
    const int32_t* diff_data() const noexcept { return diff_.data(); }

    /** Number of real entries before the sentinel. */
    size_t diff_size() const noexcept { return diff_size_; }

    /** Copy of the current generation. */
    CellBuffer snapshot_cells() const { return cells_; }

    /** Copy of the indices changed by the last tick(), without the sentinel. */
    std::vector<int32_t> changed_indices() const;

    size_t index(int64_t row, int64_t col) const noexcept;

    CellState at(int64_t row, int64_t col) const noexcept { return cells_[index(row, col)]; }
    bool is_alive(int64_t row, int64_t col) const noexcept {
        return at(row, col) == CellState::Alive;
    }

    EngineType engine_type() const noexcept;

    /**
     * Advance one generation and record the diff.
     * @throws std::logic_error on a moved-from universe
     */
    void tick();

    /**
     * Run multiple generations.
     * @throws std::invalid_argument if iterations < 0
     */
    void run(int iterations);

    void toggle_cell(int64_t row, int64_t col);

    /** Set the given (row, col) positions alive. */
    void set_cells(const std::vector<std::pair<int64_t, int64_t>>& positions);

    /** Each cell alive with probability 1/2. Resets the generation counter. */
    void randomize();

    /** Reseed the generator used by randomize(). */
    void seed(uint64_t value) { rng_.seed(value); }

    /** All cells dead. Resets the generation counter. */
    void clear();

    /** Overlay a pattern with its bounding box anchored at (row, col). */
    void insert_pattern(const Pattern& pattern, int64_t row, int64_t col);
    void insert_glider(int64_t row, int64_t col);
    void insert_pulsar(int64_t row, int64_t col);

    /**
     * Write alive cells in Life 1.06 format ("x y" = "column row").
     * @param out Output stream
     */
    void write(std::ostream& out) const;

    /** Format current state as Life 1.06 string. */
    std::string format() const;

private:
    int width_;
    int height_;
    uint32_t generation_ = 1;
    CellBuffer cells_;
    CellBuffer next_;
    DiffBuffer diff_;
    size_t diff_size_ = 0;
    std::mt19937_64 rng_;
    std::unique_ptr<SimulationEngine> engine_;

    void reset_diff() noexcept;
};

#endif // UNIVERSE_H

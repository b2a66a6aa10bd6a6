#include "universe.h"
#include "engine.h"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstring>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace {

constexpr EngineType kDefaultEngine = EngineType::Wrapped;

// Validated before any buffer is allocated.
size_t checked_cell_count(int width, int height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument(
            "Universe dimensions must be positive (got " + std::to_string(width) +
            " x " + std::to_string(height) + ")");
    }
    const int64_t area = static_cast<int64_t>(width) * height;
    if (area >= std::numeric_limits<int32_t>::max()) {
        throw std::invalid_argument(
            "Universe too large: " + std::to_string(width) + " x " + std::to_string(height) +
            " cells cannot be indexed by the diff buffer");
    }
    return static_cast<size_t>(area);
}

int64_t wrap(int64_t value, int64_t extent) noexcept {
    int64_t m = value % extent;
    return m < 0 ? m + extent : m;
}

} // namespace

// --- Constructors ---

Universe::Universe()
    : Universe(kDefaultWidth, kDefaultHeight, InitialState::Random) {}

Universe::Universe(int width, int height, InitialState init)
    : Universe(width, height, init, kDefaultEngine) {}

Universe::Universe(int width, int height, InitialState init, EngineType engine)
    : width_(width),
      height_(height),
      cells_(checked_cell_count(width, height), CellState::Dead),
      next_(cells_.size(), CellState::Dead),
      diff_(cells_.size() + 1, kDiffSentinel),
      rng_(std::random_device{}()),
      engine_(create_engine(engine)) {
    if (init == InitialState::Random) {
        randomize();
    }
}

Universe::~Universe() = default;

// --- Copy ---

Universe::Universe(const Universe& other)
    : width_(other.width_),
      height_(other.height_),
      generation_(other.generation_),
      cells_(other.cells_),
      next_(other.next_),
      diff_(other.diff_),
      diff_size_(other.diff_size_),
      rng_(other.rng_),
      engine_(other.engine_ ? other.engine_->clone() : create_engine(kDefaultEngine)) {}

Universe& Universe::operator=(const Universe& other) {
    if (this != &other) {
        width_ = other.width_;
        height_ = other.height_;
        generation_ = other.generation_;
        cells_ = other.cells_;
        next_ = other.next_;
        diff_ = other.diff_;
        diff_size_ = other.diff_size_;
        rng_ = other.rng_;
        engine_ = other.engine_ ? other.engine_->clone() : create_engine(kDefaultEngine);
    }
    return *this;
}

// --- Move ---

Universe::Universe(Universe&& other) noexcept
    : width_(other.width_),
      height_(other.height_),
      generation_(other.generation_),
      cells_(std::move(other.cells_)),
      next_(std::move(other.next_)),
      diff_(std::move(other.diff_)),
      diff_size_(other.diff_size_),
      rng_(other.rng_),
      engine_(std::move(other.engine_)) {}

Universe& Universe::operator=(Universe&& other) noexcept {
    if (this != &other) {
        width_ = other.width_;
        height_ = other.height_;
        generation_ = other.generation_;
        cells_ = std::move(other.cells_);
        next_ = std::move(other.next_);
        diff_ = std::move(other.diff_);
        diff_size_ = other.diff_size_;
        rng_ = other.rng_;
        engine_ = std::move(other.engine_);
    }
    return *this;
}

// --- Accessors ---

size_t Universe::living() const noexcept {
    return static_cast<size_t>(std::count(cells_.begin(), cells_.end(), CellState::Alive));
}

std::vector<int32_t> Universe::changed_indices() const {
    return std::vector<int32_t>(diff_.begin(), diff_.begin() + static_cast<std::ptrdiff_t>(diff_size_));
}

size_t Universe::index(int64_t row, int64_t col) const noexcept {
    return static_cast<size_t>(wrap(row, height_) * width_ + wrap(col, width_));
}

EngineType Universe::engine_type() const noexcept {
    return engine_ ? engine_->type() : kDefaultEngine;
}

// --- Simulation ---

void Universe::tick() {
    if (!engine_) {
        throw std::logic_error("tick() called on a moved-from Universe");
    }
    diff_size_ = engine_->tick(cells_, next_, diff_, width_, height_);
    diff_[diff_size_] = kDiffSentinel;
    std::swap(cells_, next_);
    ++generation_;
}

void Universe::run(int iterations) {
    if (iterations < 0) {
        throw std::invalid_argument("Iterations must be non-negative");
    }
    for (int i = 0; i < iterations; i++) {
        tick();
    }
}

// --- Mutation ---

void Universe::reset_diff() noexcept {
    diff_size_ = 0;
    diff_[0] = kDiffSentinel;
}

void Universe::toggle_cell(int64_t row, int64_t col) {
    CellState& cell = cells_[index(row, col)];
    cell = cell == CellState::Alive ? CellState::Dead : CellState::Alive;
    reset_diff();
}

void Universe::set_cells(const std::vector<std::pair<int64_t, int64_t>>& positions) {
    for (const auto& [row, col] : positions) {
        cells_[index(row, col)] = CellState::Alive;
    }
    reset_diff();
}

void Universe::randomize() {
    std::bernoulli_distribution coin(0.5);
    for (auto& cell : cells_) {
        cell = coin(rng_) ? CellState::Alive : CellState::Dead;
    }
    generation_ = 1;
    reset_diff();
}

void Universe::clear() {
    std::fill(cells_.begin(), cells_.end(), CellState::Dead);
    generation_ = 1;
    reset_diff();
}

void Universe::insert_pattern(const Pattern& pattern, int64_t row, int64_t col) {
    // Wrap each term separately so huge offsets cannot overflow the sum.
    const int64_t origin_row = wrap(row, height_);
    const int64_t origin_col = wrap(col, width_);
    for (const auto& cell : pattern) {
        cells_[index(origin_row + wrap(cell.row, height_),
                     origin_col + wrap(cell.col, width_))] = CellState::Alive;
    }
    reset_diff();
}

void Universe::insert_glider(int64_t row, int64_t col) {
    insert_pattern(glider_pattern(), row, col);
}

void Universe::insert_pulsar(int64_t row, int64_t col) {
    insert_pattern(pulsar_pattern(), row, col);
}

// --- Output ---

void Universe::write(std::ostream& out) const {
    // Batch lines into a local buffer and flush with one out.write() per block.
    constexpr size_t kBufSize = 8192;
    char buf[kBufSize];
    char* pos = buf;
    char* const end = buf + kBufSize;

    // Two int32 values, a space and a newline
    constexpr size_t kMaxLineLen = 24;

    auto flush = [&]() {
        out.write(buf, pos - buf);
        pos = buf;
    };

    constexpr char kHeader[] = "#Life 1.06\n";
    constexpr size_t kHeaderLen = sizeof(kHeader) - 1;
    std::memcpy(pos, kHeader, kHeaderLen);
    pos += kHeaderLen;

    for (int row = 0; row < height_; row++) {
        for (int col = 0; col < width_; col++) {
            if (cells_[static_cast<size_t>(row) * width_ + col] != CellState::Alive) {
                continue;
            }
            if (static_cast<size_t>(end - pos) < kMaxLineLen) {
                flush();
            }
            auto [p1, ec1] = std::to_chars(pos, end, col);
            *p1++ = ' ';
            auto [p2, ec2] = std::to_chars(p1, end, row);
            *p2++ = '\n';
            pos = p2;
        }
    }

    if (pos > buf) {
        flush();
    }
}

std::string Universe::format() const {
    std::ostringstream out;
    write(out);
    return out.str();
}

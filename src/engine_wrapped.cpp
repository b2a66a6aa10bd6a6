#include "engine.h"

#include <vector>

// Neighbor columns are looked up from precomputed tables and neighbor rows
// are resolved once per row, so the inner loop has no % and no edge branches.
class WrappedEngine : public SimulationEngine {
public:
    size_t tick(const CellBuffer& current, CellBuffer& next, DiffBuffer& diff,
                int width, int height) override {
        const size_t w = static_cast<size_t>(width);
        const size_t h = static_cast<size_t>(height);
        if (left_.size() != w) {
            build_column_tables(w);
        }

        const CellState* cells = current.data();
        size_t changed = 0;

        for (size_t row = 0; row < h; row++) {
            const CellState* above = cells + (row == 0 ? h - 1 : row - 1) * w;
            const CellState* here  = cells + row * w;
            const CellState* below = cells + (row + 1 == h ? 0 : row + 1) * w;

            for (size_t col = 0; col < w; col++) {
                const size_t l = left_[col];
                const size_t r = right_[col];
                const int live =
                    static_cast<int>(above[l]) + static_cast<int>(above[col]) + static_cast<int>(above[r]) +
                    static_cast<int>(here[l])  +                                static_cast<int>(here[r]) +
                    static_cast<int>(below[l]) + static_cast<int>(below[col]) + static_cast<int>(below[r]);

                const size_t idx = row * w + col;
                const CellState cell = here[col];
                const CellState updated = next_state(cell, live);
                next[idx] = updated;
                if (updated != cell) {
                    diff[changed++] = static_cast<int32_t>(idx);
                }
            }
        }
        return changed;
    }

    [[nodiscard]] std::unique_ptr<SimulationEngine> clone() const override {
        return std::make_unique<WrappedEngine>();
    }

    [[nodiscard]] EngineType type() const noexcept override {
        return EngineType::Wrapped;
    }

private:
    std::vector<size_t> left_;
    std::vector<size_t> right_;

    void build_column_tables(size_t w) {
        left_.resize(w);
        right_.resize(w);
        for (size_t col = 0; col < w; col++) {
            left_[col] = col == 0 ? w - 1 : col - 1;
            right_[col] = col + 1 == w ? 0 : col + 1;
        }
    }
};

std::unique_ptr<SimulationEngine> create_wrapped_engine() {
    return std::make_unique<WrappedEngine>();
}

#include "engine.h"

// Reference engine: every neighbor coordinate is wrapped with %.
// Adding height - 1 / width - 1 instead of subtracting 1 keeps the
// arithmetic unsigned.
class ModuloEngine : public SimulationEngine {
public:
    size_t tick(const CellBuffer& current, CellBuffer& next, DiffBuffer& diff,
                int width, int height) override {
        const size_t w = static_cast<size_t>(width);
        const size_t h = static_cast<size_t>(height);
        const size_t row_deltas[3] = {h - 1, 0, 1};
        const size_t col_deltas[3] = {w - 1, 0, 1};

        size_t changed = 0;
        for (size_t row = 0; row < h; row++) {
            for (size_t col = 0; col < w; col++) {
                int live = 0;
                for (size_t dr = 0; dr < 3; dr++) {
                    for (size_t dc = 0; dc < 3; dc++) {
                        if (dr == 1 && dc == 1) continue;
                        const size_t r = (row + row_deltas[dr]) % h;
                        const size_t c = (col + col_deltas[dc]) % w;
                        live += static_cast<int>(current[r * w + c]);
                    }
                }

                const size_t idx = row * w + col;
                const CellState cell = current[idx];
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
        return std::make_unique<ModuloEngine>();
    }

    [[nodiscard]] EngineType type() const noexcept override {
        return EngineType::Modulo;
    }
};

std::unique_ptr<SimulationEngine> create_modulo_engine() {
    return std::make_unique<ModuloEngine>();
}

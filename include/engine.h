#ifndef ENGINE_H
#define ENGINE_H

#include "universe.h"
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

enum class EngineType {
    Modulo,
    Wrapped
};

/**
 * B3/S23: a dead cell with exactly 3 live neighbors is born, a live cell
 * with 2 or 3 survives, everything else is dead.
 */
constexpr CellState next_state(CellState cell, int live_neighbors) noexcept {
    if (live_neighbors == 3) return CellState::Alive;
    if (live_neighbors == 2) return cell;
    return CellState::Dead;
}

/**
 * Abstract base class for Game of Life step engines.
 * Each engine implements a different strategy for toroidal neighbor lookup.
 */
class SimulationEngine {
public:
    virtual ~SimulationEngine() = default;

    /**
     * Compute the generation after `current` into `next` (both width * height)
     * and write every changed index in ascending order to the front of `diff`.
     * @return number of indices written to `diff`
     */
    virtual size_t tick(const CellBuffer& current, CellBuffer& next, DiffBuffer& diff,
                        int width, int height) = 0;

    /** Create a deep copy of this engine (for Universe copy semantics). */
    [[nodiscard]] virtual std::unique_ptr<SimulationEngine> clone() const = 0;

    /** Return the engine type. */
    [[nodiscard]] virtual EngineType type() const noexcept = 0;
};

/**
 * Factory: create a SimulationEngine of the given type.
 */
[[nodiscard]] std::unique_ptr<SimulationEngine> create_engine(EngineType type);

/**
 * Parse a string into an EngineType.
 * Accepts "modulo", "wrapped" (case-insensitive).
 * @throws std::invalid_argument on unrecognized string
 */
[[nodiscard]] EngineType parse_engine_type(std::string_view s);

/** Lowercase name of an engine type. */
[[nodiscard]] const char* engine_name(EngineType type) noexcept;

#endif // ENGINE_H

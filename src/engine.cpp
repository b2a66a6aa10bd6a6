#include "engine.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

// Forward declarations of engine constructors
std::unique_ptr<SimulationEngine> create_modulo_engine();
std::unique_ptr<SimulationEngine> create_wrapped_engine();

std::unique_ptr<SimulationEngine> create_engine(EngineType type) {
    switch (type) {
        case EngineType::Modulo:
            return create_modulo_engine();
        case EngineType::Wrapped:
            return create_wrapped_engine();
    }
    // Unreachable, but satisfy compilers
    return create_wrapped_engine();
}

EngineType parse_engine_type(std::string_view s) {
    // Convert to lowercase for case-insensitive comparison
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "modulo")  return EngineType::Modulo;
    if (lower == "wrapped") return EngineType::Wrapped;

    throw std::invalid_argument(
        "Unknown engine type '" + std::string(s) +
        "'. Valid options: modulo, wrapped");
}

const char* engine_name(EngineType type) noexcept {
    switch (type) {
        case EngineType::Modulo:  return "modulo";
        case EngineType::Wrapped: return "wrapped";
    }
    return "unknown";
}

#include "viewport/performance_mode.hpp"

namespace clubnet {

std::string toString(PerformanceMode mode) {
    switch (mode) {
        case PerformanceMode::Auto:            return "auto";
        case PerformanceMode::Standard:        return "standard";
        case PerformanceMode::HighPerformance: return "high-performance";
        case PerformanceMode::Ultra:           return "ultra";
    }
    return "standard";
}

RendererHints rendererHints(PerformanceMode mode) {
    switch (mode) {
        case PerformanceMode::HighPerformance:
            return {true, true, false, 1.0};
        case PerformanceMode::Ultra:
            return {true, true, true, 0.5};
        case PerformanceMode::Auto:
        case PerformanceMode::Standard:
            break;
    }
    return {true, false, false, std::nullopt};
}

PerformanceMode modeForNodeCount(size_t node_count, size_t high_threshold, size_t ultra_threshold) {
    if (node_count > ultra_threshold) return PerformanceMode::Ultra;
    if (node_count > high_threshold) return PerformanceMode::HighPerformance;
    return PerformanceMode::Standard;
}

} // namespace clubnet

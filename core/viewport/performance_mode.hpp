#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace clubnet {

/// Rendering performance mode. `Auto` is a request, never an effective
/// mode: it means "derive the mode from the node count".
enum class PerformanceMode {
    Auto,
    Standard,
    HighPerformance,
    Ultra
};

std::string toString(PerformanceMode mode);

/// Renderer settings bundled with each mode.
struct RendererHints {
    bool texture_on_viewport = true;
    bool hide_edges_on_viewport = false;
    bool hide_labels_on_viewport = false;
    std::optional<double> pixel_ratio;  // nullopt = device default

    bool operator==(const RendererHints& other) const {
        return texture_on_viewport == other.texture_on_viewport &&
               hide_edges_on_viewport == other.hide_edges_on_viewport &&
               hide_labels_on_viewport == other.hide_labels_on_viewport &&
               pixel_ratio == other.pixel_ratio;
    }
};

/// Hints for an effective mode. Auto yields the Standard bundle.
RendererHints rendererHints(PerformanceMode mode);

/// Automatic selection: above `ultra_threshold` nodes Ultra, above
/// `high_threshold` HighPerformance, otherwise Standard.
PerformanceMode modeForNodeCount(size_t node_count,
                                 size_t high_threshold = 1000,
                                 size_t ultra_threshold = 5000);

} // namespace clubnet

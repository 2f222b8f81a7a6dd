#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace clubnet {

// ─── GraphConfig ───────────────────────────────────────────────
// Renderer-facing configuration. Captured in every history state.

struct LayoutConfig {
    std::string type = "force-directed";
    std::map<std::string, std::string> options;
};

struct NodeStyleConfig {
    double default_size = 10.0;
    double min_size = 5.0;
    double max_size = 50.0;
    std::string size_attribute = "degree";  // degree | betweenness | closeness | custom
    std::string color_scheme = "league";    // league | city | degree | custom
    bool show_labels = true;
    double label_size = 12.0;
};

struct EdgeStyleConfig {
    double default_width = 2.0;
    double min_width = 1.0;
    double max_width = 10.0;
    std::string width_attribute = "weight";
    bool show_arrows = true;
    bool curved_edges = false;
    bool show_labels = false;
};

struct InteractionConfig {
    bool zoom_enabled = true;
    bool pan_enabled = true;
    bool select_enabled = true;
    bool multi_select_enabled = true;
    bool hover_enabled = true;
    bool drag_enabled = true;
};

struct DefaultFilterConfig {
    double min_connection_weight = 0.0;
    double max_connection_weight = 100.0;
    std::vector<std::string> connection_types;
    std::vector<std::string> leagues;
    std::vector<std::string> cities;
    bool show_inactive_connections = true;
};

struct AnimationConfig {
    bool enabled = true;
    int duration_ms = 1000;
    std::string easing = "ease-out";
};

struct GraphConfig {
    LayoutConfig layout;
    NodeStyleConfig nodes;
    EdgeStyleConfig edges;
    InteractionConfig interaction;
    DefaultFilterConfig filters;
    AnimationConfig animation;
};

bool operator==(const GraphConfig& a, const GraphConfig& b);
inline bool operator!=(const GraphConfig& a, const GraphConfig& b) { return !(a == b); }

/// Layout names a renderer is expected to support.
const std::vector<std::string>& availableLayouts();

// ─── EngineConfig ──────────────────────────────────────────────
// Thresholds of the analysis and performance engine.

struct EngineConfig {
    // viewport culling
    size_t culling_threshold = 1000;
    size_t max_visible_nodes = 500;
    int cull_throttle_ms = 16;
    double cull_margin = 0.0;        // model units added around the viewport

    // performance modes
    size_t high_performance_threshold = 1000;
    size_t ultra_threshold = 5000;

    // adaptive quality
    int fps_window_ms = 1000;
    double low_fps = 30.0;
    double high_fps = 50.0;
    int memory_poll_ms = 5000;
    int memory_warning_limit = 3;

    // analysis
    double weak_connection_threshold = 30.0;
    size_t heap_path_threshold = 2000;
    size_t default_max_recommendations = 10;

    // history
    size_t history_capacity = 50;
};

/// Read an EngineConfig from a JSON file. Missing keys keep their
/// defaults. Throws std::runtime_error if the file cannot be read or parsed.
EngineConfig loadEngineConfig(const std::string& path);

} // namespace clubnet

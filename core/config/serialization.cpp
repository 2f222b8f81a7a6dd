#include "config/serialization.hpp"

#include <stdexcept>

namespace clubnet {

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(LayoutConfig, type, options)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(NodeStyleConfig, default_size, min_size, max_size,
                                                size_attribute, color_scheme, show_labels, label_size)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(EdgeStyleConfig, default_width, min_width, max_width,
                                                width_attribute, show_arrows, curved_edges, show_labels)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(InteractionConfig, zoom_enabled, pan_enabled,
                                                select_enabled, multi_select_enabled, hover_enabled,
                                                drag_enabled)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(DefaultFilterConfig, min_connection_weight,
                                                max_connection_weight, connection_types, leagues,
                                                cities, show_inactive_connections)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(AnimationConfig, enabled, duration_ms, easing)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(LayoutFilters, hide_isolated_nodes,
                                                hide_weak_connections, show_only_largest_component)

namespace {

template <typename T>
void putRange(nlohmann::json& j, const char* key, const std::optional<Range<T>>& range) {
    if (range) j[key] = {{"min", range->min}, {"max", range->max}};
}

template <typename T>
void getRange(const nlohmann::json& j, const char* key, std::optional<Range<T>>& range) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    range = Range<T>{it->at("min").template get<T>(), it->at("max").template get<T>()};
}

void putFlag(nlohmann::json& j, const char* key, const std::optional<bool>& flag) {
    if (flag) j[key] = *flag;
}

void getFlag(const nlohmann::json& j, const char* key, std::optional<bool>& flag) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) flag = it->get<bool>();
}

template <typename T>
void getField(const nlohmann::json& j, const char* key, T& value) {
    auto it = j.find(key);
    if (it != j.end()) it->get_to(value);
}

} // namespace

// ─── Enums ─────────────────────────────────────────────────────

void to_json(nlohmann::json& j, ConnectionType type) { j = toString(type); }

void from_json(const nlohmann::json& j, ConnectionType& type) {
    auto parsed = parseConnectionType(j.get<std::string>());
    if (!parsed) throw std::invalid_argument("Unknown connection type: " + j.get<std::string>());
    type = *parsed;
}

void to_json(nlohmann::json& j, ConnectionStrength strength) { j = toString(strength); }

void from_json(const nlohmann::json& j, ConnectionStrength& strength) {
    auto parsed = parseConnectionStrength(j.get<std::string>());
    if (!parsed) throw std::invalid_argument("Unknown connection strength: " + j.get<std::string>());
    strength = *parsed;
}

// ─── GraphConfig ───────────────────────────────────────────────

void to_json(nlohmann::json& j, const GraphConfig& config) {
    j = {
        {"layout", config.layout},
        {"nodes", config.nodes},
        {"edges", config.edges},
        {"interaction", config.interaction},
        {"filters", config.filters},
        {"animation", config.animation},
    };
}

void from_json(const nlohmann::json& j, GraphConfig& config) {
    getField(j, "layout", config.layout);
    getField(j, "nodes", config.nodes);
    getField(j, "edges", config.edges);
    getField(j, "interaction", config.interaction);
    getField(j, "filters", config.filters);
    getField(j, "animation", config.animation);
}

// ─── EngineConfig ──────────────────────────────────────────────

void to_json(nlohmann::json& j, const EngineConfig& c) {
    j = {
        {"culling_threshold", c.culling_threshold},
        {"max_visible_nodes", c.max_visible_nodes},
        {"cull_throttle_ms", c.cull_throttle_ms},
        {"cull_margin", c.cull_margin},
        {"high_performance_threshold", c.high_performance_threshold},
        {"ultra_threshold", c.ultra_threshold},
        {"fps_window_ms", c.fps_window_ms},
        {"low_fps", c.low_fps},
        {"high_fps", c.high_fps},
        {"memory_poll_ms", c.memory_poll_ms},
        {"memory_warning_limit", c.memory_warning_limit},
        {"weak_connection_threshold", c.weak_connection_threshold},
        {"heap_path_threshold", c.heap_path_threshold},
        {"default_max_recommendations", c.default_max_recommendations},
        {"history_capacity", c.history_capacity},
    };
}

void from_json(const nlohmann::json& j, EngineConfig& c) {
    getField(j, "culling_threshold", c.culling_threshold);
    getField(j, "max_visible_nodes", c.max_visible_nodes);
    getField(j, "cull_throttle_ms", c.cull_throttle_ms);
    getField(j, "cull_margin", c.cull_margin);
    getField(j, "high_performance_threshold", c.high_performance_threshold);
    getField(j, "ultra_threshold", c.ultra_threshold);
    getField(j, "fps_window_ms", c.fps_window_ms);
    getField(j, "low_fps", c.low_fps);
    getField(j, "high_fps", c.high_fps);
    getField(j, "memory_poll_ms", c.memory_poll_ms);
    getField(j, "memory_warning_limit", c.memory_warning_limit);
    getField(j, "weak_connection_threshold", c.weak_connection_threshold);
    getField(j, "heap_path_threshold", c.heap_path_threshold);
    getField(j, "default_max_recommendations", c.default_max_recommendations);
    getField(j, "history_capacity", c.history_capacity);
}

// ─── FilterCriteria ────────────────────────────────────────────

void to_json(nlohmann::json& j, const FilterCriteria& criteria) {
    const auto& nf = criteria.node_filters;
    const auto& ef = criteria.edge_filters;

    nlohmann::json nodes = nlohmann::json::object();
    if (!nf.leagues.empty()) nodes["leagues"] = nf.leagues;
    if (!nf.cities.empty()) nodes["cities"] = nf.cities;
    putRange(nodes, "founded_year_range", nf.founded_year_range);
    putFlag(nodes, "has_coordinates", nf.has_coordinates);
    putRange(nodes, "degree_range", nf.degree_range);

    nlohmann::json edges = nlohmann::json::object();
    if (!ef.connection_types.empty()) edges["connection_types"] = ef.connection_types;
    if (!ef.strength_levels.empty()) edges["strength_levels"] = ef.strength_levels;
    putRange(edges, "weight_range", ef.weight_range);
    putFlag(edges, "is_active", ef.is_active);
    putFlag(edges, "has_end_date", ef.has_end_date);

    j = {
        {"node_filters", nodes},
        {"edge_filters", edges},
        {"layout_filters", criteria.layout_filters},
    };
}

void from_json(const nlohmann::json& j, FilterCriteria& criteria) {
    criteria = FilterCriteria{};

    auto nodes = j.find("node_filters");
    if (nodes != j.end()) {
        auto& nf = criteria.node_filters;
        getField(*nodes, "leagues", nf.leagues);
        getField(*nodes, "cities", nf.cities);
        getRange(*nodes, "founded_year_range", nf.founded_year_range);
        getFlag(*nodes, "has_coordinates", nf.has_coordinates);
        getRange(*nodes, "degree_range", nf.degree_range);
    }

    auto edges = j.find("edge_filters");
    if (edges != j.end()) {
        auto& ef = criteria.edge_filters;
        getField(*edges, "connection_types", ef.connection_types);
        getField(*edges, "strength_levels", ef.strength_levels);
        getRange(*edges, "weight_range", ef.weight_range);
        getFlag(*edges, "is_active", ef.is_active);
        getFlag(*edges, "has_end_date", ef.has_end_date);
    }

    getField(j, "layout_filters", criteria.layout_filters);
}

} // namespace clubnet

#pragma once

#include "graph/edge.hpp"

#include <optional>
#include <string>
#include <vector>

namespace clubnet {

template <typename T>
struct Range {
    T min{};
    T max{};

    bool contains(T value) const { return value >= min && value <= max; }
    bool operator==(const Range& other) const { return min == other.min && max == other.max; }
    bool operator!=(const Range& other) const { return !(*this == other); }
};

/// Predicates over node attributes. Unset / empty means "no constraint".
struct NodeFilters {
    std::vector<std::string> leagues;
    std::vector<std::string> cities;
    std::optional<Range<int>> founded_year_range;
    std::optional<bool> has_coordinates;
    std::optional<Range<size_t>> degree_range;

    bool empty() const {
        return leagues.empty() && cities.empty() && !founded_year_range &&
               !has_coordinates && !degree_range;
    }
};

/// Predicates over edge attributes. Unset / empty means "no constraint".
struct EdgeFilters {
    std::vector<ConnectionType> connection_types;
    std::vector<ConnectionStrength> strength_levels;
    std::optional<Range<double>> weight_range;
    std::optional<bool> is_active;
    std::optional<bool> has_end_date;

    bool empty() const {
        return connection_types.empty() && strength_levels.empty() &&
               !weight_range && !is_active && !has_end_date;
    }
};

struct LayoutFilters {
    bool hide_isolated_nodes = false;
    bool hide_weak_connections = false;
    bool show_only_largest_component = false;

    bool empty() const {
        return !hide_isolated_nodes && !hide_weak_connections && !show_only_largest_component;
    }
};

/// Value object applied to a snapshot to derive a filtered snapshot.
struct FilterCriteria {
    NodeFilters node_filters;
    EdgeFilters edge_filters;
    LayoutFilters layout_filters;

    bool empty() const {
        return node_filters.empty() && edge_filters.empty() && layout_filters.empty();
    }
};

bool operator==(const NodeFilters& a, const NodeFilters& b);
bool operator==(const EdgeFilters& a, const EdgeFilters& b);
bool operator==(const LayoutFilters& a, const LayoutFilters& b);
bool operator==(const FilterCriteria& a, const FilterCriteria& b);
inline bool operator!=(const FilterCriteria& a, const FilterCriteria& b) { return !(a == b); }

} // namespace clubnet

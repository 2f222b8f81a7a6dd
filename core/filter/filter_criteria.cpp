#include "filter/filter_criteria.hpp"

namespace clubnet {

bool operator==(const NodeFilters& a, const NodeFilters& b) {
    return a.leagues == b.leagues && a.cities == b.cities &&
           a.founded_year_range == b.founded_year_range &&
           a.has_coordinates == b.has_coordinates &&
           a.degree_range == b.degree_range;
}

bool operator==(const EdgeFilters& a, const EdgeFilters& b) {
    return a.connection_types == b.connection_types &&
           a.strength_levels == b.strength_levels &&
           a.weight_range == b.weight_range &&
           a.is_active == b.is_active &&
           a.has_end_date == b.has_end_date;
}

bool operator==(const LayoutFilters& a, const LayoutFilters& b) {
    return a.hide_isolated_nodes == b.hide_isolated_nodes &&
           a.hide_weak_connections == b.hide_weak_connections &&
           a.show_only_largest_component == b.show_only_largest_component;
}

bool operator==(const FilterCriteria& a, const FilterCriteria& b) {
    return a.node_filters == b.node_filters &&
           a.edge_filters == b.edge_filters &&
           a.layout_filters == b.layout_filters;
}

} // namespace clubnet

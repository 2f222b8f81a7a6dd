#include "filter/filter_engine.hpp"
#include "analysis/connectivity.hpp"
#include "graph/adjacency.hpp"

#include <algorithm>
#include <unordered_set>

namespace clubnet {

namespace {

template <typename T>
bool contains(const std::vector<T>& values, const T& v) {
    return std::find(values.begin(), values.end(), v) != values.end();
}

bool keepNode(const Node& node, size_t degree, const NodeFilters& f) {
    const ClubRecord& club = node.club;
    if (!f.leagues.empty() && !contains(f.leagues, club.league)) return false;
    if (!f.cities.empty() && !contains(f.cities, club.city)) return false;
    if (f.founded_year_range && !f.founded_year_range->contains(club.founded_year)) return false;
    if (f.has_coordinates && club.hasCoordinates() != *f.has_coordinates) return false;
    if (f.degree_range && !f.degree_range->contains(degree)) return false;
    return true;
}

bool keepEdge(const Edge& edge, const EdgeFilters& f) {
    if (!f.connection_types.empty() && !contains(f.connection_types, edge.type)) return false;
    if (!f.strength_levels.empty() && !contains(f.strength_levels, edge.strength)) return false;
    if (f.weight_range && !f.weight_range->contains(edge.weight)) return false;
    if (f.is_active && edge.is_active != *f.is_active) return false;
    if (f.has_end_date && edge.end_date.has_value() != *f.has_end_date) return false;
    return true;
}

} // namespace

GraphSnapshot applyFilters(const GraphSnapshot& snapshot, const FilterCriteria& criteria,
                           const FilterOptions& options) {
    const Graph& source = snapshot.graph;
    const auto degrees = computeDegrees(source);

    std::vector<const Node*> nodes;
    std::unordered_set<NodeId> kept_nodes;
    for (size_t i = 0; i < source.nodeCount(); i++) {
        const Node& n = source.nodes()[i];
        if (keepNode(n, degrees[i], criteria.node_filters)) {
            nodes.push_back(&n);
            kept_nodes.insert(n.id);
        }
    }

    std::vector<const Edge*> edges;
    for (const Edge& e : source.edges()) {
        if (!keepEdge(e, criteria.edge_filters)) continue;
        if (!kept_nodes.count(e.source) || !kept_nodes.count(e.target)) continue;
        edges.push_back(&e);
    }

    const LayoutFilters& layout = criteria.layout_filters;
    // Isolation is judged before weak edges are removed.
    if (layout.hide_isolated_nodes) {
        std::unordered_set<NodeId> linked;
        for (const Edge* e : edges) {
            linked.insert(e->source);
            linked.insert(e->target);
        }
        nodes.erase(std::remove_if(nodes.begin(), nodes.end(),
                                   [&](const Node* n) { return !linked.count(n->id); }),
                    nodes.end());
    }

    if (layout.hide_weak_connections) {
        edges.erase(std::remove_if(edges.begin(), edges.end(),
                                   [&](const Edge* e) {
                                       return e->weight < options.weak_connection_threshold;
                                   }),
                    edges.end());
    }

    Graph filtered;
    for (const Node* n : nodes) filtered.addNode(*n);
    for (const Edge* e : edges) filtered.addEdge(*e);

    if (layout.show_only_largest_component && filtered.nodeCount() > 0) {
        const Component largest = largestComponent(findConnectedComponents(filtered));
        filtered = filtered.extractSubgraph(
            std::unordered_set<NodeId>(largest.begin(), largest.end()));
    }

    return GraphSnapshot::fromGraph(std::move(filtered));
}

} // namespace clubnet

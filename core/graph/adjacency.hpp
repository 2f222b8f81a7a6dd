#pragma once

#include "graph/graph.hpp"

#include <cstddef>
#include <vector>

namespace clubnet {

/// One direction of an undirected edge, in dense node-index space.
struct AdjacencyLink {
    size_t node = 0;     // neighbor index into Graph::nodes()
    size_t edge = 0;     // index into Graph::edges()
    double weight = 0.0;
};

// ─── AdjacencyList ─────────────────────────────────────────────
// Undirected adjacency shared by connectivity, path finding, analysis
// and recommendation. Each edge contributes one link in each direction,
// appended in edge order, so traversal order is deterministic.

class AdjacencyList {
public:
    explicit AdjacencyList(const Graph& graph);

    size_t size() const { return links_.size(); }
    const std::vector<AdjacencyLink>& neighbors(size_t index) const { return links_[index]; }

    /// Number of incident edges (parallel edges each count).
    size_t degree(size_t index) const { return links_[index].size(); }

private:
    std::vector<std::vector<AdjacencyLink>> links_;
};

/// Degree per node, indexed like Graph::nodes().
std::vector<size_t> computeDegrees(const Graph& graph);

} // namespace clubnet

#pragma once

#include "graph/graph.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace clubnet {

/// Result of a shortest path query. When no path exists, `path`,
/// `edge_ids` and `connection_types` are empty and `exists` is false.
struct GraphPath {
    NodeId source = 0;
    NodeId target = 0;
    std::vector<NodeId> path;
    size_t length = 0;            // hops
    double total_cost = 0.0;      // sum of (100 - weight) along the path
    std::vector<ConnectionType> connection_types;
    std::vector<std::string> edge_ids;
    bool exists = false;
};

struct PathFinderOptions {
    enum class Strategy {
        Auto,        // LinearScan up to heap_threshold nodes, BinaryHeap above
        LinearScan,  // O(V^2) unvisited scan
        BinaryHeap   // O((V + E) log V)
    };

    Strategy strategy = Strategy::Auto;
    size_t heap_threshold = 2000;
};

/// Traversal cost of an edge: strong relationships are cheap.
/// Weights above 100 are clamped to cost 0.
double traversalCost(double weight);

// ─── Path Finder ───────────────────────────────────────────────
// Dijkstra over the undirected club network with cost = 100 - weight.
//
// Ties: the unvisited node with the smallest distance is expanded next;
// among equal distances the one earliest in snapshot node order wins.
// Both strategies apply the same rule and return identical paths.
//
// Unknown or disconnected ids resolve to "no path"; nothing throws.

GraphPath findShortestPath(const Graph& graph, NodeId source, NodeId target,
                           const PathFinderOptions& options = {});

} // namespace clubnet

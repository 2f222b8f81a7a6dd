#pragma once

#include "graph/graph.hpp"

#include <chrono>
#include <cstddef>
#include <memory>

namespace clubnet {

/// Derived statistics of a snapshot. Always computed from the snapshot's
/// own node/edge lists, never carried over from a parent snapshot.
struct GraphMetadata {
    size_t total_nodes = 0;
    size_t total_edges = 0;
    double density = 0.0;          // E / (N(N-1)/2), 0 when N < 2
    size_t connected_components = 0;
    double average_degree = 0.0;
    size_t max_degree = 0;
    size_t min_degree = 0;
    std::chrono::system_clock::time_point generated_at{};
};

/// Immutable-by-convention pairing of a graph and its metadata.
/// Held through SnapshotPtr; edits produce a new snapshot.
struct GraphSnapshot {
    Graph graph;
    GraphMetadata metadata;

    /// Compute metadata for the given graph and wrap both.
    static GraphSnapshot fromGraph(Graph graph);

    /// Snapshot with no nodes or edges. Used as the failed-load fallback.
    static GraphSnapshot empty();
};

using SnapshotPtr = std::shared_ptr<const GraphSnapshot>;

double computeDensity(size_t node_count, size_t edge_count);
GraphMetadata computeMetadata(const Graph& graph);

} // namespace clubnet

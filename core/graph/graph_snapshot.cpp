#include "graph/graph_snapshot.hpp"
#include "graph/adjacency.hpp"
#include "analysis/connectivity.hpp"

#include <algorithm>
#include <numeric>

namespace clubnet {

double computeDensity(size_t node_count, size_t edge_count) {
    if (node_count < 2) return 0.0;
    const double max_edges = static_cast<double>(node_count) * (node_count - 1) / 2.0;
    return static_cast<double>(edge_count) / max_edges;
}

GraphMetadata computeMetadata(const Graph& graph) {
    GraphMetadata meta;
    meta.total_nodes = graph.nodeCount();
    meta.total_edges = graph.edgeCount();
    meta.density = computeDensity(meta.total_nodes, meta.total_edges);
    meta.connected_components = findConnectedComponents(graph).size();
    meta.generated_at = std::chrono::system_clock::now();

    const auto degrees = computeDegrees(graph);
    if (!degrees.empty()) {
        const size_t sum = std::accumulate(degrees.begin(), degrees.end(), size_t{0});
        meta.average_degree = static_cast<double>(sum) / degrees.size();
        auto [mn, mx] = std::minmax_element(degrees.begin(), degrees.end());
        meta.min_degree = *mn;
        meta.max_degree = *mx;
    }
    return meta;
}

GraphSnapshot GraphSnapshot::fromGraph(Graph graph) {
    GraphSnapshot snap;
    snap.metadata = computeMetadata(graph);
    snap.graph = std::move(graph);
    return snap;
}

GraphSnapshot GraphSnapshot::empty() {
    return fromGraph(Graph{});
}

} // namespace clubnet

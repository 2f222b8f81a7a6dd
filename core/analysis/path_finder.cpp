#include "analysis/path_finder.hpp"
#include "graph/adjacency.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <queue>
#include <utility>

namespace clubnet {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr size_t kNone = std::numeric_limits<size_t>::max();

struct DijkstraState {
    std::vector<double> dist;
    std::vector<size_t> prev_node;
    std::vector<size_t> prev_edge;

    explicit DijkstraState(size_t n)
        : dist(n, kInf), prev_node(n, kNone), prev_edge(n, kNone) {}
};

void relax(const AdjacencyList& adjacency, size_t current,
           const std::vector<bool>& visited, DijkstraState& st,
           const std::function<void(size_t)>& on_improved) {
    for (const AdjacencyLink& link : adjacency.neighbors(current)) {
        if (visited[link.node]) continue;
        const double candidate = st.dist[current] + traversalCost(link.weight);
        if (candidate < st.dist[link.node]) {
            st.dist[link.node] = candidate;
            st.prev_node[link.node] = current;
            st.prev_edge[link.node] = link.edge;
            on_improved(link.node);
        }
    }
}

void runLinearScan(const AdjacencyList& adjacency, size_t source, size_t target,
                   DijkstraState& st) {
    const size_t n = adjacency.size();
    std::vector<bool> visited(n, false);
    st.dist[source] = 0.0;

    for (;;) {
        size_t current = kNone;
        double min_distance = kInf;
        for (size_t i = 0; i < n; i++) {
            if (!visited[i] && st.dist[i] < min_distance) {
                min_distance = st.dist[i];
                current = i;
            }
        }
        if (current == kNone) break;
        if (current == target) break;

        visited[current] = true;
        relax(adjacency, current, visited, st, [](size_t) {});
    }
}

void runBinaryHeap(const AdjacencyList& adjacency, size_t source, size_t target,
                   DijkstraState& st) {
    using Entry = std::pair<double, size_t>;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> queue;
    std::vector<bool> visited(adjacency.size(), false);

    st.dist[source] = 0.0;
    queue.push({0.0, source});

    while (!queue.empty()) {
        auto [d, current] = queue.top();
        queue.pop();
        if (visited[current] || d > st.dist[current]) continue;
        if (current == target) break;

        visited[current] = true;
        relax(adjacency, current, visited, st, [&](size_t node) {
            queue.push({st.dist[node], node});
        });
    }
}

} // namespace

double traversalCost(double weight) {
    return std::max(0.0, 100.0 - weight);
}

GraphPath findShortestPath(const Graph& graph, NodeId source, NodeId target,
                           const PathFinderOptions& options) {
    GraphPath result;
    result.source = source;
    result.target = target;

    if (!graph.hasNode(source) || !graph.hasNode(target)) {
        CLUBNET_LOG_DEBUG("path %llu -> %llu: unknown endpoint",
                          static_cast<unsigned long long>(source),
                          static_cast<unsigned long long>(target));
        return result;
    }
    if (source == target) {
        result.path = {source};
        result.exists = true;
        return result;
    }

    const AdjacencyList adjacency(graph);
    const size_t s = graph.indexOf(source);
    const size_t t = graph.indexOf(target);
    DijkstraState st(adjacency.size());

    bool use_heap = false;
    switch (options.strategy) {
        case PathFinderOptions::Strategy::Auto:
            use_heap = graph.nodeCount() > options.heap_threshold;
            break;
        case PathFinderOptions::Strategy::LinearScan:
            use_heap = false;
            break;
        case PathFinderOptions::Strategy::BinaryHeap:
            use_heap = true;
            break;
    }
    if (use_heap) {
        runBinaryHeap(adjacency, s, t, st);
    } else {
        runLinearScan(adjacency, s, t, st);
    }

    if (st.dist[t] == kInf) return result;

    // Walk predecessors back to the source
    const auto& nodes = graph.nodes();
    const auto& edges = graph.edges();
    std::vector<size_t> node_trail;
    std::vector<size_t> edge_trail;
    for (size_t cur = t; cur != s; cur = st.prev_node[cur]) {
        node_trail.push_back(cur);
        edge_trail.push_back(st.prev_edge[cur]);
    }
    node_trail.push_back(s);
    std::reverse(node_trail.begin(), node_trail.end());
    std::reverse(edge_trail.begin(), edge_trail.end());

    for (size_t idx : node_trail) result.path.push_back(nodes[idx].id);
    for (size_t idx : edge_trail) {
        result.edge_ids.push_back(edges[idx].id);
        result.connection_types.push_back(edges[idx].type);
    }
    result.length = result.path.size() - 1;
    result.total_cost = st.dist[t];
    result.exists = true;
    return result;
}

} // namespace clubnet

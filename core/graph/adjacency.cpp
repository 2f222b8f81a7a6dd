#include "graph/adjacency.hpp"

namespace clubnet {

AdjacencyList::AdjacencyList(const Graph& graph)
    : links_(graph.nodeCount()) {
    const auto& edges = graph.edges();
    for (size_t e = 0; e < edges.size(); e++) {
        const size_t s = graph.indexOf(edges[e].source);
        const size_t t = graph.indexOf(edges[e].target);
        links_[s].push_back({t, e, edges[e].weight});
        links_[t].push_back({s, e, edges[e].weight});
    }
}

std::vector<size_t> computeDegrees(const Graph& graph) {
    std::vector<size_t> degrees(graph.nodeCount(), 0);
    for (const Edge& e : graph.edges()) {
        degrees[graph.indexOf(e.source)]++;
        degrees[graph.indexOf(e.target)]++;
    }
    return degrees;
}

} // namespace clubnet

#include "analysis/graph_analyzer.hpp"
#include "analysis/connectivity.hpp"
#include "graph/adjacency.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <unordered_set>

namespace clubnet {

namespace {

using SimpleAdjacency = std::vector<std::vector<size_t>>;

// Neighbor lists with parallel edges collapsed, first-seen order.
SimpleAdjacency collapseParallel(const AdjacencyList& adjacency) {
    SimpleAdjacency out(adjacency.size());
    for (size_t i = 0; i < adjacency.size(); i++) {
        std::unordered_set<size_t> seen;
        for (const auto& link : adjacency.neighbors(i)) {
            if (seen.insert(link.node).second) out[i].push_back(link.node);
        }
    }
    return out;
}

std::vector<int> bfsDistances(const SimpleAdjacency& adj, size_t source) {
    std::vector<int> dist(adj.size(), -1);
    std::deque<size_t> q;
    dist[source] = 0;
    q.push_back(source);
    while (!q.empty()) {
        size_t u = q.front();
        q.pop_front();
        for (size_t v : adj[u]) {
            if (dist[v] == -1) {
                dist[v] = dist[u] + 1;
                q.push_back(v);
            }
        }
    }
    return dist;
}

// Brandes (2001), unweighted. Undirected scores are halved.
std::vector<double> brandesBetweenness(const SimpleAdjacency& adj) {
    const size_t n = adj.size();
    std::vector<double> cb(n, 0.0);

    std::vector<std::vector<size_t>> pred(n);
    std::vector<double> sigma(n);
    std::vector<int> dist(n);
    std::vector<double> delta(n);
    std::vector<size_t> order;
    order.reserve(n);

    for (size_t s = 0; s < n; s++) {
        for (auto& p : pred) p.clear();
        std::fill(sigma.begin(), sigma.end(), 0.0);
        std::fill(dist.begin(), dist.end(), -1);
        std::fill(delta.begin(), delta.end(), 0.0);
        order.clear();

        sigma[s] = 1.0;
        dist[s] = 0;
        std::deque<size_t> q{s};
        while (!q.empty()) {
            size_t v = q.front();
            q.pop_front();
            order.push_back(v);
            for (size_t w : adj[v]) {
                if (dist[w] < 0) {
                    dist[w] = dist[v] + 1;
                    q.push_back(w);
                }
                if (dist[w] == dist[v] + 1) {
                    sigma[w] += sigma[v];
                    pred[w].push_back(v);
                }
            }
        }

        for (auto it = order.rbegin(); it != order.rend(); ++it) {
            size_t w = *it;
            for (size_t v : pred[w]) {
                delta[v] += (sigma[v] / sigma[w]) * (1.0 + delta[w]);
            }
            if (w != s) cb[w] += delta[w];
        }
    }

    for (double& v : cb) v /= 2.0;
    return cb;
}

// Power iteration on (A + I); same dominant eigenvector as A but
// converges on bipartite graphs too.
std::vector<double> eigenvectorCentrality(const AdjacencyList& adjacency,
                                          int max_iterations, double tolerance) {
    const size_t n = adjacency.size();
    std::vector<double> x(n, n > 0 ? 1.0 / std::sqrt(static_cast<double>(n)) : 0.0);
    std::vector<double> next(n);

    for (int iter = 0; iter < max_iterations; iter++) {
        for (size_t i = 0; i < n; i++) {
            double sum = x[i];
            for (const auto& link : adjacency.neighbors(i)) sum += x[link.node];
            next[i] = sum;
        }
        double norm = 0.0;
        for (double v : next) norm += v * v;
        norm = std::sqrt(norm);
        if (norm == 0.0) break;
        for (double& v : next) v /= norm;

        double change = 0.0;
        for (size_t i = 0; i < n; i++) change += std::abs(next[i] - x[i]);
        x.swap(next);
        if (change < tolerance * static_cast<double>(n)) break;
    }
    return x;
}

double localClustering(const SimpleAdjacency& adj, size_t node) {
    const auto& nbrs = adj[node];
    const size_t k = nbrs.size();
    if (k < 2) return 0.0;

    std::unordered_set<size_t> nbr_set(nbrs.begin(), nbrs.end());
    size_t links = 0;
    for (size_t u : nbrs) {
        for (size_t w : adj[u]) {
            if (nbr_set.count(w)) links++;
        }
    }
    // each triangle edge counted twice
    return static_cast<double>(links) / static_cast<double>(k * (k - 1));
}

void fillExact(const Graph& graph, const AnalysisOptions& options,
               GraphAnalysisReport& report) {
    const AdjacencyList adjacency(graph);
    const SimpleAdjacency simple = collapseParallel(adjacency);
    const auto& nodes = graph.nodes();
    const size_t n = nodes.size();

    size_t diameter = 0;
    double path_sum = 0.0;
    size_t path_pairs = 0;
    double clustering_sum = 0.0;

    for (size_t i = 0; i < n; i++) {
        const auto dist = bfsDistances(simple, i);
        size_t reachable = 0;
        double total = 0.0;
        for (size_t j = 0; j < n; j++) {
            if (j == i || dist[j] < 0) continue;
            reachable++;
            total += dist[j];
            diameter = std::max(diameter, static_cast<size_t>(dist[j]));
        }
        path_sum += total;
        path_pairs += reachable;

        double closeness = 0.0;
        if (reachable > 0 && total > 0.0 && n > 1) {
            closeness = (reachable / total) * (static_cast<double>(reachable) / (n - 1));
        }
        report.centrality.closeness[nodes[i].id] = closeness;

        clustering_sum += localClustering(simple, i);
    }

    const auto betweenness = brandesBetweenness(simple);
    const auto eigen = eigenvectorCentrality(adjacency, options.eigen_max_iterations,
                                             options.eigen_tolerance);
    for (size_t i = 0; i < n; i++) {
        report.centrality.betweenness[nodes[i].id] = betweenness[i];
        report.centrality.eigenvector[nodes[i].id] = graph.edgeCount() > 0 ? eigen[i] : 0.0;
    }

    report.network.diameter = diameter;
    report.network.average_path_length = path_pairs > 0 ? path_sum / path_pairs : 0.0;
    report.network.clustering_coefficient = n > 0 ? clustering_sum / n : 0.0;

    // Newman modularity of the component partition
    const double m = static_cast<double>(graph.edgeCount());
    if (m > 0.0) {
        const auto degrees = computeDegrees(graph);
        std::unordered_map<NodeId, size_t> community_of;
        for (const auto& c : report.communities.communities) {
            for (NodeId id : c.nodes) community_of[id] = c.id;
        }
        std::vector<double> internal(report.communities.communities.size(), 0.0);
        for (const Edge& e : graph.edges()) {
            if (community_of[e.source] == community_of[e.target]) {
                internal[community_of[e.source]] += 1.0;
            }
        }
        double q = 0.0;
        for (auto& c : report.communities.communities) {
            double degree_sum = 0.0;
            for (NodeId id : c.nodes) degree_sum += degrees[graph.indexOf(id)];
            const double share = degree_sum / (2.0 * m);
            c.modularity = internal[c.id] / m - share * share;
            q += c.modularity;
        }
        report.communities.modularity = q;
    }
}

} // namespace

std::vector<RankedNode> rankNodes(const Graph& graph,
                                  const std::unordered_map<NodeId, double>& values,
                                  size_t n) {
    std::vector<RankedNode> ranked;
    ranked.reserve(graph.nodeCount());
    for (const Node& node : graph.nodes()) {
        auto it = values.find(node.id);
        ranked.push_back({node.id, it != values.end() ? it->second : 0.0});
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const RankedNode& a, const RankedNode& b) { return a.value > b.value; });
    if (ranked.size() > n) ranked.resize(n);
    return ranked;
}

GraphAnalysisReport analyze(const GraphSnapshot& snapshot, const AnalysisOptions& options) {
    const Graph& graph = snapshot.graph;
    GraphAnalysisReport report;

    const auto degrees = computeDegrees(graph);
    const auto components = findConnectedComponents(graph);

    report.network.node_count = graph.nodeCount();
    report.network.edge_count = graph.edgeCount();
    report.network.density = computeDensity(graph.nodeCount(), graph.edgeCount());
    report.network.connected_components = components.size();
    report.network.isolated_nodes = static_cast<size_t>(
        std::count_if(components.begin(), components.end(),
                      [](const Component& c) { return c.size() == 1; }));

    report.centrality.mode = options.centrality_mode;
    for (size_t i = 0; i < graph.nodeCount(); i++) {
        const NodeId id = graph.nodes()[i].id;
        const double degree = static_cast<double>(degrees[i]);
        report.centrality.degree[id] = degree;
        if (options.centrality_mode == CentralityMode::Approximate) {
            report.centrality.betweenness[id] = degree;
            report.centrality.closeness[id] = degree;
            report.centrality.eigenvector[id] = degree;
        }
    }

    auto& comm = report.communities;
    for (size_t i = 0; i < components.size(); i++) {
        comm.communities.push_back({i, components[i], components[i].size(), 0.0});
    }
    comm.total_communities = components.size();
    if (!components.empty()) {
        comm.average_community_size =
            static_cast<double>(graph.nodeCount()) / static_cast<double>(components.size());
    }

    if (options.centrality_mode == CentralityMode::Exact) {
        fillExact(graph, options, report);
    }

    const auto& c = report.centrality;
    report.top_nodes.most_connected = rankNodes(graph, c.degree, options.top_n);
    report.top_nodes.most_central = rankNodes(graph, c.betweenness, options.top_n);
    report.top_nodes.bridges = rankNodes(graph, c.closeness, options.top_n);
    report.top_nodes.hubs = rankNodes(graph, c.eigenvector, options.top_n);
    return report;
}

} // namespace clubnet

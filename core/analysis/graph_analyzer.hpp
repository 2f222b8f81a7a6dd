#pragma once

#include "graph/graph_snapshot.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace clubnet {

/// How betweenness / closeness / eigenvector values are produced.
enum class CentralityMode {
    Approximate,  // all three equal the node degree; modularity 0
    Exact         // Brandes betweenness, BFS closeness, power-iteration eigenvector
};

struct AnalysisOptions {
    CentralityMode centrality_mode = CentralityMode::Approximate;
    size_t top_n = 10;
    int eigen_max_iterations = 100;
    double eigen_tolerance = 1e-6;
};

struct NetworkMetrics {
    size_t node_count = 0;
    size_t edge_count = 0;
    double density = 0.0;
    size_t diameter = 0;               // Exact mode only
    double average_path_length = 0.0;  // Exact mode only
    double clustering_coefficient = 0.0;  // Exact mode only
    size_t connected_components = 0;
    size_t isolated_nodes = 0;
};

struct CentralityMeasures {
    CentralityMode mode = CentralityMode::Approximate;
    std::unordered_map<NodeId, double> degree;
    std::unordered_map<NodeId, double> betweenness;
    std::unordered_map<NodeId, double> closeness;
    std::unordered_map<NodeId, double> eigenvector;
};

struct Community {
    size_t id = 0;
    std::vector<NodeId> nodes;
    size_t size = 0;
    double modularity = 0.0;  // this community's share of Q
};

struct CommunityReport {
    std::string algorithm = "connected-components";
    std::vector<Community> communities;
    size_t total_communities = 0;
    double average_community_size = 0.0;
    double modularity = 0.0;
};

struct RankedNode {
    NodeId node_id = 0;
    double value = 0.0;
};

struct TopNodes {
    std::vector<RankedNode> most_connected;  // by degree
    std::vector<RankedNode> most_central;    // by betweenness
    std::vector<RankedNode> bridges;         // by closeness
    std::vector<RankedNode> hubs;            // by eigenvector
};

struct GraphAnalysisReport {
    NetworkMetrics network;
    CentralityMeasures centrality;
    CommunityReport communities;
    TopNodes top_nodes;
};

// ─── Graph Analyzer ────────────────────────────────────────────
// Pure function of a snapshot. Communities are the connected
// components. Rankings are descending and stable by node order.

GraphAnalysisReport analyze(const GraphSnapshot& snapshot, const AnalysisOptions& options = {});

/// Top `n` nodes by value, descending; equal values keep node order.
std::vector<RankedNode> rankNodes(const Graph& graph,
                                  const std::unordered_map<NodeId, double>& values,
                                  size_t n);

} // namespace clubnet

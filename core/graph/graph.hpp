#pragma once

#include "graph/node.hpp"
#include "graph/edge.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace clubnet {

// ─── Graph ─────────────────────────────────────────────────────
// The club network G = (N, E). Nodes and edges keep insertion order,
// which every analysis relies on for deterministic tie-breaking.
// Id lookups go through hash indexes into the ordered vectors.
//
// Builder-style: nodes and edges are only ever added. Derived views
// (filters, subgraphs) produce a new Graph.

class Graph {
public:
    Graph() = default;

    // ── Node operations ──
    void addNode(Node node);
    const Node* getNode(NodeId id) const;
    bool hasNode(NodeId id) const { return node_index_.count(id) > 0; }
    std::vector<NodeId> getNodeIds() const;
    size_t nodeCount() const { return nodes_.size(); }
    const std::vector<Node>& nodes() const { return nodes_; }

    /// Position of the node in insertion order, or nodeCount() if absent.
    size_t indexOf(NodeId id) const;

    // ── Edge operations ──
    void addEdge(Edge edge);
    const Edge* getEdge(const std::string& id) const;
    bool hasEdge(const std::string& id) const { return edge_index_.count(id) > 0; }
    size_t edgeCount() const { return edges_.size(); }
    const std::vector<Edge>& edges() const { return edges_; }

    // ── Adjacency queries ──
    /// Distinct neighbors in first-seen edge order.
    std::vector<NodeId> getNeighborNodes(NodeId node_id) const;
    bool areConnected(NodeId a, NodeId b) const;

    // ── Subgraph extraction ──
    /// Keeps the listed nodes and every edge with both endpoints kept.
    Graph extractSubgraph(const std::unordered_set<NodeId>& node_ids) const;

    // ── Iteration ──
    void forEachNode(const std::function<void(const Node&)>& fn) const;
    void forEachEdge(const std::function<void(const Edge&)>& fn) const;

private:
    std::vector<Node> nodes_;
    std::vector<Edge> edges_;
    std::unordered_map<NodeId, size_t> node_index_;
    std::unordered_map<std::string, size_t> edge_index_;

    // node id → indexes into edges_
    std::unordered_map<NodeId, std::vector<size_t>> incident_;
};

} // namespace clubnet

#include "graph/graph.hpp"

#include <stdexcept>

namespace clubnet {

// ─── Node operations ───────────────────────────────────────────

void Graph::addNode(Node node) {
    if (node_index_.count(node.id)) {
        throw std::invalid_argument("Node ID already exists: " + std::to_string(node.id));
    }
    node_index_.emplace(node.id, nodes_.size());
    incident_[node.id];  // ensure entry exists
    nodes_.push_back(std::move(node));
}

const Node* Graph::getNode(NodeId id) const {
    auto it = node_index_.find(id);
    return it != node_index_.end() ? &nodes_[it->second] : nullptr;
}

std::vector<NodeId> Graph::getNodeIds() const {
    std::vector<NodeId> ids;
    ids.reserve(nodes_.size());
    for (const auto& node : nodes_) {
        ids.push_back(node.id);
    }
    return ids;
}

size_t Graph::indexOf(NodeId id) const {
    auto it = node_index_.find(id);
    return it != node_index_.end() ? it->second : nodes_.size();
}

// ─── Edge operations ───────────────────────────────────────────

void Graph::addEdge(Edge edge) {
    if (edge_index_.count(edge.id))
        throw std::invalid_argument("Edge ID already exists: " + edge.id);
    if (edge.source == edge.target)
        throw std::invalid_argument("Self-loop rejected for edge " + edge.id);
    if (!node_index_.count(edge.source))
        throw std::runtime_error("Source node not found: " + std::to_string(edge.source));
    if (!node_index_.count(edge.target))
        throw std::runtime_error("Target node not found: " + std::to_string(edge.target));

    const size_t idx = edges_.size();
    edge_index_.emplace(edge.id, idx);
    incident_[edge.source].push_back(idx);
    incident_[edge.target].push_back(idx);
    edges_.push_back(std::move(edge));
}

const Edge* Graph::getEdge(const std::string& id) const {
    auto it = edge_index_.find(id);
    return it != edge_index_.end() ? &edges_[it->second] : nullptr;
}

// ─── Adjacency queries ────────────────────────────────────────

std::vector<NodeId> Graph::getNeighborNodes(NodeId node_id) const {
    auto it = incident_.find(node_id);
    if (it == incident_.end()) return {};

    std::vector<NodeId> neighbors;
    std::unordered_set<NodeId> seen;
    for (size_t eidx : it->second) {
        NodeId other = edges_[eidx].opposite(node_id);
        if (seen.insert(other).second) {
            neighbors.push_back(other);
        }
    }
    return neighbors;
}

bool Graph::areConnected(NodeId a, NodeId b) const {
    auto it = incident_.find(a);
    if (it == incident_.end()) return false;
    for (size_t eidx : it->second) {
        if (edges_[eidx].opposite(a) == b) return true;
    }
    return false;
}

// ─── Subgraph extraction ──────────────────────────────────────

Graph Graph::extractSubgraph(const std::unordered_set<NodeId>& node_ids) const {
    Graph sub;
    for (const Node& n : nodes_) {
        if (node_ids.count(n.id)) sub.addNode(n);
    }
    for (const Edge& e : edges_) {
        if (node_ids.count(e.source) && node_ids.count(e.target)) {
            sub.addEdge(e);
        }
    }
    return sub;
}

// ─── Iteration ─────────────────────────────────────────────────

void Graph::forEachNode(const std::function<void(const Node&)>& fn) const {
    for (const auto& node : nodes_) {
        fn(node);
    }
}

void Graph::forEachEdge(const std::function<void(const Edge&)>& fn) const {
    for (const auto& edge : edges_) {
        fn(edge);
    }
}

} // namespace clubnet

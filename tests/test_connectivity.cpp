#include <gtest/gtest.h>
#include "analysis/connectivity.hpp"

#include <algorithm>
#include <set>

using namespace clubnet;

namespace {

Graph chainGraph(size_t n) {
    Graph g;
    for (NodeId id = 1; id <= n; id++) g.addNode(Node(id, "n"));
    for (NodeId id = 1; id < n; id++) {
        g.addEdge(Edge("e" + std::to_string(id), id, id + 1));
    }
    return g;
}

} // namespace

// ─── Connected Components ──────────────────────────────────────

TEST(ConnectivityTest, EmptyGraphHasNoComponents) {
    Graph g;
    EXPECT_TRUE(findConnectedComponents(g).empty());
    EXPECT_TRUE(largestComponent({}).empty());
}

TEST(ConnectivityTest, ComponentsInNodeOrder) {
    Graph g;
    for (NodeId id : {1, 2, 3, 4, 5}) g.addNode(Node(id, "n"));
    g.addEdge(Edge("a", 1, 3));
    g.addEdge(Edge("b", 2, 4));

    auto components = findConnectedComponents(g);
    ASSERT_EQ(components.size(), 3u);
    EXPECT_EQ(components[0], (Component{1, 3}));
    EXPECT_EQ(components[1], (Component{2, 4}));
    EXPECT_EQ(components[2], (Component{5}));
}

TEST(ConnectivityTest, ComponentsPartitionNodes) {
    Graph g;
    for (NodeId id = 1; id <= 20; id++) g.addNode(Node(id, "n"));
    for (NodeId id = 1; id + 3 <= 20; id += 3) {
        g.addEdge(Edge("e" + std::to_string(id), id, id + 3));
    }

    auto components = findConnectedComponents(g);
    std::set<NodeId> seen;
    size_t total = 0;
    for (const auto& c : components) {
        EXPECT_FALSE(c.empty());
        for (NodeId id : c) {
            EXPECT_TRUE(seen.insert(id).second) << "node " << id << " in two components";
        }
        total += c.size();
    }
    EXPECT_EQ(total, g.nodeCount());
}

TEST(ConnectivityTest, DeepChainDoesNotRecurse) {
    Graph g = chainGraph(50000);
    auto components = findConnectedComponents(g);
    ASSERT_EQ(components.size(), 1u);
    EXPECT_EQ(components[0].size(), 50000u);
}

TEST(ConnectivityTest, DeterministicForSameInput) {
    Graph g = chainGraph(30);
    g.addNode(Node(100, "lone"));
    EXPECT_EQ(findConnectedComponents(g), findConnectedComponents(g));
}

// ─── Largest Component ─────────────────────────────────────────

TEST(ConnectivityTest, LargestComponentTieGoesToFirst) {
    std::vector<Component> components = {{1, 2}, {3, 4}, {5}};
    EXPECT_EQ(largestComponent(components), (Component{1, 2}));

    components.push_back({6, 7, 8});
    EXPECT_EQ(largestComponent(components), (Component{6, 7, 8}));
}

#include <gtest/gtest.h>
#include "analysis/path_finder.hpp"

using namespace clubnet;

namespace {

Graph diamond() {
    // 1 -(90)- 2 -(90)- 4      cost 10 + 10 = 20
    // 1 -(60)- 3 -(95)- 4      cost 40 + 5  = 45
    Graph g;
    for (NodeId id : {1, 2, 3, 4}) g.addNode(Node(id, "n"));
    g.addEdge(Edge("12", 1, 2, ConnectionType::Rivalry, 90.0));
    g.addEdge(Edge("24", 2, 4, ConnectionType::Historical, 90.0));
    g.addEdge(Edge("13", 1, 3, ConnectionType::Friendly, 60.0));
    g.addEdge(Edge("34", 3, 4, ConnectionType::Partnership, 95.0));
    return g;
}

PathFinderOptions strategy(PathFinderOptions::Strategy s) {
    PathFinderOptions options;
    options.strategy = s;
    return options;
}

} // namespace

// ─── Edge Cases ────────────────────────────────────────────────

TEST(PathFinderTest, SameNodeIsTrivialPath) {
    Graph g = diamond();
    auto path = findShortestPath(g, 3, 3);
    EXPECT_TRUE(path.exists);
    EXPECT_EQ(path.path, (std::vector<NodeId>{3}));
    EXPECT_DOUBLE_EQ(path.total_cost, 0.0);
    EXPECT_EQ(path.length, 0u);
}

TEST(PathFinderTest, UnknownNodeHasNoPath) {
    Graph g = diamond();
    auto path = findShortestPath(g, 1, 99);
    EXPECT_FALSE(path.exists);
    EXPECT_TRUE(path.path.empty());
    EXPECT_EQ(path.source, 1u);
    EXPECT_EQ(path.target, 99u);

    EXPECT_FALSE(findShortestPath(g, 99, 99).exists);
}

TEST(PathFinderTest, DisconnectedComponentsHaveNoPath) {
    // nodes {1:A L1, 2:B L1, 3:C L2}, edge 1-2 weight 80
    Graph g;
    for (NodeId id : {1, 2, 3}) g.addNode(Node(id, "n"));
    g.addEdge(Edge("12", 1, 2, ConnectionType::Friendly, 80.0));

    auto path = findShortestPath(g, 1, 3);
    EXPECT_FALSE(path.exists);
    EXPECT_TRUE(path.path.empty());
    EXPECT_TRUE(path.edge_ids.empty());
}

// ─── Weighted Routing ──────────────────────────────────────────

TEST(PathFinderTest, PrefersStrongRelationships) {
    Graph g = diamond();
    auto path = findShortestPath(g, 1, 4);
    ASSERT_TRUE(path.exists);
    EXPECT_EQ(path.path, (std::vector<NodeId>{1, 2, 4}));
    EXPECT_DOUBLE_EQ(path.total_cost, 20.0);
    EXPECT_EQ(path.length, 2u);
    EXPECT_EQ(path.edge_ids, (std::vector<std::string>{"12", "24"}));
    ASSERT_EQ(path.connection_types.size(), 2u);
    EXPECT_EQ(path.connection_types[0], ConnectionType::Rivalry);
    EXPECT_EQ(path.connection_types[1], ConnectionType::Historical);
}

TEST(PathFinderTest, UndirectedTraversal) {
    Graph g = diamond();
    auto path = findShortestPath(g, 4, 1);
    ASSERT_TRUE(path.exists);
    EXPECT_EQ(path.path, (std::vector<NodeId>{4, 2, 1}));
}

TEST(PathFinderTest, ParallelEdgeTakesCheaper) {
    Graph g;
    g.addNode(Node(1, "a"));
    g.addNode(Node(2, "b"));
    g.addEdge(Edge("weak", 1, 2, ConnectionType::Friendly, 20.0));
    g.addEdge(Edge("strong", 2, 1, ConnectionType::Rivalry, 85.0));

    auto path = findShortestPath(g, 1, 2);
    ASSERT_TRUE(path.exists);
    EXPECT_EQ(path.edge_ids, (std::vector<std::string>{"strong"}));
    EXPECT_DOUBLE_EQ(path.total_cost, 15.0);
}

TEST(PathFinderTest, CostClampedAboveFullWeight) {
    EXPECT_DOUBLE_EQ(traversalCost(100.0), 0.0);
    EXPECT_DOUBLE_EQ(traversalCost(130.0), 0.0);
    EXPECT_DOUBLE_EQ(traversalCost(30.0), 70.0);
}

// ─── Strategies ────────────────────────────────────────────────

TEST(PathFinderTest, StrategiesAgreeOnTies) {
    // Two equal-cost routes 1-2-4 and 1-3-4; node order decides.
    Graph g;
    for (NodeId id : {1, 2, 3, 4}) g.addNode(Node(id, "n"));
    g.addEdge(Edge("13", 1, 3, ConnectionType::Friendly, 50.0));
    g.addEdge(Edge("12", 1, 2, ConnectionType::Friendly, 50.0));
    g.addEdge(Edge("34", 3, 4, ConnectionType::Friendly, 50.0));
    g.addEdge(Edge("24", 2, 4, ConnectionType::Friendly, 50.0));

    auto linear = findShortestPath(g, 1, 4, strategy(PathFinderOptions::Strategy::LinearScan));
    auto heap = findShortestPath(g, 1, 4, strategy(PathFinderOptions::Strategy::BinaryHeap));
    ASSERT_TRUE(linear.exists);
    EXPECT_EQ(linear.path, heap.path);
    EXPECT_EQ(linear.edge_ids, heap.edge_ids);
    EXPECT_DOUBLE_EQ(linear.total_cost, heap.total_cost);
    EXPECT_DOUBLE_EQ(linear.total_cost, 100.0);
}

TEST(PathFinderTest, StrategiesAgreeOnLargeGrid) {
    Graph g;
    const NodeId side = 30;
    for (NodeId r = 0; r < side; r++)
        for (NodeId c = 0; c < side; c++) g.addNode(Node(r * side + c + 1, "n"));
    for (NodeId r = 0; r < side; r++) {
        for (NodeId c = 0; c < side; c++) {
            const NodeId id = r * side + c + 1;
            const double w = static_cast<double>((r * 7 + c * 13) % 100);
            if (c + 1 < side) g.addEdge(Edge("h" + std::to_string(id), id, id + 1,
                                             ConnectionType::Friendly, w));
            if (r + 1 < side) g.addEdge(Edge("v" + std::to_string(id), id, id + side,
                                             ConnectionType::Friendly, 100.0 - w));
        }
    }

    auto linear = findShortestPath(g, 1, side * side, strategy(PathFinderOptions::Strategy::LinearScan));
    auto heap = findShortestPath(g, 1, side * side, strategy(PathFinderOptions::Strategy::BinaryHeap));
    ASSERT_TRUE(linear.exists);
    EXPECT_EQ(linear.path, heap.path);
    EXPECT_DOUBLE_EQ(linear.total_cost, heap.total_cost);
}

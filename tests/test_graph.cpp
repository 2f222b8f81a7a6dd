#include <gtest/gtest.h>
#include "graph/graph.hpp"
#include "graph/adjacency.hpp"
#include "graph/graph_snapshot.hpp"
#include "graph/graph_builder.hpp"

#include <numeric>

using namespace clubnet;

namespace {

ClubRecord club(NodeId id, const std::string& name, const std::string& league,
                const std::string& city = "Warszawa") {
    ClubRecord c;
    c.id = id;
    c.name = name;
    c.league = league;
    c.city = city;
    c.founded_year = 1920;
    return c;
}

ConnectionRecord connection(uint64_t id, NodeId s, NodeId t, double weight = 50.0,
                            ConnectionType type = ConnectionType::Friendly) {
    ConnectionRecord r;
    r.id = id;
    r.source_club = s;
    r.target_club = t;
    r.weight = weight;
    r.type = type;
    return r;
}

} // namespace

// ─── Basic Node/Edge operations ────────────────────────────────

TEST(GraphTest, AddAndGetNode) {
    Graph g;
    g.addNode(Node(7, "Legia"));
    ASSERT_EQ(g.nodeCount(), 1);
    const Node* n = g.getNode(7);
    ASSERT_NE(n, nullptr);
    EXPECT_EQ(n->label, "Legia");
    EXPECT_EQ(n->shape, "circle");
    EXPECT_DOUBLE_EQ(n->size, 10.0);
    EXPECT_EQ(g.getNode(8), nullptr);
}

TEST(GraphTest, DuplicateNodeThrows) {
    Graph g;
    g.addNode(Node(1, "A"));
    EXPECT_THROW(g.addNode(Node(1, "B")), std::invalid_argument);
}

TEST(GraphTest, AddAndGetEdge) {
    Graph g;
    g.addNode(Node(1, "A"));
    g.addNode(Node(2, "B"));
    g.addEdge(Edge("connection-1", 1, 2, ConnectionType::Rivalry, 90.0));
    ASSERT_EQ(g.edgeCount(), 1);
    const Edge* e = g.getEdge("connection-1");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->source, 1u);
    EXPECT_EQ(e->target, 2u);
    EXPECT_EQ(e->type, ConnectionType::Rivalry);
    EXPECT_DOUBLE_EQ(e->weight, 90.0);
    EXPECT_TRUE(g.areConnected(2, 1));
}

TEST(GraphTest, SelfLoopRejected) {
    Graph g;
    g.addNode(Node(1, "A"));
    EXPECT_THROW(g.addEdge(Edge("e", 1, 1)), std::invalid_argument);
    EXPECT_EQ(g.edgeCount(), 0);
}

TEST(GraphTest, DanglingEndpointRejected) {
    Graph g;
    g.addNode(Node(1, "A"));
    EXPECT_THROW(g.addEdge(Edge("e", 1, 99)), std::runtime_error);
    EXPECT_THROW(g.addEdge(Edge("e", 99, 1)), std::runtime_error);
}

TEST(GraphTest, DuplicateEdgeIdRejected) {
    Graph g;
    g.addNode(Node(1, "A"));
    g.addNode(Node(2, "B"));
    g.addEdge(Edge("e", 1, 2));
    EXPECT_THROW(g.addEdge(Edge("e", 2, 1)), std::invalid_argument);
}

TEST(GraphTest, InsertionOrderPreserved) {
    Graph g;
    for (NodeId id : {5, 3, 9, 1}) g.addNode(Node(id, "n"));
    std::vector<NodeId> expected = {5, 3, 9, 1};
    EXPECT_EQ(g.getNodeIds(), expected);
    EXPECT_EQ(g.indexOf(9), 2u);
    EXPECT_EQ(g.indexOf(42), g.nodeCount());
}

TEST(GraphTest, NeighborsAreDistinct) {
    Graph g;
    for (NodeId id : {1, 2, 3}) g.addNode(Node(id, "n"));
    g.addEdge(Edge("a", 1, 2));
    g.addEdge(Edge("b", 2, 1));  // parallel
    g.addEdge(Edge("c", 3, 1));

    auto neighbors = g.getNeighborNodes(1);
    std::vector<NodeId> expected = {2, 3};
    EXPECT_EQ(neighbors, expected);
    EXPECT_TRUE(g.getNeighborNodes(42).empty());
}

// ─── Subgraph Extraction ───────────────────────────────────────

TEST(GraphTest, ExtractSubgraphKeepsInternalEdges) {
    Graph g;
    for (NodeId id : {1, 2, 3, 4}) g.addNode(Node(id, "n"));
    g.addEdge(Edge("12", 1, 2));
    g.addEdge(Edge("23", 2, 3));
    g.addEdge(Edge("34", 3, 4));

    Graph sub = g.extractSubgraph({2, 3, 4});
    EXPECT_EQ(sub.nodeCount(), 3u);
    EXPECT_EQ(sub.edgeCount(), 2u);
    EXPECT_FALSE(sub.hasEdge("12"));
    EXPECT_TRUE(sub.hasEdge("23"));
    EXPECT_EQ(g.nodeCount(), 4u);
}

// ─── Adjacency ─────────────────────────────────────────────────

TEST(AdjacencyTest, DegreeSumIsTwiceEdgeCount) {
    Graph g;
    for (NodeId id : {1, 2, 3, 4}) g.addNode(Node(id, "n"));
    g.addEdge(Edge("12", 1, 2));
    g.addEdge(Edge("13", 1, 3));
    g.addEdge(Edge("23", 2, 3));

    auto degrees = computeDegrees(g);
    EXPECT_EQ(std::accumulate(degrees.begin(), degrees.end(), size_t{0}), 2 * g.edgeCount());
    EXPECT_EQ(degrees[3], 0u);

    AdjacencyList adj(g);
    ASSERT_EQ(adj.size(), 4u);
    EXPECT_EQ(adj.degree(0), 2u);
    EXPECT_EQ(adj.neighbors(0)[0].node, 1u);
    EXPECT_EQ(adj.neighbors(0)[1].node, 2u);
}

// ─── Snapshot Metadata ─────────────────────────────────────────

TEST(SnapshotTest, MetadataFromGraph) {
    Graph g;
    for (NodeId id : {1, 2, 3, 4}) g.addNode(Node(id, "n"));
    g.addEdge(Edge("12", 1, 2));
    g.addEdge(Edge("23", 2, 3));

    auto snap = GraphSnapshot::fromGraph(g);
    EXPECT_EQ(snap.metadata.total_nodes, 4u);
    EXPECT_EQ(snap.metadata.total_edges, 2u);
    EXPECT_DOUBLE_EQ(snap.metadata.density, 2.0 / 6.0);
    EXPECT_EQ(snap.metadata.connected_components, 2u);
    EXPECT_DOUBLE_EQ(snap.metadata.average_degree, 1.0);
    EXPECT_EQ(snap.metadata.max_degree, 2u);
    EXPECT_EQ(snap.metadata.min_degree, 0u);
}

TEST(SnapshotTest, DensityZeroBelowTwoNodes) {
    EXPECT_DOUBLE_EQ(computeDensity(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(computeDensity(1, 0), 0.0);
    EXPECT_DOUBLE_EQ(computeDensity(2, 1), 1.0);
}

TEST(SnapshotTest, EmptySnapshot) {
    auto snap = GraphSnapshot::empty();
    EXPECT_EQ(snap.graph.nodeCount(), 0u);
    EXPECT_EQ(snap.metadata.connected_components, 0u);
    EXPECT_DOUBLE_EQ(snap.metadata.average_degree, 0.0);
}

// ─── Connection Types ──────────────────────────────────────────

TEST(EdgeTest, ParseConnectionTypeSpellings) {
    EXPECT_EQ(parseConnectionType("player-transfer"), ConnectionType::PlayerTransfer);
    EXPECT_EQ(parseConnectionType("player_transfer"), ConnectionType::PlayerTransfer);
    EXPECT_EQ(parseConnectionType("RIVALRY"), ConnectionType::Rivalry);
    EXPECT_EQ(parseConnectionType("youth_development"), ConnectionType::YouthDevelopment);
    EXPECT_FALSE(parseConnectionType("sponsorship").has_value());
    EXPECT_EQ(toString(ConnectionType::CoachingStaff), "coaching-staff");
}

TEST(EdgeTest, VeryStrongMapsToStrong) {
    EXPECT_EQ(parseConnectionStrength("very_strong"), ConnectionStrength::Strong);
    EXPECT_EQ(parseConnectionStrength("moderate"), ConnectionStrength::Moderate);
    EXPECT_FALSE(parseConnectionStrength("extreme").has_value());
}

TEST(EdgeTest, EdgeIdFromRecordId) {
    EXPECT_EQ(edgeIdFor(42), "connection-42");
}

// ─── Graph Builder ─────────────────────────────────────────────

TEST(GraphBuilderTest, BuildsNodesWithLeagueColorsAndPositions) {
    auto legia = club(1, "Legia", "Ekstraklasa");
    legia.latitude = 52.25;
    legia.longitude = 21.0;
    auto other = club(2, "Nowhere FC", "Liga Okręgowa");

    auto result = buildGraph({legia, other}, {});
    const Graph& g = result.snapshot.graph;
    ASSERT_EQ(g.nodeCount(), 2u);

    const Node* n1 = g.getNode(1);
    EXPECT_EQ(n1->color, "#e53e3e");
    ASSERT_TRUE(n1->position.has_value());
    EXPECT_DOUBLE_EQ(n1->position->x, 21000.0);
    EXPECT_DOUBLE_EQ(n1->position->y, 52250.0);

    const Node* n2 = g.getNode(2);
    EXPECT_EQ(n2->color, "#718096");
    EXPECT_FALSE(n2->position.has_value());
}

TEST(GraphBuilderTest, InvalidConnectionsAreDroppedAndReported) {
    std::vector<ClubRecord> clubs = {club(1, "A", "I Liga"), club(2, "B", "I Liga"),
                                     club(3, "C", "II Liga")};
    std::vector<ConnectionRecord> connections = {
        connection(1, 1, 2, 50.0),
        connection(2, 1, 1, 50.0),   // self-loop
        connection(3, 1, 99, 50.0),  // unknown target
        connection(4, 2, 3, 150.0),  // weight out of range
        connection(5, 2, 1, 50.0),   // reverse duplicate of a bidirectional type
    };

    auto result = buildGraph(clubs, connections);
    EXPECT_EQ(result.snapshot.graph.edgeCount(), 1u);
    EXPECT_TRUE(result.snapshot.graph.hasEdge("connection-1"));
    EXPECT_EQ(result.rejected_connections, 4u);
    EXPECT_TRUE(hasErrors(result.issues));
}

TEST(GraphBuilderTest, DuplicateClubReported) {
    auto result = buildGraph({club(1, "A", "I Liga"), club(1, "A again", "I Liga")}, {});
    EXPECT_EQ(result.snapshot.graph.nodeCount(), 1u);
    EXPECT_EQ(result.rejected_clubs, 1u);
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].check_name, "club_unique_id");
}

TEST(GraphBuilderTest, EdgeCarriesRecordMetadata) {
    auto rec = connection(9, 1, 2, 65.0, ConnectionType::Loan);
    rec.strength = ConnectionStrength::Strong;
    rec.start_date = "2020-01-01";
    rec.end_date = "2021-06-30";
    rec.description = "Season-long loan";

    auto result = buildGraph({club(1, "A", "I Liga"), club(2, "B", "I Liga")}, {rec});
    const Edge* e = result.snapshot.graph.getEdge("connection-9");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->type, ConnectionType::Loan);
    EXPECT_EQ(e->strength, ConnectionStrength::Strong);
    EXPECT_EQ(e->end_date, std::optional<std::string>("2021-06-30"));
    EXPECT_EQ(e->description, "Season-long loan");
}

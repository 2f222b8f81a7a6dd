#include <gtest/gtest.h>
#include "analysis/recommendation.hpp"

using namespace clubnet;

namespace {

ClubRecord club(NodeId id, const std::string& league, const std::string& city) {
    ClubRecord c;
    c.id = id;
    c.name = "Club " + std::to_string(id);
    c.league = league;
    c.city = city;
    return c;
}

ClubRecord located(NodeId id, const std::string& league, const std::string& city,
                   double lat, double lon) {
    ClubRecord c = club(id, league, city);
    c.latitude = lat;
    c.longitude = lon;
    return c;
}

GraphSnapshot snapshotOf(const std::vector<ClubRecord>& clubs,
                         std::initializer_list<std::pair<NodeId, NodeId>> links = {}) {
    Graph g;
    for (const auto& c : clubs) g.addNode(Node(c));
    size_t i = 0;
    for (const auto& [s, t] : links) {
        g.addEdge(Edge("e" + std::to_string(i++), s, t));
    }
    return GraphSnapshot::fromGraph(std::move(g));
}

const Recommendation* findTarget(const std::vector<Recommendation>& recs, NodeId target) {
    for (const auto& r : recs) {
        if (r.target_id == target) return &r;
    }
    return nullptr;
}

} // namespace

// ─── Scoring ───────────────────────────────────────────────────

TEST(RecommendationTest, SameLeagueAndCityBonuses) {
    auto snap = snapshotOf({club(1, "Ekstraklasa", "Kraków"), club(2, "Ekstraklasa", "Kraków"),
                            club(3, "Ekstraklasa", "Gdańsk"), club(4, "I Liga", "Kraków")});
    auto recs = recommend(snap, 1);
    ASSERT_EQ(recs.size(), 3u);

    EXPECT_EQ(recs[0].target_id, 2u);
    EXPECT_DOUBLE_EQ(recs[0].score, 55.0);
    EXPECT_TRUE(recs[0].league_match);
    EXPECT_TRUE(recs[0].city_match);
    EXPECT_EQ(recs[0].reasons, (std::vector<std::string>{"Same league", "Same city"}));
    EXPECT_EQ(recs[0].suggested_type, ConnectionType::Geographic);
    EXPECT_EQ(recs[0].suggested_strength, ConnectionStrength::Strong);

    EXPECT_EQ(recs[1].target_id, 3u);
    EXPECT_DOUBLE_EQ(recs[1].score, 30.0);
    EXPECT_EQ(recs[1].suggested_type, ConnectionType::Friendly);
    EXPECT_EQ(recs[1].suggested_strength, ConnectionStrength::Moderate);

    EXPECT_EQ(recs[2].target_id, 4u);
    EXPECT_DOUBLE_EQ(recs[2].score, 25.0);
    EXPECT_EQ(recs[2].suggested_strength, ConnectionStrength::Weak);
}

TEST(RecommendationTest, GeographicProximityBonus) {
    // Warszawa to Pruszków is about 17 km; Warszawa to Gdańsk about 280 km.
    auto snap = snapshotOf({located(1, "A", "Warszawa", 52.2297, 21.0122),
                            located(2, "B", "Pruszków", 52.1706, 20.8119),
                            located(3, "C", "Gdańsk", 54.3520, 18.6466)});
    auto recs = recommend(snap, 1);
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_EQ(recs[0].target_id, 2u);
    EXPECT_DOUBLE_EQ(recs[0].score, 20.0);
    ASSERT_TRUE(recs[0].geographic_distance_km.has_value());
    EXPECT_LT(*recs[0].geographic_distance_km, 50.0);
    EXPECT_EQ(recs[0].suggested_type, ConnectionType::Partnership);
}

TEST(RecommendationTest, MutualNeighborsAddFivePoints) {
    // 1 and 4 share neighbors 2 and 3
    auto snap = snapshotOf({club(1, "A", "a"), club(2, "B", "b"), club(3, "C", "c"),
                            club(4, "D", "d")},
                           {{1, 2}, {1, 3}, {4, 2}, {4, 3}});
    auto recs = recommend(snap, 1);
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_EQ(recs[0].target_id, 4u);
    EXPECT_DOUBLE_EQ(recs[0].score, 10.0);
    EXPECT_EQ(recs[0].mutual_connections, 2u);
    EXPECT_EQ(recs[0].common_neighbors, (std::vector<NodeId>{2, 3}));
    EXPECT_EQ(recs[0].reasons, (std::vector<std::string>{"2 mutual connections"}));
}

TEST(RecommendationTest, HaversineKnownDistance) {
    EXPECT_NEAR(haversineKm(0.0, 0.0, 0.0, 1.0), 111.19, 0.01);
    EXPECT_DOUBLE_EQ(haversineKm(50.0, 20.0, 50.0, 20.0), 0.0);
}

// ─── Exclusions ────────────────────────────────────────────────

TEST(RecommendationTest, ConnectedAndZeroScoreExcluded) {
    // nodes {1:A L1, 2:B L1, 3:C L2}, edge 1-2 weight 80
    Graph g;
    g.addNode(Node(club(1, "L1", "x")));
    g.addNode(Node(club(2, "L1", "y")));
    g.addNode(Node(club(3, "L2", "z")));
    g.addEdge(Edge("e", 1, 2, ConnectionType::Friendly, 80.0));
    auto snap = GraphSnapshot::fromGraph(std::move(g));

    auto recs = recommend(snap, 1);
    EXPECT_EQ(findTarget(recs, 2), nullptr);
    EXPECT_EQ(findTarget(recs, 3), nullptr);
    EXPECT_EQ(findTarget(recs, 1), nullptr);
}

TEST(RecommendationTest, SharedLeagueOutscoresOtherLeague) {
    auto snap = snapshotOf({club(1, "L1", "x"), club(2, "L1", "y"), club(3, "L2", "y")});
    auto recs = recommend(snap, 2);
    const Recommendation* to1 = findTarget(recs, 1);
    ASSERT_NE(to1, nullptr);
    const Recommendation* to3 = findTarget(recs, 3);
    ASSERT_NE(to3, nullptr);
    EXPECT_GT(to1->score, 0.0);
    EXPECT_GT(to3->score, 0.0);
    EXPECT_DOUBLE_EQ(to1->score, 30.0);
    EXPECT_DOUBLE_EQ(to3->score, 25.0);
}

TEST(RecommendationTest, UnknownNodeGivesEmptyList) {
    auto snap = snapshotOf({club(1, "A", "a"), club(2, "A", "a")});
    EXPECT_TRUE(recommend(snap, 99).empty());
}

// ─── Ordering and Limits ───────────────────────────────────────

TEST(RecommendationTest, MaxResultsAndStableTies) {
    std::vector<ClubRecord> clubs = {club(1, "L", "c")};
    for (NodeId id = 2; id <= 15; id++) clubs.push_back(club(id, "L", "other" + std::to_string(id)));
    auto snap = snapshotOf(clubs);

    auto recs = recommend(snap, 1, 5);
    ASSERT_EQ(recs.size(), 5u);
    for (size_t i = 0; i < recs.size(); i++) {
        EXPECT_EQ(recs[i].target_id, static_cast<NodeId>(i + 2));
        EXPECT_DOUBLE_EQ(recs[i].score, 30.0);
    }
    EXPECT_EQ(recommend(snap, 1).size(), 10u);
}

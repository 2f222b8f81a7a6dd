#include <gtest/gtest.h>
#include "config/graph_config.hpp"
#include "config/serialization.hpp"

#include <filesystem>
#include <fstream>

using namespace clubnet;
using nlohmann::json;

namespace {

std::string writeTempFile(const std::string& name, const std::string& contents) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << contents;
    return path.string();
}

} // namespace

// ─── Defaults ──────────────────────────────────────────────────

TEST(ConfigTest, GraphConfigDefaults) {
    GraphConfig config;
    EXPECT_EQ(config.layout.type, "force-directed");
    EXPECT_DOUBLE_EQ(config.nodes.min_size, 5.0);
    EXPECT_DOUBLE_EQ(config.nodes.max_size, 50.0);
    EXPECT_EQ(config.nodes.size_attribute, "degree");
    EXPECT_EQ(config.edges.width_attribute, "weight");
    EXPECT_TRUE(config.interaction.multi_select_enabled);
    EXPECT_EQ(config.animation.duration_ms, 1000);
    EXPECT_EQ(config.animation.easing, "ease-out");
    EXPECT_EQ(availableLayouts().size(), 8u);
    EXPECT_EQ(availableLayouts().front(), "force-directed");
}

TEST(ConfigTest, EngineConfigDefaults) {
    EngineConfig config;
    EXPECT_EQ(config.culling_threshold, 1000u);
    EXPECT_EQ(config.max_visible_nodes, 500u);
    EXPECT_EQ(config.cull_throttle_ms, 16);
    EXPECT_EQ(config.ultra_threshold, 5000u);
    EXPECT_DOUBLE_EQ(config.weak_connection_threshold, 30.0);
    EXPECT_EQ(config.history_capacity, 50u);
}

// ─── GraphConfig JSON ──────────────────────────────────────────

TEST(ConfigTest, GraphConfigRoundTrip) {
    GraphConfig config;
    config.layout.type = "concentric";
    config.layout.options["spacing"] = "40";
    config.nodes.color_scheme = "city";
    config.filters.leagues = {"Ekstraklasa", "I Liga"};
    config.animation.enabled = false;

    json j = config;
    EXPECT_EQ(j["layout"]["type"], "concentric");
    EXPECT_EQ(j["filters"]["leagues"].size(), 2u);

    GraphConfig back = j.get<GraphConfig>();
    EXPECT_EQ(back, config);
    EXPECT_NE(back, GraphConfig{});
}

TEST(ConfigTest, GraphConfigPartialJsonKeepsDefaults) {
    auto config = json::parse(R"({"nodes": {"max_size": 80}, "animation": {"easing": "linear"}})")
                      .get<GraphConfig>();
    EXPECT_DOUBLE_EQ(config.nodes.max_size, 80.0);
    EXPECT_DOUBLE_EQ(config.nodes.min_size, 5.0);
    EXPECT_EQ(config.animation.easing, "linear");
    EXPECT_EQ(config.animation.duration_ms, 1000);
    EXPECT_EQ(config.layout.type, "force-directed");
}

// ─── FilterCriteria JSON ───────────────────────────────────────

TEST(ConfigTest, FilterCriteriaWritesOnlySetFields) {
    FilterCriteria criteria;
    criteria.node_filters.leagues = {"Ekstraklasa"};
    criteria.edge_filters.weight_range = Range<double>{20.0, 80.0};
    criteria.edge_filters.connection_types = {ConnectionType::PlayerTransfer};
    criteria.layout_filters.hide_isolated_nodes = true;

    json j = criteria;
    EXPECT_EQ(j["node_filters"]["leagues"][0], "Ekstraklasa");
    EXPECT_FALSE(j["node_filters"].contains("cities"));
    EXPECT_FALSE(j["node_filters"].contains("degree_range"));
    EXPECT_DOUBLE_EQ(j["edge_filters"]["weight_range"]["min"].get<double>(), 20.0);
    EXPECT_EQ(j["edge_filters"]["connection_types"][0], "player-transfer");
    EXPECT_TRUE(j["layout_filters"]["hide_isolated_nodes"].get<bool>());

    EXPECT_EQ(j.get<FilterCriteria>(), criteria);
}

TEST(ConfigTest, FilterCriteriaFromJson) {
    auto criteria = json::parse(R"({
        "node_filters": {"degree_range": {"min": 2, "max": 6}, "has_coordinates": true},
        "edge_filters": {"strength_levels": ["very_strong", "weak"], "is_active": false}
    })").get<FilterCriteria>();

    ASSERT_TRUE(criteria.node_filters.degree_range.has_value());
    EXPECT_EQ(criteria.node_filters.degree_range->max, 6u);
    EXPECT_EQ(criteria.node_filters.has_coordinates, std::optional<bool>(true));
    ASSERT_EQ(criteria.edge_filters.strength_levels.size(), 2u);
    EXPECT_EQ(criteria.edge_filters.strength_levels[0], ConnectionStrength::Strong);
    EXPECT_EQ(criteria.edge_filters.is_active, std::optional<bool>(false));
    EXPECT_TRUE(criteria.layout_filters.empty());
}

TEST(ConfigTest, UnknownConnectionTypeThrows) {
    auto j = json::parse(R"({"edge_filters": {"connection_types": ["sponsorship"]}})");
    EXPECT_THROW(j.get<FilterCriteria>(), std::invalid_argument);
}

// ─── Engine Config File ────────────────────────────────────────

TEST(ConfigTest, LoadEngineConfigPartialFile) {
    auto path = writeTempFile("clubnet_engine_partial.json",
                              R"({"culling_threshold": 2500, "low_fps": 24.5})");
    EngineConfig config = loadEngineConfig(path);
    EXPECT_EQ(config.culling_threshold, 2500u);
    EXPECT_DOUBLE_EQ(config.low_fps, 24.5);
    EXPECT_EQ(config.max_visible_nodes, 500u);
    EXPECT_EQ(config.memory_warning_limit, 3);
    std::filesystem::remove(path);
}

TEST(ConfigTest, EngineConfigRoundTrip) {
    EngineConfig config;
    config.heap_path_threshold = 10;
    config.cull_margin = 12.5;
    auto back = json(config).get<EngineConfig>();
    EXPECT_EQ(back.heap_path_threshold, 10u);
    EXPECT_DOUBLE_EQ(back.cull_margin, 12.5);
}

TEST(ConfigTest, LoadEngineConfigMissingFile) {
    EXPECT_THROW(loadEngineConfig("/nonexistent/clubnet/engine.json"), std::runtime_error);
}

TEST(ConfigTest, LoadEngineConfigMalformed) {
    auto broken = writeTempFile("clubnet_engine_broken.json", "{ not json");
    EXPECT_THROW(loadEngineConfig(broken), std::runtime_error);
    std::filesystem::remove(broken);

    auto wrong_type = writeTempFile("clubnet_engine_type.json", R"({"max_visible_nodes": "many"})");
    EXPECT_THROW(loadEngineConfig(wrong_type), std::runtime_error);
    std::filesystem::remove(wrong_type);
}

// PyBind11 bindings for the clubnet core.
// Exposes the graph model, analyses, filters, export and GraphService to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "graph/graph.hpp"
#include "graph/graph_builder.hpp"
#include "graph/graph_snapshot.hpp"
#include "analysis/connectivity.hpp"
#include "analysis/graph_analyzer.hpp"
#include "analysis/path_finder.hpp"
#include "analysis/recommendation.hpp"
#include "filter/filter_engine.hpp"
#include "export/graph_exporter.hpp"
#include "config/graph_config.hpp"
#include "service/graph_service.hpp"
#include "verification/verification.hpp"

namespace py = pybind11;

PYBIND11_MODULE(clubnet_bindings, m) {
    m.doc() = "Club network graph core bindings";

    // ── Enums ──
    py::enum_<clubnet::ConnectionType>(m, "ConnectionType")
        .value("RIVALRY", clubnet::ConnectionType::Rivalry)
        .value("FRIENDLY", clubnet::ConnectionType::Friendly)
        .value("GEOGRAPHIC", clubnet::ConnectionType::Geographic)
        .value("HISTORICAL", clubnet::ConnectionType::Historical)
        .value("BUSINESS", clubnet::ConnectionType::Business)
        .value("PLAYER_TRANSFER", clubnet::ConnectionType::PlayerTransfer)
        .value("COACHING_STAFF", clubnet::ConnectionType::CoachingStaff)
        .value("PARTNERSHIP", clubnet::ConnectionType::Partnership)
        .value("TRANSFER", clubnet::ConnectionType::Transfer)
        .value("LOAN", clubnet::ConnectionType::Loan)
        .value("YOUTH_DEVELOPMENT", clubnet::ConnectionType::YouthDevelopment)
        .value("MANAGEMENT", clubnet::ConnectionType::Management);

    py::enum_<clubnet::ConnectionStrength>(m, "ConnectionStrength")
        .value("WEAK", clubnet::ConnectionStrength::Weak)
        .value("MODERATE", clubnet::ConnectionStrength::Moderate)
        .value("STRONG", clubnet::ConnectionStrength::Strong);

    py::enum_<clubnet::CentralityMode>(m, "CentralityMode")
        .value("APPROXIMATE", clubnet::CentralityMode::Approximate)
        .value("EXACT", clubnet::CentralityMode::Exact);

    py::enum_<clubnet::PerformanceMode>(m, "PerformanceMode")
        .value("AUTO", clubnet::PerformanceMode::Auto)
        .value("STANDARD", clubnet::PerformanceMode::Standard)
        .value("HIGH_PERFORMANCE", clubnet::PerformanceMode::HighPerformance)
        .value("ULTRA", clubnet::PerformanceMode::Ultra);

    py::enum_<clubnet::ExportFormat>(m, "ExportFormat")
        .value("PNG", clubnet::ExportFormat::Png)
        .value("JPG", clubnet::ExportFormat::Jpg)
        .value("SVG", clubnet::ExportFormat::Svg)
        .value("PDF", clubnet::ExportFormat::Pdf)
        .value("JSON", clubnet::ExportFormat::Json)
        .value("CSV", clubnet::ExportFormat::Csv)
        .value("GEXF", clubnet::ExportFormat::Gexf)
        .value("GRAPHML", clubnet::ExportFormat::GraphMl);

    py::enum_<clubnet::Severity>(m, "Severity")
        .value("ERROR", clubnet::Severity::Error)
        .value("WARNING", clubnet::Severity::Warning);

    // ── Records ──
    py::class_<clubnet::ClubRecord>(m, "ClubRecord")
        .def(py::init<>())
        .def_readwrite("id", &clubnet::ClubRecord::id)
        .def_readwrite("name", &clubnet::ClubRecord::name)
        .def_readwrite("city", &clubnet::ClubRecord::city)
        .def_readwrite("league", &clubnet::ClubRecord::league)
        .def_readwrite("founded_year", &clubnet::ClubRecord::founded_year)
        .def_readwrite("latitude", &clubnet::ClubRecord::latitude)
        .def_readwrite("longitude", &clubnet::ClubRecord::longitude)
        .def_readwrite("is_active", &clubnet::ClubRecord::is_active);

    py::class_<clubnet::ConnectionRecord>(m, "ConnectionRecord")
        .def(py::init<>())
        .def_readwrite("id", &clubnet::ConnectionRecord::id)
        .def_readwrite("source_club", &clubnet::ConnectionRecord::source_club)
        .def_readwrite("target_club", &clubnet::ConnectionRecord::target_club)
        .def_readwrite("type", &clubnet::ConnectionRecord::type)
        .def_readwrite("strength", &clubnet::ConnectionRecord::strength)
        .def_readwrite("weight", &clubnet::ConnectionRecord::weight)
        .def_readwrite("is_active", &clubnet::ConnectionRecord::is_active)
        .def_readwrite("start_date", &clubnet::ConnectionRecord::start_date)
        .def_readwrite("end_date", &clubnet::ConnectionRecord::end_date);

    py::class_<clubnet::ValidationIssue>(m, "ValidationIssue")
        .def(py::init<>())
        .def_readwrite("severity", &clubnet::ValidationIssue::severity)
        .def_readwrite("check_name", &clubnet::ValidationIssue::check_name)
        .def_readwrite("message", &clubnet::ValidationIssue::message)
        .def_readwrite("record_id", &clubnet::ValidationIssue::record_id);

    // ── Graph ──
    py::class_<clubnet::Node>(m, "Node")
        .def(py::init<>())
        .def(py::init<uint64_t, std::string>())
        .def_readwrite("id", &clubnet::Node::id)
        .def_readwrite("label", &clubnet::Node::label)
        .def_readwrite("size", &clubnet::Node::size)
        .def_readwrite("color", &clubnet::Node::color)
        .def_readwrite("shape", &clubnet::Node::shape);

    py::class_<clubnet::Edge>(m, "Edge")
        .def(py::init<>())
        .def(py::init<std::string, uint64_t, uint64_t, clubnet::ConnectionType, double>())
        .def_readwrite("id", &clubnet::Edge::id)
        .def_readwrite("source", &clubnet::Edge::source)
        .def_readwrite("target", &clubnet::Edge::target)
        .def_readwrite("type", &clubnet::Edge::type)
        .def_readwrite("weight", &clubnet::Edge::weight)
        .def_readwrite("is_active", &clubnet::Edge::is_active);

    py::class_<clubnet::Graph>(m, "Graph")
        .def(py::init<>())
        .def("add_node", &clubnet::Graph::addNode)
        .def("get_node", &clubnet::Graph::getNode, py::return_value_policy::reference_internal)
        .def("get_node_ids", &clubnet::Graph::getNodeIds)
        .def("node_count", &clubnet::Graph::nodeCount)
        .def("add_edge", &clubnet::Graph::addEdge)
        .def("get_edge", &clubnet::Graph::getEdge, py::return_value_policy::reference_internal)
        .def("edge_count", &clubnet::Graph::edgeCount)
        .def("get_neighbor_nodes", &clubnet::Graph::getNeighborNodes)
        .def("are_connected", &clubnet::Graph::areConnected)
        .def("extract_subgraph", &clubnet::Graph::extractSubgraph);

    py::class_<clubnet::GraphMetadata>(m, "GraphMetadata")
        .def(py::init<>())
        .def_readonly("total_nodes", &clubnet::GraphMetadata::total_nodes)
        .def_readonly("total_edges", &clubnet::GraphMetadata::total_edges)
        .def_readonly("density", &clubnet::GraphMetadata::density)
        .def_readonly("connected_components", &clubnet::GraphMetadata::connected_components)
        .def_readonly("average_degree", &clubnet::GraphMetadata::average_degree)
        .def_readonly("max_degree", &clubnet::GraphMetadata::max_degree)
        .def_readonly("min_degree", &clubnet::GraphMetadata::min_degree);

    py::class_<clubnet::GraphSnapshot>(m, "GraphSnapshot")
        .def_static("from_graph", &clubnet::GraphSnapshot::fromGraph)
        .def_readonly("graph", &clubnet::GraphSnapshot::graph)
        .def_readonly("metadata", &clubnet::GraphSnapshot::metadata);

    m.def("build_graph", [](const std::vector<clubnet::ClubRecord>& clubs,
                            const std::vector<clubnet::ConnectionRecord>& connections) {
        auto result = clubnet::buildGraph(clubs, connections);
        return py::make_tuple(result.snapshot, result.issues);
    }, py::arg("clubs"), py::arg("connections"));

    // ── Analysis ──
    py::class_<clubnet::GraphPath>(m, "GraphPath")
        .def(py::init<>())
        .def_readonly("source", &clubnet::GraphPath::source)
        .def_readonly("target", &clubnet::GraphPath::target)
        .def_readonly("path", &clubnet::GraphPath::path)
        .def_readonly("length", &clubnet::GraphPath::length)
        .def_readonly("total_cost", &clubnet::GraphPath::total_cost)
        .def_readonly("connection_types", &clubnet::GraphPath::connection_types)
        .def_readonly("edge_ids", &clubnet::GraphPath::edge_ids)
        .def_readonly("exists", &clubnet::GraphPath::exists);

    py::class_<clubnet::AnalysisOptions>(m, "AnalysisOptions")
        .def(py::init<>())
        .def_readwrite("centrality_mode", &clubnet::AnalysisOptions::centrality_mode)
        .def_readwrite("top_n", &clubnet::AnalysisOptions::top_n);

    py::class_<clubnet::NetworkMetrics>(m, "NetworkMetrics")
        .def_readonly("node_count", &clubnet::NetworkMetrics::node_count)
        .def_readonly("edge_count", &clubnet::NetworkMetrics::edge_count)
        .def_readonly("density", &clubnet::NetworkMetrics::density)
        .def_readonly("diameter", &clubnet::NetworkMetrics::diameter)
        .def_readonly("average_path_length", &clubnet::NetworkMetrics::average_path_length)
        .def_readonly("clustering_coefficient", &clubnet::NetworkMetrics::clustering_coefficient)
        .def_readonly("connected_components", &clubnet::NetworkMetrics::connected_components)
        .def_readonly("isolated_nodes", &clubnet::NetworkMetrics::isolated_nodes);

    py::class_<clubnet::CentralityMeasures>(m, "CentralityMeasures")
        .def_readonly("mode", &clubnet::CentralityMeasures::mode)
        .def_readonly("degree", &clubnet::CentralityMeasures::degree)
        .def_readonly("betweenness", &clubnet::CentralityMeasures::betweenness)
        .def_readonly("closeness", &clubnet::CentralityMeasures::closeness)
        .def_readonly("eigenvector", &clubnet::CentralityMeasures::eigenvector);

    py::class_<clubnet::RankedNode>(m, "RankedNode")
        .def_readonly("node_id", &clubnet::RankedNode::node_id)
        .def_readonly("value", &clubnet::RankedNode::value);

    py::class_<clubnet::GraphAnalysisReport>(m, "GraphAnalysisReport")
        .def_readonly("network", &clubnet::GraphAnalysisReport::network)
        .def_readonly("centrality", &clubnet::GraphAnalysisReport::centrality)
        .def_property_readonly("communities", [](const clubnet::GraphAnalysisReport& r) {
            std::vector<std::vector<clubnet::NodeId>> out;
            for (const auto& c : r.communities.communities) out.push_back(c.nodes);
            return out;
        })
        .def_property_readonly("modularity", [](const clubnet::GraphAnalysisReport& r) {
            return r.communities.modularity;
        })
        .def_property_readonly("most_connected", [](const clubnet::GraphAnalysisReport& r) {
            return r.top_nodes.most_connected;
        });

    py::class_<clubnet::Recommendation>(m, "Recommendation")
        .def_readonly("source_id", &clubnet::Recommendation::source_id)
        .def_readonly("target_id", &clubnet::Recommendation::target_id)
        .def_readonly("score", &clubnet::Recommendation::score)
        .def_readonly("reasons", &clubnet::Recommendation::reasons)
        .def_readonly("suggested_type", &clubnet::Recommendation::suggested_type)
        .def_readonly("suggested_strength", &clubnet::Recommendation::suggested_strength)
        .def_readonly("common_neighbors", &clubnet::Recommendation::common_neighbors)
        .def_readonly("geographic_distance_km", &clubnet::Recommendation::geographic_distance_km);

    m.def("find_connected_components", &clubnet::findConnectedComponents);
    m.def("find_shortest_path", [](const clubnet::Graph& graph, clubnet::NodeId s, clubnet::NodeId t) {
        return clubnet::findShortestPath(graph, s, t);
    }, py::arg("graph"), py::arg("source"), py::arg("target"));
    m.def("analyze", &clubnet::analyze,
          py::arg("snapshot"), py::arg("options") = clubnet::AnalysisOptions{});
    m.def("recommend", &clubnet::recommend,
          py::arg("snapshot"), py::arg("node_id"), py::arg("max_results") = 10);

    // ── Filters ──
    py::class_<clubnet::LayoutFilters>(m, "LayoutFilters")
        .def(py::init<>())
        .def_readwrite("hide_isolated_nodes", &clubnet::LayoutFilters::hide_isolated_nodes)
        .def_readwrite("hide_weak_connections", &clubnet::LayoutFilters::hide_weak_connections)
        .def_readwrite("show_only_largest_component",
                       &clubnet::LayoutFilters::show_only_largest_component);

    py::class_<clubnet::NodeFilters>(m, "NodeFilters")
        .def(py::init<>())
        .def_readwrite("leagues", &clubnet::NodeFilters::leagues)
        .def_readwrite("cities", &clubnet::NodeFilters::cities)
        .def_readwrite("has_coordinates", &clubnet::NodeFilters::has_coordinates);

    py::class_<clubnet::EdgeFilters>(m, "EdgeFilters")
        .def(py::init<>())
        .def_readwrite("connection_types", &clubnet::EdgeFilters::connection_types)
        .def_readwrite("strength_levels", &clubnet::EdgeFilters::strength_levels)
        .def_readwrite("is_active", &clubnet::EdgeFilters::is_active)
        .def_readwrite("has_end_date", &clubnet::EdgeFilters::has_end_date)
        .def("set_weight_range", [](clubnet::EdgeFilters& self, double lo, double hi) {
            self.weight_range = clubnet::Range<double>{lo, hi};
        });

    py::class_<clubnet::FilterCriteria>(m, "FilterCriteria")
        .def(py::init<>())
        .def_readwrite("node_filters", &clubnet::FilterCriteria::node_filters)
        .def_readwrite("edge_filters", &clubnet::FilterCriteria::edge_filters)
        .def_readwrite("layout_filters", &clubnet::FilterCriteria::layout_filters)
        .def("empty", &clubnet::FilterCriteria::empty);

    m.def("apply_filters", [](const clubnet::GraphSnapshot& snapshot, const clubnet::FilterCriteria& c) {
        return clubnet::applyFilters(snapshot, c);
    }, py::arg("snapshot"), py::arg("criteria"));

    // ── Export ──
    py::class_<clubnet::ExportOptions>(m, "ExportOptions")
        .def(py::init<>())
        .def_readwrite("format", &clubnet::ExportOptions::format)
        .def_readwrite("include_data", &clubnet::ExportOptions::include_data)
        .def_readwrite("include_positions", &clubnet::ExportOptions::include_positions)
        .def_readwrite("include_styles", &clubnet::ExportOptions::include_styles);

    m.def("export_graph", &clubnet::exportGraph, py::arg("snapshot"), py::arg("options"));

    // ── Service ──
    py::class_<clubnet::EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("culling_threshold", &clubnet::EngineConfig::culling_threshold)
        .def_readwrite("max_visible_nodes", &clubnet::EngineConfig::max_visible_nodes)
        .def_readwrite("high_performance_threshold", &clubnet::EngineConfig::high_performance_threshold)
        .def_readwrite("ultra_threshold", &clubnet::EngineConfig::ultra_threshold)
        .def_readwrite("weak_connection_threshold", &clubnet::EngineConfig::weak_connection_threshold)
        .def_readwrite("history_capacity", &clubnet::EngineConfig::history_capacity);

    m.def("load_engine_config", &clubnet::loadEngineConfig);

    py::class_<clubnet::DeviceProfile>(m, "DeviceProfile")
        .def(py::init<>())
        .def_readwrite("is_mobile", &clubnet::DeviceProfile::is_mobile)
        .def_readwrite("is_low_end", &clubnet::DeviceProfile::is_low_end)
        .def_readwrite("supports_webgl", &clubnet::DeviceProfile::supports_webgl)
        .def_readwrite("low_power_mode", &clubnet::DeviceProfile::low_power_mode)
        .def_readwrite("prefers_reduced_motion", &clubnet::DeviceProfile::prefers_reduced_motion);

    py::class_<clubnet::GraphDataSource, std::shared_ptr<clubnet::GraphDataSource>>(m, "GraphDataSource");

    py::class_<clubnet::InMemoryDataSource, clubnet::GraphDataSource,
               std::shared_ptr<clubnet::InMemoryDataSource>>(m, "InMemoryDataSource")
        .def(py::init<std::vector<clubnet::ClubRecord>, std::vector<clubnet::ConnectionRecord>>())
        .def("set_clubs", &clubnet::InMemoryDataSource::setClubs)
        .def("set_connections", &clubnet::InMemoryDataSource::setConnections);

    py::class_<clubnet::JsonFileDataSource, clubnet::GraphDataSource,
               std::shared_ptr<clubnet::JsonFileDataSource>>(m, "JsonFileDataSource")
        .def(py::init<std::string>());

    py::class_<clubnet::LoadResult>(m, "LoadResult")
        .def_readonly("success", &clubnet::LoadResult::success)
        .def_readonly("issues", &clubnet::LoadResult::issues)
        .def_readonly("error", &clubnet::LoadResult::error);

    py::class_<clubnet::GraphStats>(m, "GraphStats")
        .def_readonly("node_count", &clubnet::GraphStats::node_count)
        .def_readonly("edge_count", &clubnet::GraphStats::edge_count)
        .def_readonly("density", &clubnet::GraphStats::density)
        .def_readonly("connected_components", &clubnet::GraphStats::connected_components)
        .def_readonly("average_degree", &clubnet::GraphStats::average_degree)
        .def_readonly("selected_nodes", &clubnet::GraphStats::selected_nodes)
        .def_readonly("selected_edges", &clubnet::GraphStats::selected_edges);

    py::class_<clubnet::GraphService>(m, "GraphService")
        .def(py::init<std::shared_ptr<clubnet::GraphDataSource>, clubnet::EngineConfig,
                      clubnet::DeviceProfile>(),
             py::arg("source"), py::arg("config") = clubnet::EngineConfig{},
             py::arg("device") = clubnet::DeviceProfile{})
        .def("load_graph_data", &clubnet::GraphService::loadGraphData,
             py::arg("force_refresh") = false)
        .def("refresh", &clubnet::GraphService::refresh)
        .def("last_error", &clubnet::GraphService::lastError)
        .def("clear_error", &clubnet::GraphService::clearError)
        .def("set_filter_criteria", &clubnet::GraphService::setFilterCriteria)
        .def("filtered_snapshot", [](const clubnet::GraphService& self) -> std::optional<clubnet::GraphSnapshot> {
            auto snapshot = self.filteredSnapshot();
            if (!snapshot) return std::nullopt;
            return *snapshot;
        })
        .def("analyze", &clubnet::GraphService::analyze,
             py::arg("options") = clubnet::AnalysisOptions{})
        .def("find_shortest_path", &clubnet::GraphService::findShortestPath)
        .def("get_connection_recommendations",
             py::overload_cast<clubnet::NodeId, size_t>(
                 &clubnet::GraphService::getConnectionRecommendations, py::const_),
             py::arg("club_id"), py::arg("max_results") = 10)
        .def("select_nodes", &clubnet::GraphService::selectNodes,
             py::arg("ids"), py::arg("add_to_selection") = false)
        .def("select_edges", &clubnet::GraphService::selectEdges,
             py::arg("ids"), py::arg("add_to_selection") = false)
        .def("clear_selection", &clubnet::GraphService::clearSelection)
        .def("selected_nodes", &clubnet::GraphService::selectedNodes)
        .def("save_current_state", &clubnet::GraphService::saveCurrentState)
        .def("undo", &clubnet::GraphService::undo)
        .def("redo", &clubnet::GraphService::redo)
        .def("set_performance_mode", &clubnet::GraphService::setPerformanceMode)
        .def("set_viewport_culling", &clubnet::GraphService::setViewportCulling)
        .def("export_graph", &clubnet::GraphService::exportGraph)
        .def("graph_stats", &clubnet::GraphService::graphStats);
}

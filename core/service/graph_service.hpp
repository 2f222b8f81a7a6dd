#pragma once

#include "analysis/graph_analyzer.hpp"
#include "analysis/path_finder.hpp"
#include "analysis/recommendation.hpp"
#include "config/graph_config.hpp"
#include "export/graph_exporter.hpp"
#include "filter/filter_engine.hpp"
#include "history/state_history.hpp"
#include "service/data_source.hpp"
#include "verification/verification.hpp"
#include "viewport/performance_controller.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace clubnet {

enum class LoadingState { Idle, Loading, Success, Error };

std::string toString(LoadingState state);

/// Notifications emitted after a mutation has completed.
enum class StateChange {
    GraphLoaded,
    LoadFailed,
    FiltersChanged,
    SelectionChanged,
    ConfigChanged,
    StateRestored,
    AnalysisUpdated,
    PerformanceChanged,
    VisibilityChanged,
    ErrorCleared
};

std::string toString(StateChange change);

struct LoadResult {
    bool success = false;
    SnapshotPtr snapshot;                 // empty fallback snapshot on failure
    std::vector<ValidationIssue> issues;  // rejected and suspicious records
    std::string error;
};

/// Summary of the filtered graph plus the selection sizes.
struct GraphStats {
    size_t node_count = 0;
    size_t edge_count = 0;
    double density = 0.0;
    size_t connected_components = 0;
    double average_degree = 0.0;
    size_t selected_nodes = 0;
    size_t selected_edges = 0;
};

// ─── Graph Service ─────────────────────────────────────────────
// Owns the mutable state of one graph view: the loaded snapshot, the
// filtered snapshot derived from the current criteria, configuration,
// selection, undo history and the performance controller. Analyses
// run on the filtered snapshot. Every mutation completes before its
// notification goes out.

class GraphService {
public:
    using Listener = std::function<void(StateChange)>;
    using SubscriptionId = size_t;

    explicit GraphService(std::shared_ptr<GraphDataSource> source,
                          EngineConfig config = {}, DeviceProfile device = {});

    GraphService(const GraphService&) = delete;
    GraphService& operator=(const GraphService&) = delete;

    // ── Loading ──
    /// Fetch records, build and validate the graph. On failure the previous
    /// snapshot stays in place and the error is recorded.
    LoadResult loadGraphData(bool force_refresh = false);
    LoadResult refresh() { return loadGraphData(true); }

    LoadingState loadingState() const { return loading_state_; }
    bool isLoading() const { return loading_state_ == LoadingState::Loading; }
    const std::optional<std::string>& lastError() const { return error_; }
    bool hasError() const { return error_.has_value(); }
    void clearError();

    SnapshotPtr snapshot() const { return snapshot_; }
    bool hasGraphData() const { return snapshot_ != nullptr; }

    // ── Filtering ──
    /// Pure: filter any snapshot with the service's weak-connection threshold.
    GraphSnapshot applyFilters(const GraphSnapshot& snapshot, const FilterCriteria& criteria) const;

    /// Validate and install new criteria. Invalid criteria are not applied;
    /// the returned list holds every problem found.
    std::vector<ValidationIssue> setFilterCriteria(const FilterCriteria& criteria);
    const FilterCriteria& filterCriteria() const { return criteria_; }

    /// Snapshot after the current criteria; nullptr before the first load.
    SnapshotPtr filteredSnapshot() const { return filtered_; }

    // ── Analysis ──
    GraphAnalysisReport analyze(const AnalysisOptions& options = {});
    const std::optional<GraphAnalysisReport>& lastAnalysis() const { return analysis_; }
    GraphPath findShortestPath(NodeId source, NodeId target) const;
    std::vector<Recommendation> getConnectionRecommendations(NodeId club_id) const;
    std::vector<Recommendation> getConnectionRecommendations(NodeId club_id, size_t max_results) const;

    // ── Selection ──
    void selectNodes(const std::vector<NodeId>& ids, bool add_to_selection = false);
    void selectEdges(const std::vector<std::string>& ids, bool add_to_selection = false);
    void clearSelection();
    const std::vector<NodeId>& selectedNodes() const { return selected_nodes_; }
    const std::vector<std::string>& selectedEdges() const { return selected_edges_; }

    // ── Configuration ──
    void updateGraphConfig(const GraphConfig& config);
    const GraphConfig& graphConfig() const { return graph_config_; }
    const EngineConfig& engineConfig() const { return engine_config_; }

    /// Camera reported by the renderer; recorded in saved states.
    void setCamera(double zoom, Point pan);
    double zoom() const { return zoom_; }
    Point pan() const { return pan_; }

    // ── History ──
    void saveCurrentState();
    bool undo();
    bool redo();
    const StateHistory& history() const { return history_; }

    // ── Performance ──
    void setPerformanceMode(PerformanceMode mode);
    void setViewportCulling(bool enabled);
    PerformanceController& performance() { return performance_; }
    const PerformanceController& performance() const { return performance_; }

    // ── Export ──
    /// Serialize the filtered snapshot. Throws std::runtime_error without
    /// graph data and std::invalid_argument for image formats.
    std::string exportGraph(const ExportOptions& options) const;

    std::optional<GraphStats> graphStats() const;

    // ── Notifications ──
    SubscriptionId subscribe(Listener listener);
    void unsubscribe(SubscriptionId id);

private:
    void recomputeFiltered();
    void restore(const GraphState& state);
    void notify(StateChange change);

    std::shared_ptr<GraphDataSource> source_;
    EngineConfig engine_config_;

    SnapshotPtr snapshot_;
    SnapshotPtr filtered_;
    FilterCriteria criteria_;
    GraphConfig graph_config_;
    std::vector<NodeId> selected_nodes_;
    std::vector<std::string> selected_edges_;
    double zoom_ = 1.0;
    Point pan_;

    LoadingState loading_state_ = LoadingState::Idle;
    std::optional<std::string> error_;
    std::optional<GraphAnalysisReport> analysis_;

    StateHistory history_;
    PerformanceController performance_;

    std::vector<std::pair<SubscriptionId, Listener>> listeners_;
    bool attaching_ = false;
    SubscriptionId next_subscription_ = 1;
};

} // namespace clubnet

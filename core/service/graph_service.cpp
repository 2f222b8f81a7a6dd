#include "service/graph_service.hpp"
#include "graph/graph_builder.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <stdexcept>

namespace clubnet {

namespace {

template <typename T>
void mergeSelection(std::vector<T>& selection, const std::vector<T>& ids, bool add) {
    if (!add) selection.clear();
    for (const T& id : ids) {
        if (std::find(selection.begin(), selection.end(), id) == selection.end()) {
            selection.push_back(id);
        }
    }
}

} // namespace

std::string toString(LoadingState state) {
    switch (state) {
        case LoadingState::Idle:    return "idle";
        case LoadingState::Loading: return "loading";
        case LoadingState::Success: return "success";
        case LoadingState::Error:   return "error";
    }
    return "idle";
}

std::string toString(StateChange change) {
    switch (change) {
        case StateChange::GraphLoaded:        return "graph-loaded";
        case StateChange::LoadFailed:         return "load-failed";
        case StateChange::FiltersChanged:     return "filters-changed";
        case StateChange::SelectionChanged:   return "selection-changed";
        case StateChange::ConfigChanged:      return "config-changed";
        case StateChange::StateRestored:      return "state-restored";
        case StateChange::AnalysisUpdated:    return "analysis-updated";
        case StateChange::PerformanceChanged: return "performance-changed";
        case StateChange::VisibilityChanged:  return "visibility-changed";
        case StateChange::ErrorCleared:       return "error-cleared";
    }
    return "unknown";
}

GraphService::GraphService(std::shared_ptr<GraphDataSource> source,
                           EngineConfig config, DeviceProfile device)
    : source_(std::move(source)),
      engine_config_(config),
      history_(config.history_capacity),
      performance_(config, device) {
    if (!source_) {
        throw std::invalid_argument("GraphService requires a data source");
    }
    performance_.subscribe([this](PerformanceEvent event) {
        if (attaching_) return;
        notify(event == PerformanceEvent::VisibilityChanged ? StateChange::VisibilityChanged
                                                            : StateChange::PerformanceChanged);
    });
}

// ─── Loading ───────────────────────────────────────────────────

LoadResult GraphService::loadGraphData(bool force_refresh) {
    loading_state_ = LoadingState::Loading;
    error_.reset();

    LoadResult result;
    BuildResult built;
    try {
        auto clubs = source_->loadClubs(force_refresh);
        auto connections = source_->loadConnections(force_refresh);
        built = buildGraph(clubs, connections);
    } catch (const DataSourceError& e) {
        error_ = e.what();
        loading_state_ = LoadingState::Error;
        CLUBNET_LOG_ERROR("graph load failed: %s", e.what());

        result.success = false;
        result.error = e.what();
        result.snapshot = std::make_shared<const GraphSnapshot>(GraphSnapshot::empty());
        notify(StateChange::LoadFailed);
        return result;
    }

    snapshot_ = std::make_shared<const GraphSnapshot>(std::move(built.snapshot));

    // Drop selected elements that no longer exist.
    const Graph& g = snapshot_->graph;
    selected_nodes_.erase(std::remove_if(selected_nodes_.begin(), selected_nodes_.end(),
                                         [&g](NodeId id) { return !g.hasNode(id); }),
                          selected_nodes_.end());
    selected_edges_.erase(std::remove_if(selected_edges_.begin(), selected_edges_.end(),
                                         [&g](const std::string& id) { return !g.hasEdge(id); }),
                          selected_edges_.end());

    analysis_.reset();
    recomputeFiltered();
    loading_state_ = LoadingState::Success;
    saveCurrentState();

    CLUBNET_LOG_INFO("graph loaded: %zu nodes, %zu edges (%zu issues)",
                     snapshot_->metadata.total_nodes, snapshot_->metadata.total_edges,
                     built.issues.size());

    result.success = true;
    result.snapshot = snapshot_;
    result.issues = std::move(built.issues);
    notify(StateChange::GraphLoaded);
    return result;
}

void GraphService::clearError() {
    if (!error_) return;
    error_.reset();
    notify(StateChange::ErrorCleared);
}

// ─── Filtering ─────────────────────────────────────────────────

GraphSnapshot GraphService::applyFilters(const GraphSnapshot& snapshot,
                                         const FilterCriteria& criteria) const {
    FilterOptions options;
    options.weak_connection_threshold = engine_config_.weak_connection_threshold;
    return clubnet::applyFilters(snapshot, criteria, options);
}

std::vector<ValidationIssue> GraphService::setFilterCriteria(const FilterCriteria& criteria) {
    auto issues = FilterCriteriaValidator().check(criteria);
    if (hasErrors(issues)) {
        CLUBNET_LOG_WARN("filter criteria rejected (%zu issues)", issues.size());
        return issues;
    }

    criteria_ = criteria;
    recomputeFiltered();
    saveCurrentState();
    notify(StateChange::FiltersChanged);
    return issues;
}

void GraphService::recomputeFiltered() {
    if (!snapshot_) {
        filtered_.reset();
    } else if (criteria_.empty()) {
        filtered_ = snapshot_;
    } else {
        filtered_ = std::make_shared<const GraphSnapshot>(applyFilters(*snapshot_, criteria_));
    }
    if (!filtered_) return;
    // The mutation that triggered this sends its own notification.
    attaching_ = true;
    performance_.attach(filtered_);
    attaching_ = false;
}

// ─── Analysis ──────────────────────────────────────────────────

GraphAnalysisReport GraphService::analyze(const AnalysisOptions& options) {
    if (!filtered_) return GraphAnalysisReport{};
    analysis_ = clubnet::analyze(*filtered_, options);
    notify(StateChange::AnalysisUpdated);
    return *analysis_;
}

GraphPath GraphService::findShortestPath(NodeId source, NodeId target) const {
    if (!filtered_) {
        GraphPath none;
        none.source = source;
        none.target = target;
        return none;
    }
    PathFinderOptions options;
    options.heap_threshold = engine_config_.heap_path_threshold;
    return clubnet::findShortestPath(filtered_->graph, source, target, options);
}

std::vector<Recommendation> GraphService::getConnectionRecommendations(NodeId club_id) const {
    return getConnectionRecommendations(club_id, engine_config_.default_max_recommendations);
}

std::vector<Recommendation> GraphService::getConnectionRecommendations(NodeId club_id,
                                                                       size_t max_results) const {
    if (!filtered_) return {};
    return recommend(*filtered_, club_id, max_results);
}

// ─── Selection ─────────────────────────────────────────────────

void GraphService::selectNodes(const std::vector<NodeId>& ids, bool add_to_selection) {
    mergeSelection(selected_nodes_, ids, add_to_selection);
    saveCurrentState();
    notify(StateChange::SelectionChanged);
}

void GraphService::selectEdges(const std::vector<std::string>& ids, bool add_to_selection) {
    mergeSelection(selected_edges_, ids, add_to_selection);
    saveCurrentState();
    notify(StateChange::SelectionChanged);
}

void GraphService::clearSelection() {
    selected_nodes_.clear();
    selected_edges_.clear();
    saveCurrentState();
    notify(StateChange::SelectionChanged);
}

// ─── Configuration ─────────────────────────────────────────────

void GraphService::updateGraphConfig(const GraphConfig& config) {
    graph_config_ = config;
    saveCurrentState();
    notify(StateChange::ConfigChanged);
}

void GraphService::setCamera(double zoom, Point pan) {
    zoom_ = zoom;
    pan_ = pan;
}

// ─── History ───────────────────────────────────────────────────

void GraphService::saveCurrentState() {
    GraphState state;
    state.timestamp = std::chrono::system_clock::now();
    state.config = graph_config_;
    state.selected_nodes = selected_nodes_;
    state.selected_edges = selected_edges_;
    state.filters = criteria_;
    state.layout = graph_config_.layout.type;
    state.zoom = zoom_;
    state.pan = pan_;
    history_.save(std::move(state));
}

bool GraphService::undo() {
    if (!history_.undo()) return false;
    restore(*history_.current());
    return true;
}

bool GraphService::redo() {
    if (!history_.redo()) return false;
    restore(*history_.current());
    return true;
}

void GraphService::restore(const GraphState& state) {
    graph_config_ = state.config;
    selected_nodes_ = state.selected_nodes;
    selected_edges_ = state.selected_edges;
    zoom_ = state.zoom;
    pan_ = state.pan;
    if (criteria_ != state.filters) {
        criteria_ = state.filters;
        recomputeFiltered();
    }
    // After recomputeFiltered, which drops pending culling requests.
    performance_.restoreCamera(zoom_, pan_);
    notify(StateChange::StateRestored);
}

// ─── Performance ───────────────────────────────────────────────

void GraphService::setPerformanceMode(PerformanceMode mode) {
    performance_.setPerformanceMode(mode);
}

void GraphService::setViewportCulling(bool enabled) {
    performance_.setViewportCulling(enabled);
}

// ─── Export / stats ────────────────────────────────────────────

std::string GraphService::exportGraph(const ExportOptions& options) const {
    if (!filtered_) {
        throw std::runtime_error("No graph data available for export");
    }
    return clubnet::exportGraph(*filtered_, options);
}

std::optional<GraphStats> GraphService::graphStats() const {
    if (!filtered_) return std::nullopt;
    const GraphMetadata& m = filtered_->metadata;
    GraphStats stats;
    stats.node_count = m.total_nodes;
    stats.edge_count = m.total_edges;
    stats.density = m.density;
    stats.connected_components = m.connected_components;
    stats.average_degree = m.average_degree;
    stats.selected_nodes = selected_nodes_.size();
    stats.selected_edges = selected_edges_.size();
    return stats;
}

// ─── Notifications ─────────────────────────────────────────────

GraphService::SubscriptionId GraphService::subscribe(Listener listener) {
    const SubscriptionId id = next_subscription_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void GraphService::unsubscribe(SubscriptionId id) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [id](const auto& entry) { return entry.first == id; }),
                     listeners_.end());
}

void GraphService::notify(StateChange change) {
    // Listeners may unsubscribe while being notified.
    auto listeners = listeners_;
    for (const auto& entry : listeners) entry.second(change);
}

} // namespace clubnet

#include "render/render_adapter.hpp"
#include "graph/adjacency.hpp"

#include <algorithm>
#include <unordered_set>

namespace clubnet {

double nodeSizeFor(const Node& node, size_t degree, size_t max_degree, const NodeStyleConfig& style) {
    if (style.size_attribute != "degree") return node.size;
    if (max_degree == 0) return style.min_size;
    const double t = static_cast<double>(degree) / static_cast<double>(max_degree);
    return style.min_size + (style.max_size - style.min_size) * t;
}

double edgeWidthFor(const Edge& edge, const EdgeStyleConfig& style) {
    const double t = std::clamp(edge.weight, 0.0, 100.0) / 100.0;
    return style.min_width + (style.max_width - style.min_width) * t;
}

RenderFrame RenderAdapter::frame() const {
    RenderFrame frame;
    const PerformanceController& perf = service_.performance();
    frame.mode = perf.mode();
    frame.hints = perf.hints();
    frame.settings = perf.quality().settings();

    SnapshotPtr snapshot = service_.filteredSnapshot();
    if (!snapshot) return frame;

    const VisibilityState& visibility = perf.visibility();
    frame.culling_active = visibility.culling_active;

    const GraphConfig& config = service_.graphConfig();
    const Graph& graph = snapshot->graph;
    const auto degrees = computeDegrees(graph);
    const size_t max_degree = snapshot->metadata.max_degree;

    const std::unordered_set<NodeId> selected_nodes(service_.selectedNodes().begin(),
                                                    service_.selectedNodes().end());
    const std::unordered_set<std::string> selected_edges(service_.selectedEdges().begin(),
                                                         service_.selectedEdges().end());
    const bool labels = config.nodes.show_labels && frame.settings.enable_labels;

    for (size_t i = 0; i < graph.nodes().size(); i++) {
        const Node& node = graph.nodes()[i];
        if (!visibility.isNodeVisible(node.id)) continue;
        NodeView view;
        view.id = node.id;
        view.label = node.label;
        view.position = node.position;
        view.size = nodeSizeFor(node, degrees[i], max_degree, config.nodes);
        view.color = node.color;
        view.shape = node.shape;
        view.selected = selected_nodes.count(node.id) > 0;
        view.show_label = labels;
        frame.nodes.push_back(std::move(view));
    }

    for (const Edge& edge : graph.edges()) {
        if (!visibility.isEdgeVisible(edge.id)) continue;
        EdgeView view;
        view.id = edge.id;
        view.source = edge.source;
        view.target = edge.target;
        view.width = edgeWidthFor(edge, config.edges);
        view.color = connectionTypeProfile(edge.type).color;
        view.selected = selected_edges.count(edge.id) > 0;
        frame.edges.push_back(std::move(view));
    }
    return frame;
}

// ─── Renderer events ───────────────────────────────────────────

void RenderAdapter::onNodeTap(NodeId id, bool multi_select) {
    const bool add = multi_select && service_.graphConfig().interaction.multi_select_enabled;
    service_.selectNodes({id}, add);
}

void RenderAdapter::onEdgeTap(const std::string& id, bool multi_select) {
    const bool add = multi_select && service_.graphConfig().interaction.multi_select_enabled;
    service_.selectEdges({id}, add);
}

void RenderAdapter::onBackgroundTap() {
    if (service_.selectedNodes().empty() && service_.selectedEdges().empty()) return;
    service_.clearSelection();
}

void RenderAdapter::onViewportChanged(const Viewport& viewport, TimePoint now) {
    service_.setCamera(viewport.zoom, Point{viewport.pan_x, viewport.pan_y});
    service_.performance().onViewportChanged(viewport, now);
}

void RenderAdapter::onFrameRendered(TimePoint now) {
    service_.performance().onFrame(now);
}

void RenderAdapter::onVisibilityChanged(bool page_visible) {
    service_.performance().setPageVisible(page_visible);
}

} // namespace clubnet

#pragma once

#include "service/graph_service.hpp"

#include <optional>
#include <string>
#include <vector>

namespace clubnet {

struct NodeView {
    NodeId id = 0;
    std::string label;
    std::optional<Point> position;
    double size = 10.0;
    std::string color;
    std::string shape;
    bool selected = false;
    bool show_label = true;
};

struct EdgeView {
    std::string id;
    NodeId source = 0;
    NodeId target = 0;
    double width = 2.0;
    std::string color;
    bool selected = false;
};

/// Everything a renderer needs to draw the current view.
struct RenderFrame {
    std::vector<NodeView> nodes;
    std::vector<EdgeView> edges;
    PerformanceMode mode = PerformanceMode::Standard;
    RendererHints hints;
    PerformanceSettings settings;
    bool culling_active = false;
};

// ─── Render Adapter ────────────────────────────────────────────
// The only bridge between a rendering engine and the service.
// Renderer events become service intents; frame() turns the filtered
// snapshot plus visibility flags into draw lists.

class RenderAdapter {
public:
    explicit RenderAdapter(GraphService& service) : service_(service) {}

    /// Visible nodes and edges of the filtered snapshot, in snapshot order.
    RenderFrame frame() const;

    // ── Renderer events ──
    void onNodeTap(NodeId id, bool multi_select = false);
    void onEdgeTap(const std::string& id, bool multi_select = false);
    void onBackgroundTap();
    void onViewportChanged(const Viewport& viewport, TimePoint now);
    void onFrameRendered(TimePoint now);
    void onVisibilityChanged(bool page_visible);

private:
    GraphService& service_;
};

/// Node size from the configured size attribute ("degree" scales between
/// min and max size by degree; anything else keeps the node's own size).
double nodeSizeFor(const Node& node, size_t degree, size_t max_degree, const NodeStyleConfig& style);

/// Edge width scaled between min and max width by weight in [0, 100].
double edgeWidthFor(const Edge& edge, const EdgeStyleConfig& style);

} // namespace clubnet

#pragma once

#include "graph/graph_snapshot.hpp"
#include "viewport/fps_sampler.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>

namespace clubnet {

/// Camera state reported by the renderer, in screen pixels.
struct Viewport {
    double pan_x = 0.0;
    double pan_y = 0.0;
    double zoom = 1.0;
    double width = 0.0;
    double height = 0.0;
};

/// Axis-aligned rectangle in model coordinates.
struct Rect {
    double x1 = 0.0;
    double y1 = 0.0;
    double x2 = 0.0;
    double y2 = 0.0;

    bool contains(const Point& p) const {
        return p.x >= x1 && p.x <= x2 && p.y >= y1 && p.y <= y2;
    }
};

/// Model-space rectangle shown by `viewport`, grown by `margin` on each side.
/// A non-positive zoom is treated as 1.
Rect visibleRect(const Viewport& viewport, double margin = 0.0);

/// Per-element visibility flags. While culling is inactive every
/// element is visible and the sets stay empty.
struct VisibilityState {
    bool culling_active = false;
    std::unordered_set<NodeId> visible_nodes;
    std::unordered_set<std::string> visible_edges;

    bool isNodeVisible(NodeId id) const {
        return !culling_active || visible_nodes.count(id) > 0;
    }
    bool isEdgeVisible(const std::string& id) const {
        return !culling_active || visible_edges.count(id) > 0;
    }
};

struct CullingOptions {
    bool enabled = true;
    size_t threshold = 1000;          // culling runs above this node count
    size_t max_visible_nodes = 500;
    std::chrono::milliseconds throttle{16};
    double margin = 0.0;
};

// ─── Viewport Culler ───────────────────────────────────────────
// Hides nodes outside the viewport on large graphs. Only the
// VisibilityState changes; the snapshot is read-only.
//
// Recomputation runs at most once per throttle interval. Requests
// arriving sooner are kept (latest wins) and flushed by the first
// frame callback once the interval has elapsed.

class ViewportCuller {
public:
    explicit ViewportCuller(CullingOptions options = {});

    void setSnapshot(SnapshotPtr snapshot);
    void setEnabled(bool enabled);
    bool enabled() const { return options_.enabled; }

    /// Extra cap from adaptive quality; the effective cap is the
    /// smaller of this and max_visible_nodes.
    void setNodeCap(size_t cap);

    /// Enabled and the snapshot has more nodes than the threshold.
    bool active() const;

    /// Viewport changed. Returns true if visibility was recomputed now,
    /// false if the request was deferred.
    bool requestUpdate(const Viewport& viewport, TimePoint now);

    /// Frame callback: applies a deferred request once the throttle interval
    /// has elapsed. Returns true if one ran.
    bool onFrame(TimePoint now);

    /// Move the camera of the last known viewport (size kept) and queue it
    /// like a deferred request. False if no viewport has been reported yet.
    bool setCamera(double zoom, Point pan);

    bool hasPendingUpdate() const { return pending_.has_value(); }
    const VisibilityState& visibility() const { return visibility_; }
    size_t recomputeCount() const { return recompute_count_; }
    const CullingOptions& options() const { return options_; }

private:
    void recompute();
    void showAll();

    CullingOptions options_;
    SnapshotPtr snapshot_;
    size_t node_cap_ = 0;  // 0 = no extra cap
    std::optional<Viewport> viewport_;
    std::optional<Viewport> pending_;
    std::optional<TimePoint> last_update_;
    VisibilityState visibility_;
    size_t recompute_count_ = 0;
};

} // namespace clubnet

#include "viewport/viewport_culler.hpp"
#include "util/log.hpp"

#include <algorithm>

namespace clubnet {

Rect visibleRect(const Viewport& viewport, double margin) {
    const double zoom = viewport.zoom > 0.0 ? viewport.zoom : 1.0;
    Rect r;
    r.x1 = -viewport.pan_x / zoom - margin;
    r.y1 = -viewport.pan_y / zoom - margin;
    r.x2 = -viewport.pan_x / zoom + viewport.width / zoom + margin;
    r.y2 = -viewport.pan_y / zoom + viewport.height / zoom + margin;
    return r;
}

ViewportCuller::ViewportCuller(CullingOptions options)
    : options_(options) {}

void ViewportCuller::setSnapshot(SnapshotPtr snapshot) {
    snapshot_ = std::move(snapshot);
    pending_.reset();
    recompute();
}

void ViewportCuller::setEnabled(bool enabled) {
    if (options_.enabled == enabled) return;
    options_.enabled = enabled;
    CLUBNET_LOG_INFO("viewport culling %s", enabled ? "enabled" : "disabled");
    recompute();
}

void ViewportCuller::setNodeCap(size_t cap) {
    if (node_cap_ == cap) return;
    node_cap_ = cap;
    recompute();
}

bool ViewportCuller::active() const {
    return options_.enabled && snapshot_ && snapshot_->graph.nodeCount() > options_.threshold;
}

bool ViewportCuller::requestUpdate(const Viewport& viewport, TimePoint now) {
    if (last_update_ && now - *last_update_ < options_.throttle) {
        pending_ = viewport;
        return false;
    }
    viewport_ = viewport;
    pending_.reset();
    last_update_ = now;
    recompute();
    return true;
}

bool ViewportCuller::onFrame(TimePoint now) {
    if (!pending_) return false;
    if (last_update_ && now - *last_update_ < options_.throttle) return false;
    viewport_ = *pending_;
    pending_.reset();
    last_update_ = now;
    recompute();
    return true;
}

bool ViewportCuller::setCamera(double zoom, Point pan) {
    std::optional<Viewport> base = pending_ ? pending_ : viewport_;
    if (!base) return false;
    base->zoom = zoom;
    base->pan_x = pan.x;
    base->pan_y = pan.y;
    pending_ = base;
    return true;
}

void ViewportCuller::showAll() {
    visibility_.culling_active = false;
    visibility_.visible_nodes.clear();
    visibility_.visible_edges.clear();
}

void ViewportCuller::recompute() {
    if (!active() || !viewport_) {
        showAll();
        return;
    }

    size_t cap = options_.max_visible_nodes;
    if (node_cap_ > 0) cap = std::min(cap, node_cap_);

    const Rect rect = visibleRect(*viewport_, options_.margin);
    VisibilityState next;
    next.culling_active = true;

    for (const Node& node : snapshot_->graph.nodes()) {
        if (next.visible_nodes.size() >= cap) break;
        if (node.position && rect.contains(*node.position)) {
            next.visible_nodes.insert(node.id);
        }
    }
    for (const Edge& edge : snapshot_->graph.edges()) {
        if (next.visible_nodes.count(edge.source) && next.visible_nodes.count(edge.target)) {
            next.visible_edges.insert(edge.id);
        }
    }

    visibility_ = std::move(next);
    recompute_count_++;
    CLUBNET_LOG_DEBUG("culling: %zu nodes, %zu edges visible",
                      visibility_.visible_nodes.size(), visibility_.visible_edges.size());
}

} // namespace clubnet

#pragma once

#include "config/graph_config.hpp"
#include "filter/filter_criteria.hpp"
#include "graph/node.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace clubnet {

// ─── Graph State ───────────────────────────────────────────────
// Everything the user can change about the view: configuration,
// selection, filters and camera. The unit of undo/redo.

struct GraphState {
    std::chrono::system_clock::time_point timestamp{};
    GraphConfig config;
    std::vector<NodeId> selected_nodes;
    std::vector<std::string> selected_edges;
    FilterCriteria filters;
    std::string layout = "force-directed";
    double zoom = 1.0;
    Point pan;
};

/// Compares the restorable content; the timestamp is ignored.
bool sameContent(const GraphState& a, const GraphState& b);

// ─── State History ─────────────────────────────────────────────
// Linear undo/redo over saved states. Saving after an undo discards
// the redo tail; beyond capacity the oldest state is evicted.

class StateHistory {
public:
    explicit StateHistory(size_t capacity = 50);

    /// Append a state and make it current.
    void save(GraphState state);

    /// Step back. False when already at the oldest state.
    bool undo();

    /// Step forward. False when already at the newest state.
    bool redo();

    /// Current state, or nullptr when nothing was saved.
    const GraphState* current() const;

    bool canUndo() const { return !states_.empty() && pointer_ > 0; }
    bool canRedo() const { return !states_.empty() && pointer_ + 1 < states_.size(); }

    /// The N most recent states, oldest first.
    std::vector<GraphState> recent(size_t n) const;

    size_t size() const { return states_.size(); }
    size_t capacity() const { return capacity_; }
    size_t position() const { return pointer_; }

    void clear();

private:
    std::vector<GraphState> states_;
    size_t capacity_;
    size_t pointer_ = 0;
};

} // namespace clubnet

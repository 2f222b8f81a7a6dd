#include "history/state_history.hpp"

namespace clubnet {

bool sameContent(const GraphState& a, const GraphState& b) {
    return a.config == b.config &&
           a.selected_nodes == b.selected_nodes &&
           a.selected_edges == b.selected_edges &&
           a.filters == b.filters &&
           a.layout == b.layout &&
           a.zoom == b.zoom &&
           a.pan.x == b.pan.x && a.pan.y == b.pan.y;
}

StateHistory::StateHistory(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {}

void StateHistory::save(GraphState state) {
    if (!states_.empty()) {
        states_.erase(states_.begin() + static_cast<std::ptrdiff_t>(pointer_) + 1, states_.end());
    }
    states_.push_back(std::move(state));
    if (states_.size() > capacity_) {
        states_.erase(states_.begin(),
                      states_.begin() + static_cast<std::ptrdiff_t>(states_.size() - capacity_));
    }
    pointer_ = states_.size() - 1;
}

bool StateHistory::undo() {
    if (!canUndo()) return false;
    pointer_--;
    return true;
}

bool StateHistory::redo() {
    if (!canRedo()) return false;
    pointer_++;
    return true;
}

const GraphState* StateHistory::current() const {
    if (states_.empty()) return nullptr;
    return &states_[pointer_];
}

std::vector<GraphState> StateHistory::recent(size_t n) const {
    if (n >= states_.size()) return states_;
    return std::vector<GraphState>(states_.end() - static_cast<std::ptrdiff_t>(n), states_.end());
}

void StateHistory::clear() {
    states_.clear();
    pointer_ = 0;
}

} // namespace clubnet

#pragma once

#include "graph/graph.hpp"

#include <vector>

namespace clubnet {

using Component = std::vector<NodeId>;

/// Partition of the node set into connected components, ignoring edge
/// direction. Components appear in the order of their first node; within a
/// component nodes appear in depth-first visiting order.
/// Empty graph → empty list.
std::vector<Component> findConnectedComponents(const Graph& graph);

/// Largest component; ties resolve to the first one found.
/// Returns an empty component for an empty list.
Component largestComponent(const std::vector<Component>& components);

} // namespace clubnet

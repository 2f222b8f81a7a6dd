#include "analysis/connectivity.hpp"
#include "graph/adjacency.hpp"

namespace clubnet {

std::vector<Component> findConnectedComponents(const Graph& graph) {
    const AdjacencyList adjacency(graph);
    const auto& nodes = graph.nodes();
    std::vector<bool> visited(nodes.size(), false);
    std::vector<Component> components;

    // Explicit stack; neighbors pushed in reverse so they pop in edge order,
    // matching a recursive depth-first walk.
    std::vector<size_t> stack;
    for (size_t root = 0; root < nodes.size(); root++) {
        if (visited[root]) continue;

        Component component;
        stack.push_back(root);
        while (!stack.empty()) {
            const size_t current = stack.back();
            stack.pop_back();
            if (visited[current]) continue;
            visited[current] = true;
            component.push_back(nodes[current].id);

            const auto& links = adjacency.neighbors(current);
            for (auto it = links.rbegin(); it != links.rend(); ++it) {
                if (!visited[it->node]) stack.push_back(it->node);
            }
        }
        components.push_back(std::move(component));
    }
    return components;
}

Component largestComponent(const std::vector<Component>& components) {
    const Component* best = nullptr;
    for (const auto& c : components) {
        if (!best || c.size() > best->size()) best = &c;
    }
    return best ? *best : Component{};
}

} // namespace clubnet

#include "graph/graph_builder.hpp"
#include "util/log.hpp"

#include <unordered_map>

namespace clubnet {

std::string leagueColor(const std::string& league) {
    static const std::unordered_map<std::string, std::string> kColors = {
        {"Ekstraklasa", "#e53e3e"},
        {"I Liga", "#3182ce"},
        {"II Liga", "#38a169"},
        {"III Liga", "#d69e2e"},
        {"IV Liga", "#805ad5"},
    };
    auto it = kColors.find(league);
    return it != kColors.end() ? it->second : "#718096";
}

BuildResult buildGraph(const std::vector<ClubRecord>& clubs,
                       const std::vector<ConnectionRecord>& connections) {
    BuildResult result;
    Graph graph;
    std::unordered_set<NodeId> known;

    for (const ClubRecord& club : clubs) {
        if (known.count(club.id)) {
            result.issues.push_back({Severity::Error, "club_unique_id",
                "Club " + std::to_string(club.id) + " is listed twice", club.id});
            result.rejected_clubs++;
            continue;
        }
        Node node(club);
        node.color = leagueColor(club.league);
        if (club.hasCoordinates()) {
            node.position = Point{*club.longitude * 1000.0, *club.latitude * 1000.0};
        }
        known.insert(club.id);
        graph.addNode(std::move(node));
    }

    ConnectionValidator validator(known);
    for (const ConnectionRecord& conn : connections) {
        auto issues = validator.check(conn);
        const bool rejected = hasErrors(issues);
        result.issues.insert(result.issues.end(), issues.begin(), issues.end());
        if (rejected) {
            result.rejected_connections++;
            continue;
        }

        Edge edge(edgeIdFor(conn.id), conn.source_club, conn.target_club, conn.type, conn.weight);
        edge.strength = conn.strength;
        edge.is_active = conn.is_active;
        edge.start_date = conn.start_date;
        edge.end_date = conn.end_date;
        edge.label = conn.label;
        edge.description = conn.description;
        graph.addEdge(std::move(edge));
    }

    if (result.rejected_clubs > 0 || result.rejected_connections > 0) {
        CLUBNET_LOG_WARN("graph build rejected %zu clubs and %zu connections",
                         result.rejected_clubs, result.rejected_connections);
    }

    result.snapshot = GraphSnapshot::fromGraph(std::move(graph));
    return result;
}

} // namespace clubnet

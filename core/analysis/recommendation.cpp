#include "analysis/recommendation.hpp"
#include "graph/adjacency.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace clubnet {

namespace {

constexpr double kEarthRadiusKm = 6371.0;
constexpr double kPi = 3.14159265358979323846;

double toRadians(double degrees) { return degrees * kPi / 180.0; }

ConnectionType suggestType(const ClubRecord& a, const ClubRecord& b) {
    if (a.city == b.city) return ConnectionType::Geographic;
    if (a.league == b.league) return ConnectionType::Friendly;
    return ConnectionType::Partnership;
}

ConnectionStrength suggestStrength(double score) {
    if (score > RecommendationWeights::kStrongAbove) return ConnectionStrength::Strong;
    if (score > RecommendationWeights::kModerateAbove) return ConnectionStrength::Moderate;
    return ConnectionStrength::Weak;
}

// Distinct neighbor indexes in first-seen order.
std::vector<size_t> neighborIndexes(const AdjacencyList& adjacency, size_t node) {
    std::vector<size_t> out;
    std::unordered_set<size_t> seen;
    for (const auto& link : adjacency.neighbors(node)) {
        if (seen.insert(link.node).second) out.push_back(link.node);
    }
    return out;
}

} // namespace

double haversineKm(double lat1, double lon1, double lat2, double lon2) {
    const double d_lat = toRadians(lat2 - lat1);
    const double d_lon = toRadians(lon2 - lon1);
    const double a = std::sin(d_lat / 2) * std::sin(d_lat / 2) +
                     std::cos(toRadians(lat1)) * std::cos(toRadians(lat2)) *
                     std::sin(d_lon / 2) * std::sin(d_lon / 2);
    const double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
    return kEarthRadiusKm * c;
}

std::vector<Recommendation> recommend(const GraphSnapshot& snapshot, NodeId node_id,
                                      size_t max_results) {
    std::vector<Recommendation> result;
    const Graph& graph = snapshot.graph;
    const Node* self = graph.getNode(node_id);
    if (!self) return result;

    const AdjacencyList adjacency(graph);
    const auto& nodes = graph.nodes();
    const size_t self_idx = graph.indexOf(node_id);

    const auto self_neighbors = neighborIndexes(adjacency, self_idx);
    const std::unordered_set<size_t> connected(self_neighbors.begin(), self_neighbors.end());

    for (size_t idx = 0; idx < nodes.size(); idx++) {
        if (idx == self_idx || connected.count(idx)) continue;
        const Node& candidate = nodes[idx];
        const ClubRecord& a = self->club;
        const ClubRecord& b = candidate.club;

        Recommendation rec;
        rec.source_id = node_id;
        rec.target_id = candidate.id;
        rec.league_match = a.league == b.league;
        rec.city_match = a.city == b.city;

        if (rec.league_match) {
            rec.score += RecommendationWeights::kSameLeague;
            rec.reasons.push_back("Same league");
        }
        if (rec.city_match) {
            rec.score += RecommendationWeights::kSameCity;
            rec.reasons.push_back("Same city");
        }
        if (a.hasCoordinates() && b.hasCoordinates()) {
            const double km = haversineKm(*a.latitude, *a.longitude, *b.latitude, *b.longitude);
            rec.geographic_distance_km = km;
            if (km < RecommendationWeights::kNearbyRadiusKm) {
                rec.score += RecommendationWeights::kNearby;
                rec.reasons.push_back("Geographic proximity");
            }
        }

        for (size_t n : neighborIndexes(adjacency, idx)) {
            if (connected.count(n)) rec.common_neighbors.push_back(nodes[n].id);
        }
        rec.mutual_connections = rec.common_neighbors.size();
        rec.score += RecommendationWeights::kPerMutualNeighbor * rec.mutual_connections;
        if (rec.mutual_connections > 0) {
            rec.reasons.push_back(std::to_string(rec.mutual_connections) + " mutual connections");
        }

        if (rec.score <= 0.0) continue;

        rec.suggested_type = suggestType(a, b);
        rec.suggested_strength = suggestStrength(rec.score);
        result.push_back(std::move(rec));
    }

    std::stable_sort(result.begin(), result.end(),
                     [](const Recommendation& x, const Recommendation& y) { return x.score > y.score; });
    if (result.size() > max_results) result.resize(max_results);
    return result;
}

} // namespace clubnet

#pragma once

#include "graph/graph_snapshot.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace clubnet {

/// A scored suggestion for a new connection. Created on demand, never stored.
struct Recommendation {
    NodeId source_id = 0;
    NodeId target_id = 0;
    double score = 0.0;
    std::vector<std::string> reasons;
    ConnectionType suggested_type = ConnectionType::Partnership;
    ConnectionStrength suggested_strength = ConnectionStrength::Weak;
    std::vector<NodeId> common_neighbors;
    size_t mutual_connections = 0;
    std::optional<double> geographic_distance_km;
    bool league_match = false;
    bool city_match = false;
};

/// Scoring constants. Not configurable per call.
struct RecommendationWeights {
    static constexpr double kSameLeague = 30.0;
    static constexpr double kSameCity = 25.0;
    static constexpr double kNearby = 20.0;
    static constexpr double kNearbyRadiusKm = 50.0;
    static constexpr double kPerMutualNeighbor = 5.0;
    static constexpr double kStrongAbove = 50.0;
    static constexpr double kModerateAbove = 25.0;
};

/// Great-circle distance in kilometers (haversine, Earth radius 6371 km).
double haversineKm(double lat1, double lon1, double lat2, double lon2);

// ─── Recommendation Engine ─────────────────────────────────────
// Scores every node that is neither the queried node nor already
// connected to it:
//   +30 same league, +25 same city, +20 within 50 km (both have
//   coordinates), +5 per mutual neighbor.
// Score <= 0 is dropped. Results are sorted by score descending;
// equal scores keep snapshot node order. Unknown id → empty list.

std::vector<Recommendation> recommend(const GraphSnapshot& snapshot, NodeId node_id,
                                      size_t max_results = 10);

} // namespace clubnet

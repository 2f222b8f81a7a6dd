#pragma once

#include "graph/graph_snapshot.hpp"
#include "verification/verification.hpp"

#include <string>
#include <vector>

namespace clubnet {

struct BuildResult {
    GraphSnapshot snapshot;
    std::vector<ValidationIssue> issues;  // errors and warnings, in record order
    size_t rejected_clubs = 0;
    size_t rejected_connections = 0;
};

/// Build a snapshot from club and connection records.
/// Invalid records (duplicate club ids, self-loops, unknown endpoints,
/// out-of-range weights, misordered dates, duplicate connections) are
/// left out and reported in `issues`; nothing throws.
BuildResult buildGraph(const std::vector<ClubRecord>& clubs,
                       const std::vector<ConnectionRecord>& connections);

/// Node color of a league; unknown leagues get the neutral grey.
std::string leagueColor(const std::string& league);

} // namespace clubnet

#pragma once

#include "filter/filter_criteria.hpp"
#include "graph/graph_snapshot.hpp"

namespace clubnet {

struct FilterOptions {
    double weak_connection_threshold = 30.0;  // edges below are "weak"
};

// ─── Filter Engine ─────────────────────────────────────────────
// Derives a new snapshot; the source is never touched.
//
//   1. node filters (degree range uses degrees of the source snapshot)
//   2. edge filters, independent of node filters
//   3. drop edges whose endpoints were filtered out
//   4. hide isolated nodes (degree 0 after steps 2 and 3)
//   5. hide weak connections (weight < threshold); nodes stay
//   6. keep only the largest component (ties: first found)
//
// Metadata of the result is recomputed from scratch.

GraphSnapshot applyFilters(const GraphSnapshot& snapshot, const FilterCriteria& criteria,
                           const FilterOptions& options = {});

} // namespace clubnet

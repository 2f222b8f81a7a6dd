#pragma once

#include "filter/filter_criteria.hpp"
#include "graph/edge.hpp"
#include "graph/node.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace clubnet {

enum class Severity { Error, Warning };

/// One finding of a validation pass. Errors reject the input,
/// warnings are reported but accepted.
struct ValidationIssue {
    Severity severity = Severity::Error;
    std::string check_name;
    std::string message;
    uint64_t record_id = 0;  // 0 = not tied to a record
};

bool hasErrors(const std::vector<ValidationIssue>& issues);

/// Per-type conventions for connections.
struct ConnectionTypeProfile {
    ConnectionType type;
    const char* label;
    const char* color;
    ConnectionStrength default_strength;
    bool allows_bidirectional;
    bool requires_end_date;
    double typical_min_weight;
    double typical_max_weight;
};

const ConnectionTypeProfile& connectionTypeProfile(ConnectionType type);

/// Connection Validator: checks connection records against the set of
/// known clubs and the connections accepted so far. Every problem of a
/// record is reported, not just the first.
class ConnectionValidator {
public:
    explicit ConnectionValidator(std::unordered_set<NodeId> known_clubs)
        : known_clubs_(std::move(known_clubs)) {}

    /// Validate one record. Records without errors are remembered for
    /// duplicate detection.
    std::vector<ValidationIssue> check(const ConnectionRecord& record);

private:
    std::unordered_set<NodeId> known_clubs_;
    std::unordered_set<uint64_t> seen_ids_;
    std::set<std::pair<NodeId, NodeId>> seen_pairs_;
};

/// Filter Criteria Validator: rejects malformed ranges and bounds.
class FilterCriteriaValidator {
public:
    std::vector<ValidationIssue> check(const FilterCriteria& criteria) const;
};

} // namespace clubnet

#include "verification/verification.hpp"

#include <array>
#include <sstream>

namespace clubnet {

namespace {

const std::array<ConnectionTypeProfile, 12> kProfiles = {{
    {ConnectionType::Rivalry, "Rivalry", "#f44336", ConnectionStrength::Strong, true, false, 70, 100},
    {ConnectionType::Friendly, "Friendly", "#4caf50", ConnectionStrength::Moderate, true, false, 30, 70},
    {ConnectionType::Geographic, "Geographic", "#2196f3", ConnectionStrength::Moderate, true, false, 40, 80},
    {ConnectionType::Historical, "Historical", "#9c27b0", ConnectionStrength::Strong, true, false, 60, 90},
    {ConnectionType::Business, "Business", "#ff9800", ConnectionStrength::Moderate, false, true, 40, 80},
    {ConnectionType::PlayerTransfer, "Player Transfer", "#607d8b", ConnectionStrength::Weak, false, false, 20, 60},
    {ConnectionType::CoachingStaff, "Coaching Staff", "#795548", ConnectionStrength::Weak, false, false, 20, 60},
    {ConnectionType::Partnership, "Partnership", "#009688", ConnectionStrength::Strong, true, false, 70, 100},
    {ConnectionType::Transfer, "Transfer", "#546e7a", ConnectionStrength::Weak, false, false, 20, 60},
    {ConnectionType::Loan, "Loan", "#78909c", ConnectionStrength::Weak, false, true, 20, 60},
    {ConnectionType::YouthDevelopment, "Youth Development", "#8bc34a", ConnectionStrength::Moderate, true, false, 40, 80},
    {ConnectionType::Management, "Management", "#3f51b5", ConnectionStrength::Moderate, false, false, 30, 70},
}};

std::string formatNumber(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

template <typename T>
void checkRange(const std::optional<Range<T>>& range, const std::string& name,
                std::vector<ValidationIssue>& issues) {
    if (range && range->min > range->max) {
        issues.push_back({Severity::Error, name + "_order",
            name + " minimum " + formatNumber(static_cast<double>(range->min)) +
            " exceeds maximum " + formatNumber(static_cast<double>(range->max)), 0});
    }
}

} // namespace

bool hasErrors(const std::vector<ValidationIssue>& issues) {
    for (const auto& issue : issues) {
        if (issue.severity == Severity::Error) return true;
    }
    return false;
}

const ConnectionTypeProfile& connectionTypeProfile(ConnectionType type) {
    for (const auto& p : kProfiles) {
        if (p.type == type) return p;
    }
    return kProfiles[1];
}

// ─── Connection Validator ──────────────────────────────────────

std::vector<ValidationIssue> ConnectionValidator::check(const ConnectionRecord& record) {
    std::vector<ValidationIssue> issues;
    const uint64_t id = record.id;
    const std::string tag = "Connection " + std::to_string(id);

    if (seen_ids_.count(id)) {
        issues.push_back({Severity::Error, "connection_unique_id", tag + " is listed twice", id});
    }
    if (record.source_club == record.target_club) {
        issues.push_back({Severity::Error, "connection_not_self",
            "A club cannot be connected to itself (" + tag + ")", id});
    }
    if (!known_clubs_.count(record.source_club)) {
        issues.push_back({Severity::Error, "connection_source_exists",
            tag + " references unknown source club " + std::to_string(record.source_club), id});
    }
    if (!known_clubs_.count(record.target_club)) {
        issues.push_back({Severity::Error, "connection_target_exists",
            tag + " references unknown target club " + std::to_string(record.target_club), id});
    }
    if (record.weight < 0.0 || record.weight > 100.0) {
        issues.push_back({Severity::Error, "connection_weight_range",
            tag + " weight " + formatNumber(record.weight) + " outside [0, 100]", id});
    }
    if (record.start_date && record.end_date && *record.start_date >= *record.end_date) {
        issues.push_back({Severity::Error, "connection_dates_ordered",
            tag + ": start date must be before end date", id});
    }

    const ConnectionTypeProfile& profile = connectionTypeProfile(record.type);
    const auto pair = std::make_pair(record.source_club, record.target_club);
    const auto reverse = std::make_pair(record.target_club, record.source_club);
    if (seen_pairs_.count(pair) || (profile.allows_bidirectional && seen_pairs_.count(reverse))) {
        issues.push_back({Severity::Error, "connection_not_duplicate",
            "A connection between clubs " + std::to_string(record.source_club) + " and " +
            std::to_string(record.target_club) + " already exists", id});
    }

    if (profile.requires_end_date && !record.end_date) {
        issues.push_back({Severity::Warning, "connection_end_date",
            std::string(profile.label) + " connections typically require an end date", id});
    }
    if (record.weight < profile.typical_min_weight || record.weight > profile.typical_max_weight) {
        issues.push_back({Severity::Warning, "connection_typical_weight",
            "Weight should be between " + formatNumber(profile.typical_min_weight) + " and " +
            formatNumber(profile.typical_max_weight) + " for " + profile.label + " connections", id});
    }

    if (!hasErrors(issues)) {
        seen_ids_.insert(id);
        seen_pairs_.insert(pair);
    }
    return issues;
}

// ─── Filter Criteria Validator ─────────────────────────────────

std::vector<ValidationIssue> FilterCriteriaValidator::check(const FilterCriteria& criteria) const {
    std::vector<ValidationIssue> issues;
    const auto& nf = criteria.node_filters;
    const auto& ef = criteria.edge_filters;

    checkRange(nf.founded_year_range, "founded_year_range", issues);
    checkRange(nf.degree_range, "degree_range", issues);
    checkRange(ef.weight_range, "weight_range", issues);

    if (ef.weight_range && (ef.weight_range->min < 0.0 || ef.weight_range->max > 100.0)) {
        issues.push_back({Severity::Error, "weight_range_bounds",
            "weight_range must lie within [0, 100]", 0});
    }
    if (nf.founded_year_range && nf.founded_year_range->min < 0) {
        issues.push_back({Severity::Error, "founded_year_range_bounds",
            "founded_year_range must not be negative", 0});
    }
    return issues;
}

} // namespace clubnet

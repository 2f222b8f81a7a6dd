#pragma once

#include "config/graph_config.hpp"
#include "filter/filter_criteria.hpp"
#include "graph/edge.hpp"

#include <nlohmann/json.hpp>

namespace clubnet {

// JSON conversions found by nlohmann::json through ADL.
// from_json keeps the default of every key that is absent.

void to_json(nlohmann::json& j, ConnectionType type);
void from_json(const nlohmann::json& j, ConnectionType& type);
void to_json(nlohmann::json& j, ConnectionStrength strength);
void from_json(const nlohmann::json& j, ConnectionStrength& strength);

void to_json(nlohmann::json& j, const GraphConfig& config);
void from_json(const nlohmann::json& j, GraphConfig& config);

void to_json(nlohmann::json& j, const EngineConfig& config);
void from_json(const nlohmann::json& j, EngineConfig& config);

void to_json(nlohmann::json& j, const FilterCriteria& criteria);
void from_json(const nlohmann::json& j, FilterCriteria& criteria);

} // namespace clubnet

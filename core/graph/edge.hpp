#pragma once

#include "graph/node.hpp"

#include <optional>
#include <string>

namespace clubnet {

enum class ConnectionType {
    Rivalry,
    Friendly,
    Geographic,
    Historical,
    Business,
    PlayerTransfer,
    CoachingStaff,
    Partnership,
    Transfer,
    Loan,
    YouthDevelopment,
    Management
};

enum class ConnectionStrength {
    Weak,
    Moderate,
    Strong
};

std::string toString(ConnectionType type);
std::string toString(ConnectionStrength strength);

/// Accepts both "player-transfer" and "player_transfer" spellings.
std::optional<ConnectionType> parseConnectionType(const std::string& text);

/// "very_strong" maps to Strong.
std::optional<ConnectionStrength> parseConnectionStrength(const std::string& text);

/// Connection record as delivered by the data source.
struct ConnectionRecord {
    uint64_t id = 0;
    NodeId source_club = 0;
    NodeId target_club = 0;
    ConnectionType type = ConnectionType::Friendly;
    ConnectionStrength strength = ConnectionStrength::Moderate;
    double weight = 50.0;
    bool is_active = true;
    std::optional<std::string> start_date;  // YYYY-MM-DD
    std::optional<std::string> end_date;
    std::string label;
    std::string description;
};

/// An undirected-for-analysis link between two clubs.
/// Weight is relationship strength in [0, 100].
struct Edge {
    std::string id;
    NodeId source = 0;
    NodeId target = 0;
    ConnectionType type = ConnectionType::Friendly;
    ConnectionStrength strength = ConnectionStrength::Moderate;
    double weight = 50.0;
    bool is_active = true;
    std::optional<std::string> start_date;
    std::optional<std::string> end_date;
    std::string label;
    std::string description;

    Edge() = default;
    Edge(std::string id, NodeId source, NodeId target,
         ConnectionType type = ConnectionType::Friendly, double weight = 50.0)
        : id(std::move(id)), source(source), target(target),
          type(type), weight(weight) {}

    bool touches(NodeId node) const { return source == node || target == node; }

    NodeId opposite(NodeId node) const { return source == node ? target : source; }
};

std::string edgeIdFor(uint64_t connection_id);

} // namespace clubnet

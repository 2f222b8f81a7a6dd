#include "graph/edge.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace clubnet {

namespace {

const std::array<std::pair<ConnectionType, const char*>, 12> kTypeNames = {{
    {ConnectionType::Rivalry, "rivalry"},
    {ConnectionType::Friendly, "friendly"},
    {ConnectionType::Geographic, "geographic"},
    {ConnectionType::Historical, "historical"},
    {ConnectionType::Business, "business"},
    {ConnectionType::PlayerTransfer, "player-transfer"},
    {ConnectionType::CoachingStaff, "coaching-staff"},
    {ConnectionType::Partnership, "partnership"},
    {ConnectionType::Transfer, "transfer"},
    {ConnectionType::Loan, "loan"},
    {ConnectionType::YouthDevelopment, "youth-development"},
    {ConnectionType::Management, "management"},
}};

std::string normalize(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        if (c == '_' || c == ' ') return '-';
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

} // namespace

std::string toString(ConnectionType type) {
    for (const auto& [t, name] : kTypeNames) {
        if (t == type) return name;
    }
    return "unknown";
}

std::string toString(ConnectionStrength strength) {
    switch (strength) {
        case ConnectionStrength::Weak:     return "weak";
        case ConnectionStrength::Moderate: return "moderate";
        case ConnectionStrength::Strong:   return "strong";
    }
    return "unknown";
}

std::optional<ConnectionType> parseConnectionType(const std::string& text) {
    const std::string key = normalize(text);
    for (const auto& [t, name] : kTypeNames) {
        if (key == name) return t;
    }
    return std::nullopt;
}

std::optional<ConnectionStrength> parseConnectionStrength(const std::string& text) {
    const std::string key = normalize(text);
    if (key == "weak") return ConnectionStrength::Weak;
    if (key == "moderate") return ConnectionStrength::Moderate;
    if (key == "strong" || key == "very-strong") return ConnectionStrength::Strong;
    return std::nullopt;
}

std::string edgeIdFor(uint64_t connection_id) {
    return "connection-" + std::to_string(connection_id);
}

} // namespace clubnet

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace clubnet {

using NodeId = uint64_t;

/// Club record as delivered by the data source.
struct ClubRecord {
    NodeId id = 0;
    std::string name;
    std::string city;
    std::string league;
    int founded_year = 0;
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::string stadium;
    std::string website;
    bool is_active = true;

    bool hasCoordinates() const {
        return latitude.has_value() && longitude.has_value();
    }
};

struct Point {
    double x = 0.0;
    double y = 0.0;
};

/// A node of the club network. One node per club.
/// Carries the source club record plus rendering attributes.
struct Node {
    NodeId id = 0;
    std::string label;
    ClubRecord club;
    double size = 10.0;
    std::string color = "#718096";
    std::string shape = "circle";
    std::optional<Point> position;

    Node() = default;
    Node(NodeId id, std::string label)
        : id(id), label(std::move(label)) {}

    explicit Node(const ClubRecord& record)
        : id(record.id), label(record.name), club(record) {}
};

} // namespace clubnet

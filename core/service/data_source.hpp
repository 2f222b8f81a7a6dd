#pragma once

#include "graph/edge.hpp"
#include "graph/node.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace clubnet {

/// Upstream failure while fetching club or connection records.
class DataSourceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Where club and connection records come from. Implementations throw
/// DataSourceError on failure. `force_refresh` bypasses any cache.
class GraphDataSource {
public:
    virtual ~GraphDataSource() = default;

    virtual std::vector<ClubRecord> loadClubs(bool force_refresh) = 0;
    virtual std::vector<ConnectionRecord> loadConnections(bool force_refresh) = 0;
};

/// Records held in memory. Used by tests and by hosts that fetch the
/// data themselves.
class InMemoryDataSource : public GraphDataSource {
public:
    InMemoryDataSource() = default;
    InMemoryDataSource(std::vector<ClubRecord> clubs, std::vector<ConnectionRecord> connections)
        : clubs_(std::move(clubs)), connections_(std::move(connections)) {}

    std::vector<ClubRecord> loadClubs(bool) override { return clubs_; }
    std::vector<ConnectionRecord> loadConnections(bool) override { return connections_; }

    void setClubs(std::vector<ClubRecord> clubs) { clubs_ = std::move(clubs); }
    void setConnections(std::vector<ConnectionRecord> connections) {
        connections_ = std::move(connections);
    }

private:
    std::vector<ClubRecord> clubs_;
    std::vector<ConnectionRecord> connections_;
};

// ─── JSON File Source ──────────────────────────────────────────
// Reads {"clubs": [...], "connections": [...]} from a file. The parsed
// document is cached until a forced refresh.
//
// Club keys:        id, name, city, league, founded_year, latitude,
//                   longitude, stadium, website, is_active
// Connection keys:  id, source_club, target_club, type, strength,
//                   weight, is_active, start_date, end_date, label,
//                   description

class JsonFileDataSource : public GraphDataSource {
public:
    explicit JsonFileDataSource(std::string path) : path_(std::move(path)) {}

    std::vector<ClubRecord> loadClubs(bool force_refresh) override;
    std::vector<ConnectionRecord> loadConnections(bool force_refresh) override;

    const std::string& path() const { return path_; }

private:
    void ensureLoaded(bool force_refresh);

    std::string path_;
    bool loaded_ = false;
    std::vector<ClubRecord> clubs_;
    std::vector<ConnectionRecord> connections_;
};

/// Parse records from an already loaded document. Throws DataSourceError
/// on missing required keys or unknown connection types.
std::vector<ClubRecord> parseClubs(const std::string& json_text);
std::vector<ConnectionRecord> parseConnections(const std::string& json_text);

} // namespace clubnet

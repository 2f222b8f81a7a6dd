#include "service/data_source.hpp"
#include "util/log.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace clubnet {

namespace {

template <typename T>
std::optional<T> optionalField(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<T>();
}

template <typename T>
T fieldOr(const nlohmann::json& j, const char* key, T fallback) {
    auto value = optionalField<T>(j, key);
    return value ? *value : fallback;
}

nlohmann::json parseDocument(const std::string& text) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw DataSourceError(std::string("Malformed graph data: ") + e.what());
    }
}

std::vector<ClubRecord> clubsFrom(const nlohmann::json& doc) {
    std::vector<ClubRecord> clubs;
    auto it = doc.find("clubs");
    if (it == doc.end()) return clubs;
    try {
        for (const auto& j : *it) {
            ClubRecord c;
            c.id = j.at("id").get<NodeId>();
            c.name = j.at("name").get<std::string>();
            c.city = fieldOr<std::string>(j, "city", "");
            c.league = fieldOr<std::string>(j, "league", "");
            c.founded_year = fieldOr<int>(j, "founded_year", 0);
            c.latitude = optionalField<double>(j, "latitude");
            c.longitude = optionalField<double>(j, "longitude");
            c.stadium = fieldOr<std::string>(j, "stadium", "");
            c.website = fieldOr<std::string>(j, "website", "");
            c.is_active = fieldOr<bool>(j, "is_active", true);
            clubs.push_back(std::move(c));
        }
    } catch (const nlohmann::json::exception& e) {
        throw DataSourceError(std::string("Invalid club record: ") + e.what());
    }
    return clubs;
}

std::vector<ConnectionRecord> connectionsFrom(const nlohmann::json& doc) {
    std::vector<ConnectionRecord> connections;
    auto it = doc.find("connections");
    if (it == doc.end()) return connections;
    try {
        for (const auto& j : *it) {
            ConnectionRecord r;
            r.id = j.at("id").get<uint64_t>();
            r.source_club = j.at("source_club").get<NodeId>();
            r.target_club = j.at("target_club").get<NodeId>();

            const std::string type = j.at("type").get<std::string>();
            auto parsed_type = parseConnectionType(type);
            if (!parsed_type) {
                throw DataSourceError("Connection " + std::to_string(r.id) +
                                      " has unknown type '" + type + "'");
            }
            r.type = *parsed_type;

            const std::string strength = fieldOr<std::string>(j, "strength", "moderate");
            auto parsed_strength = parseConnectionStrength(strength);
            if (!parsed_strength) {
                throw DataSourceError("Connection " + std::to_string(r.id) +
                                      " has unknown strength '" + strength + "'");
            }
            r.strength = *parsed_strength;

            r.weight = fieldOr<double>(j, "weight", 50.0);
            r.is_active = fieldOr<bool>(j, "is_active", true);
            r.start_date = optionalField<std::string>(j, "start_date");
            r.end_date = optionalField<std::string>(j, "end_date");
            r.label = fieldOr<std::string>(j, "label", "");
            r.description = fieldOr<std::string>(j, "description", "");
            connections.push_back(std::move(r));
        }
    } catch (const nlohmann::json::exception& e) {
        throw DataSourceError(std::string("Invalid connection record: ") + e.what());
    }
    return connections;
}

} // namespace

std::vector<ClubRecord> parseClubs(const std::string& json_text) {
    return clubsFrom(parseDocument(json_text));
}

std::vector<ConnectionRecord> parseConnections(const std::string& json_text) {
    return connectionsFrom(parseDocument(json_text));
}

// ─── JSON File Source ──────────────────────────────────────────

void JsonFileDataSource::ensureLoaded(bool force_refresh) {
    if (loaded_ && !force_refresh) return;

    std::ifstream in(path_);
    if (!in.is_open()) {
        throw DataSourceError("Cannot open graph data file: " + path_);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    const nlohmann::json doc = parseDocument(buffer.str());
    clubs_ = clubsFrom(doc);
    connections_ = connectionsFrom(doc);
    loaded_ = true;
    CLUBNET_LOG_DEBUG("read %zu clubs and %zu connections from %s",
                      clubs_.size(), connections_.size(), path_.c_str());
}

std::vector<ClubRecord> JsonFileDataSource::loadClubs(bool force_refresh) {
    ensureLoaded(force_refresh);
    return clubs_;
}

std::vector<ConnectionRecord> JsonFileDataSource::loadConnections(bool force_refresh) {
    ensureLoaded(force_refresh);
    return connections_;
}

} // namespace clubnet

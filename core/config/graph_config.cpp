#include "config/graph_config.hpp"
#include "config/serialization.hpp"
#include "util/log.hpp"

#include <fstream>
#include <stdexcept>

namespace clubnet {

bool operator==(const GraphConfig& a, const GraphConfig& b) {
    return nlohmann::json(a) == nlohmann::json(b);
}

const std::vector<std::string>& availableLayouts() {
    static const std::vector<std::string> kLayouts = {
        "force-directed", "circular", "grid", "hierarchical",
        "concentric", "breadthfirst", "cose", "fcose",
    };
    return kLayouts;
}

EngineConfig loadEngineConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open engine config: " + path);
    }

    EngineConfig config;
    try {
        nlohmann::json j;
        in >> j;
        config = j.get<EngineConfig>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed engine config " + path + ": " + e.what());
    }
    CLUBNET_LOG_INFO("engine config loaded from %s", path.c_str());
    return config;
}

} // namespace clubnet

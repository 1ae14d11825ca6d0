/**
 * @file location_loader.cpp
 */

#include "location_loader.h"
#include "json_codec.h"
#include "exceptions.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <set>
#include <sstream>

namespace ocspdash {
namespace monitor {
namespace infrastructure {

std::vector<health::Location> LocationLoader::parse(const std::string& json) {
    Json::Value root = parseJson(json, "locations file");
    if (!root.isArray()) {
        throw common::ParsingException("locations file must contain a JSON array");
    }

    std::vector<health::Location> locations;
    std::set<std::string> seen;
    for (Json::ArrayIndex i = 0; i < root.size(); ++i) {
        const Json::Value& item = root[i];
        if (!item.isObject()) {
            throw common::ParsingException("location #" + std::to_string(i) + " is not an object");
        }

        health::Location location;
        location.id = item.get("id", "").asString();
        location.name = item.get("name", "").asString();
        location.address = item.get("address", "").asString();
        location.credentialRef = item.get("credential", "").asString();

        if (location.id.empty() || location.name.empty()) {
            throw common::ParsingException("location #" + std::to_string(i) + " requires id and name");
        }
        if (!seen.insert(location.id).second) {
            throw common::ParsingException("duplicate location id: " + location.id);
        }
        locations.push_back(std::move(location));
    }
    return locations;
}

size_t LocationLoader::loadFile(const std::string& path, health::LocationRegistry& registry) {
    std::ifstream file(path);
    if (!file) {
        throw common::ParsingException("cannot open locations file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto locations = parse(buffer.str());
    for (const auto& location : locations) {
        registry.upsert(location);
        spdlog::info("[LocationLoader] {} ({}) via {}", location.id, location.name,
                     location.isLocal() ? "local" : location.address);
    }
    return locations.size();
}

health::Location LocationLoader::defaultLocal() {
    health::Location location;
    location.id = "local";
    location.name = "Local";
    location.address = "local";
    return location;
}

} // namespace infrastructure
} // namespace monitor
} // namespace ocspdash

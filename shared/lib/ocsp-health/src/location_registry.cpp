/**
 * @file location_registry.cpp
 * @brief Vantage point registry implementation
 */

#include "ocspdash/health/location_registry.h"

#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace ocspdash::health {

void LocationRegistry::upsert(const Location& location) {
    if (location.id.empty()) {
        throw std::invalid_argument("LocationRegistry: location id cannot be empty");
    }
    if (location.name.empty()) {
        throw std::invalid_argument("LocationRegistry: location name cannot be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    bool replaced = locations_.count(location.id) > 0;
    locations_[location.id] = location;
    spdlog::info("[LocationRegistry] {} location {} ({}, {})",
                 replaced ? "Updated" : "Registered", location.id, location.name,
                 location.isLocal() ? "local" : location.address);
}

bool LocationRegistry::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = locations_.erase(id) > 0;
    if (removed) {
        spdlog::info("[LocationRegistry] Removed location {}", id);
    }
    return removed;
}

std::optional<Location> LocationRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locations_.find(id);
    if (it == locations_.end()) return std::nullopt;
    return it->second;
}

std::vector<Location> LocationRegistry::list() const {
    std::vector<Location> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(locations_.size());
        for (const auto& [id, location] : locations_) {
            result.push_back(location);
        }
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const Location& a, const Location& b) { return a.name < b.name; });
    return result;
}

size_t LocationRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locations_.size();
}

} // namespace ocspdash::health

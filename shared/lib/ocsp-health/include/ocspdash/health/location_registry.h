/**
 * @file location_registry.h
 * @brief Thread-safe registry of vantage points
 */

#pragma once

#include "ocspdash/health/models.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ocspdash::health {

class LocationRegistry {
public:
    /**
     * @brief Add or replace a location
     * @throws std::invalid_argument if id or name is empty
     */
    void upsert(const Location& location);

    /// @return true if a location was removed
    bool remove(const std::string& id);

    std::optional<Location> find(const std::string& id) const;

    /// @brief All locations sorted by display name
    std::vector<Location> list() const;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Location> locations_;
};

} // namespace ocspdash::health

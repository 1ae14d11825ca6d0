#pragma once

/**
 * @file location_loader.h
 * @brief Loads vantage point definitions from a JSON file
 *
 * Format:
 * [
 *   {"id": "local", "name": "Local"},
 *   {"id": "eu-1", "name": "Frankfurt", "address": "https://agent-eu1:8443", "credential": "AGENT_EU1_TOKEN"}
 * ]
 */

#include "ocspdash/health/location_registry.h"

#include <string>
#include <vector>

namespace ocspdash {
namespace monitor {
namespace infrastructure {

class LocationLoader {
public:
    /**
     * @brief Parse a locations document
     * @throws common::ParsingException on invalid JSON, a non-array root,
     *         a missing id/name or a duplicate id
     */
    static std::vector<health::Location> parse(const std::string& json);

    /**
     * @brief Read a file and upsert its locations into the registry
     * @return Number of locations loaded
     * @throws common::ParsingException if the file cannot be read or parsed
     */
    static size_t loadFile(const std::string& path, health::LocationRegistry& registry);

    /// @brief The single local vantage point used when no file is configured
    static health::Location defaultLocal();
};

} // namespace infrastructure
} // namespace monitor
} // namespace ocspdash

#pragma once

#include "config_manager.h"
#include "exceptions.h"

#include <string>

namespace ocspdash {
namespace monitor {

// =============================================================================
// Global Configuration
// =============================================================================
struct Config {
    using Keys = common::ConfigManager;

    // Certificate intelligence API (Censys)
    std::string censysApiId;        // Must be set via environment variable
    std::string censysApiSecret;    // Must be set via environment variable
    std::string censysApiUrl = "https://censys.io/api/v1";
    double censysRateLimit = 0.2;   // calls per second
    int censysMaxPages = 1;

    // Discovery
    int discoveryTtlHours = 168;    // 7 days
    int topAuthorities = 10;

    // Probing
    int probeTimeoutMs = 10000;
    int maxInFlight = 32;
    int maxPerLocation = 4;
    int maxPerResponder = 2;
    int nextUpdateGraceSeconds = 0;

    // Result sink
    int sinkMaxAttempts = 3;
    int sinkBackoffMs = 200;

    // Scheduler
    int cycleIntervalMinutes = 60;

    // Service
    std::string locationsFile;
    std::string logLevel = "info";
    std::string logFile;
    std::string userAgent = "ocspdash/1.0";

    void loadFromEnv() {
        const auto& cfg = common::ConfigManager::getInstance();
        censysApiId = cfg.getString(Keys::CENSYS_API_ID, censysApiId);
        censysApiSecret = cfg.getString(Keys::CENSYS_API_SECRET, censysApiSecret);
        censysApiUrl = cfg.getString(Keys::CENSYS_API_URL, censysApiUrl);
        censysRateLimit = cfg.getDouble(Keys::CENSYS_RATE_LIMIT, censysRateLimit);
        censysMaxPages = cfg.getInt(Keys::CENSYS_MAX_PAGES, censysMaxPages);
        discoveryTtlHours = cfg.getInt(Keys::DISCOVERY_TTL_HOURS, discoveryTtlHours);
        topAuthorities = cfg.getInt(Keys::TOP_AUTHORITIES, topAuthorities);
        probeTimeoutMs = cfg.getInt(Keys::PROBE_TIMEOUT_MS, probeTimeoutMs);
        maxInFlight = cfg.getInt(Keys::MAX_IN_FLIGHT, maxInFlight);
        maxPerLocation = cfg.getInt(Keys::MAX_PER_LOCATION, maxPerLocation);
        maxPerResponder = cfg.getInt(Keys::MAX_PER_RESPONDER, maxPerResponder);
        nextUpdateGraceSeconds = cfg.getInt(Keys::NEXT_UPDATE_GRACE_SECONDS, nextUpdateGraceSeconds);
        sinkMaxAttempts = cfg.getInt(Keys::SINK_MAX_ATTEMPTS, sinkMaxAttempts);
        sinkBackoffMs = cfg.getInt(Keys::SINK_BACKOFF_MS, sinkBackoffMs);
        cycleIntervalMinutes = cfg.getInt(Keys::CYCLE_INTERVAL_MINUTES, cycleIntervalMinutes);
        locationsFile = cfg.getString(Keys::LOCATIONS_FILE, locationsFile);
        logLevel = cfg.getString(Keys::LOG_LEVEL, logLevel);
        logFile = cfg.getString(Keys::LOG_FILE, logFile);
        userAgent = cfg.getString(Keys::USER_AGENT, userAgent);
    }

    // Validate required credentials are set
    void validateRequiredCredentials() const {
        if (censysApiId.empty()) {
            throw common::ConfigException("CENSYS_API_ID environment variable not set");
        }
        if (censysApiSecret.empty()) {
            throw common::ConfigException("CENSYS_API_SECRET environment variable not set");
        }
    }

    // Reject values the components cannot run with
    void validate() const {
        if (!(censysRateLimit > 0.0)) {
            throw common::ConfigException("CENSYS_RATE_LIMIT must be positive");
        }
        if (censysMaxPages < 1) {
            throw common::ConfigException("CENSYS_MAX_PAGES must be at least 1");
        }
        if (discoveryTtlHours < 0) {
            throw common::ConfigException("DISCOVERY_TTL_HOURS cannot be negative");
        }
        if (probeTimeoutMs <= 0) {
            throw common::ConfigException("PROBE_TIMEOUT_MS must be positive");
        }
        if (maxInFlight < 1 || maxPerLocation < 1 || maxPerResponder < 1) {
            throw common::ConfigException("MAX_IN_FLIGHT, MAX_PER_LOCATION and MAX_PER_RESPONDER must be at least 1");
        }
        if (nextUpdateGraceSeconds < 0) {
            throw common::ConfigException("NEXT_UPDATE_GRACE_SECONDS cannot be negative");
        }
        if (sinkMaxAttempts < 1) {
            throw common::ConfigException("SINK_MAX_ATTEMPTS must be at least 1");
        }
        if (cycleIntervalMinutes < 1) {
            throw common::ConfigException("CYCLE_INTERVAL_MINUTES must be at least 1");
        }
    }
};

} // namespace monitor
} // namespace ocspdash

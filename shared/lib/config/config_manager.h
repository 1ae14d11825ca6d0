/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Provides unified access to environment variables.
 * Features:
 * - Environment variable access with defaults
 * - Type-safe configuration retrieval
 * - Explicit overrides (tests, command line)
 * - Thread-safe singleton pattern
 */

#pragma once

#include <string>
#include <map>
#include <mutex>
#include <memory>

namespace ocspdash::common {

/**
 * @brief Configuration Manager (Singleton)
 *
 * Lookup order: explicit set() / loaded environment snapshot, then the live
 * environment, then the caller's default.
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    // Singleton instance
    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    // Private constructor (singleton)
    ConfigManager();

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    // Delete copy and move
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get integer configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found or unparseable
     * @return Configuration value
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get floating-point configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found or unparseable
     * @return Configuration value
     */
    double getDouble(const std::string& key, double defaultValue = 0.0) const;

    /**
     * @brief Get boolean configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Check if configuration key exists
     */
    bool has(const std::string& key) const;

    /**
     * @brief Set configuration value
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Remove an explicit value (the environment is consulted again)
     */
    void unset(const std::string& key);

    /**
     * @brief Load configuration from environment
     */
    void loadFromEnvironment();

    /**
     * @brief Get environment variable
     * @param key Environment variable name
     * @param defaultValue Default if not found
     * @return Environment variable value
     */
    static std::string getEnv(const std::string& key, const std::string& defaultValue = "");

    /// @name Predefined Configuration Keys

    // Certificate intelligence API
    static constexpr const char* CENSYS_API_ID = "CENSYS_API_ID";
    static constexpr const char* CENSYS_API_SECRET = "CENSYS_API_SECRET";
    static constexpr const char* CENSYS_API_URL = "CENSYS_API_URL";
    static constexpr const char* CENSYS_RATE_LIMIT = "CENSYS_RATE_LIMIT";
    static constexpr const char* CENSYS_MAX_PAGES = "CENSYS_MAX_PAGES";

    // Discovery
    static constexpr const char* DISCOVERY_TTL_HOURS = "DISCOVERY_TTL_HOURS";
    static constexpr const char* TOP_AUTHORITIES = "TOP_AUTHORITIES";

    // Probing
    static constexpr const char* PROBE_TIMEOUT_MS = "PROBE_TIMEOUT_MS";
    static constexpr const char* MAX_IN_FLIGHT = "MAX_IN_FLIGHT";
    static constexpr const char* MAX_PER_LOCATION = "MAX_PER_LOCATION";
    static constexpr const char* MAX_PER_RESPONDER = "MAX_PER_RESPONDER";
    static constexpr const char* NEXT_UPDATE_GRACE_SECONDS = "NEXT_UPDATE_GRACE_SECONDS";

    // Result sink
    static constexpr const char* SINK_MAX_ATTEMPTS = "SINK_MAX_ATTEMPTS";
    static constexpr const char* SINK_BACKOFF_MS = "SINK_BACKOFF_MS";

    // Service
    static constexpr const char* CYCLE_INTERVAL_MINUTES = "CYCLE_INTERVAL_MINUTES";
    static constexpr const char* LOCATIONS_FILE = "LOCATIONS_FILE";
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_FILE = "LOG_FILE";
    static constexpr const char* USER_AGENT = "OCSPDASH_USER_AGENT";
};

} // namespace ocspdash::common

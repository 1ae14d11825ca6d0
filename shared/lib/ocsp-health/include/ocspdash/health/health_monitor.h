/**
 * @file health_monitor.h
 * @brief Monitoring cycle orchestration, manifest and status report
 *
 * One cycle:
 *   1. Resolve the top-N authorities (catalog refreshed from the source when
 *      empty or older than the catalog TTL)
 *   2. getOrRefresh the discovery snapshot of each authority
 *   3. Build one target per responder and dispatch across all locations
 */

#pragma once

#include "ocspdash/health/discovery_cache.h"
#include "ocspdash/health/location_registry.h"
#include "ocspdash/health/models.h"
#include "ocspdash/health/probe_dispatcher.h"
#include "ocspdash/health/providers.h"
#include "ocspdash/health/result_store.h"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

namespace ocspdash::health {

/// @brief Cycle tunables
struct MonitorSettings {
    int topAuthorities = 10;                        ///< 0: monitor registered authorities only
    std::chrono::seconds catalogTtl{7 * 24 * 3600};
};

/// @brief Summary of one monitoring cycle
struct CycleSummary {
    size_t authorities = 0;
    size_t targets = 0;
    size_t locations = 0;
    size_t results = 0;
    size_t good = 0;
    size_t questionable = 0;
    size_t bad = 0;
    size_t cancelled = 0;
    std::vector<std::string> degradedAuthorities;
    TimePoint startedAt{};
    Millis duration{0};

    Json::Value toJson() const;
};

/// @brief One responder with the certificates needed to probe it
struct ManifestEntry {
    std::string authorityName;
    std::string responderUrl;
    std::string subjectBase64;
    std::string issuerBase64;

    Json::Value toJson() const;
};

/// @brief Latest result of one responder at one location
struct StatusCell {
    std::string locationId;
    std::optional<Result> result;   ///< std::nullopt if never tested
};

/// @brief One responder row of the report
struct StatusRow {
    Responder responder;
    bool current = false;           ///< Selected chain is unexpired
    std::vector<StatusCell> cells;  ///< One per location, in report location order
};

/// @brief One authority section of the report
struct AuthoritySection {
    Authority authority;
    bool degraded = false;
    std::vector<StatusRow> rows;    ///< Sorted by responder cardinality, then URL
};

/// @brief Read contract rendered for the presentation layer
struct HealthReport {
    std::vector<Location> locations;
    std::vector<AuthoritySection> sections;
    TimePoint generatedAt{};

    Json::Value toJson() const;
};

class HealthMonitor {
public:
    /**
     * @param source Certificate source for the authority catalog (non-owning, may be
     *        nullptr when authorities are only registered manually)
     * @param cache Discovery cache (non-owning)
     * @param registry Location registry (non-owning)
     * @param dispatcher Probe dispatcher (non-owning)
     * @param store Result store backing the read contract (non-owning)
     * @param clock Injected clock (non-owning)
     * @throws std::invalid_argument if a required collaborator is nullptr
     */
    HealthMonitor(ICertificateSource* source,
                  DiscoveryCache* cache,
                  LocationRegistry* registry,
                  ProbeDispatcher* dispatcher,
                  ResultStore* store,
                  const IClock* clock,
                  MonitorSettings settings = {});

    /// @brief Add an authority to the catalog (kept across catalog refreshes)
    void registerAuthority(const Authority& authority);

    /**
     * @brief Monitored authorities, highest cardinality first
     *
     * Refreshes the catalog from the source when it is empty or older than
     * the catalog TTL. A failed refresh keeps the current catalog.
     */
    std::vector<Authority> refreshAuthorities();

    /// @brief Current catalog without refreshing
    std::vector<Authority> authorities() const;

    /// @brief Run one full monitoring cycle
    CycleSummary runCycle(const CancellationToken& cancellation);

    /// @brief Responders and certificates of the monitored authorities
    std::vector<ManifestEntry> manifest() const;

    /// @brief Render a manifest as JSON Lines
    static std::string toJsonLines(const std::vector<ManifestEntry>& entries);

    /**
     * @brief Latest Result per (responder, location) for the requested authorities
     * @param authorityIds Authorities to include; empty means the whole catalog
     */
    HealthReport report(const std::vector<std::string>& authorityIds = {}) const;

private:
    std::vector<Authority> rankedLocked() const;
    void nameFromSnapshot(const DiscoverySnapshot& snapshot);

    ICertificateSource* source_;
    DiscoveryCache* cache_;
    LocationRegistry* registry_;
    ProbeDispatcher* dispatcher_;
    ResultStore* store_;
    const IClock* clock_;
    MonitorSettings settings_;

    mutable std::mutex catalogMutex_;
    std::map<std::string, Authority> catalog_;
    std::optional<TimePoint> catalogRefreshedAt_;
};

} // namespace ocspdash::health

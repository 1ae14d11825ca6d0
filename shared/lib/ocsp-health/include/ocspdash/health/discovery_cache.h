/**
 * @file discovery_cache.h
 * @brief Freshness policy and storage for discovery results
 *
 * Bounds calls into the certificate-intelligence API:
 *   - A snapshot younger than the TTL is served with zero external calls
 *   - A stale or absent snapshot triggers one discovery run, merged into the
 *     previous snapshot (known responders are never dropped)
 *   - Concurrent refreshes of one authority collapse into one in-flight run
 *   - A failed refresh serves the previous snapshot flagged degraded
 */

#pragma once

#include "ocspdash/health/discovery_engine.h"
#include "ocspdash/health/models.h"
#include "ocspdash/health/providers.h"

#include <chrono>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ocspdash::health {

/// @brief When a chain was last seen for a responder
struct ChainSighting {
    std::string chainId;
    TimePoint discoveredAt{};
};

/// @brief A responder together with every chain ever seen for it
struct KnownResponder {
    Responder responder;
    std::vector<ChainSighting> sightings;
};

/// @brief Cached discovery state for one authority
struct DiscoverySnapshot {
    std::string authorityId;
    std::vector<KnownResponder> responders;     ///< Sorted by URL
    std::map<std::string, Chain> chains;        ///< Content-addressed by chain id
    TimePoint refreshedAt{};
    bool degraded = false;                      ///< Served after a failed refresh
    std::string degradedReason;
    DiscoveryStats lastStats;

    /**
     * @brief Select the chain to test a responder with
     *
     * Most recently discovered chain that is unexpired at @p now; if every
     * known chain has expired, the most recently discovered one.
     */
    std::optional<Chain> selectChain(const KnownResponder& known, TimePoint now) const;

    /// @brief One target per responder that has at least one chain
    std::vector<ProbeTarget> targets(TimePoint now) const;
};

/**
 * @brief Snapshot persistence seam
 */
class IDiscoveryStore {
public:
    virtual ~IDiscoveryStore() = default;

    virtual std::optional<DiscoverySnapshot> load(const std::string& authorityId) const = 0;
    virtual void save(const DiscoverySnapshot& snapshot) = 0;
};

/// @brief Process-local IDiscoveryStore
class InMemoryDiscoveryStore : public IDiscoveryStore {
public:
    std::optional<DiscoverySnapshot> load(const std::string& authorityId) const override;
    void save(const DiscoverySnapshot& snapshot) override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, DiscoverySnapshot> snapshots_;
};

class DiscoveryCache {
public:
    /**
     * @param engine Discovery engine (non-owning)
     * @param store Snapshot store (non-owning)
     * @param clock Injected clock (non-owning)
     * @param ttl Snapshot lifetime before re-validation
     * @throws std::invalid_argument if a collaborator is nullptr
     */
    DiscoveryCache(DiscoveryEngine* engine, IDiscoveryStore* store,
                   const IClock* clock, std::chrono::seconds ttl);

    /**
     * @brief Fresh snapshot, refreshing through the engine if stale
     *
     * Never throws for source failures: returns the previous snapshot (or an
     * empty one) flagged degraded.
     */
    DiscoverySnapshot getOrRefresh(const Authority& authority);

    /// @brief Cached snapshot without refreshing
    std::optional<DiscoverySnapshot> peek(const std::string& authorityId) const;

    /// @brief True if the snapshot is younger than the TTL
    bool isFresh(const DiscoverySnapshot& snapshot) const;

    std::chrono::seconds ttl() const { return ttl_; }

    /**
     * @brief Merge a discovery batch into the previous snapshot
     *
     * Previously known responders are retained, new responders and chains
     * are added, sighting timestamps of rediscovered chains are refreshed and
     * responder cardinality is replaced by the batch value.
     */
    static DiscoverySnapshot merge(const std::optional<DiscoverySnapshot>& previous,
                                   const DiscoveryBatch& batch, TimePoint now);

private:
    DiscoveryEngine* engine_;
    IDiscoveryStore* store_;
    const IClock* clock_;
    std::chrono::seconds ttl_;

    std::mutex mutex_;
    std::map<std::string, std::shared_future<DiscoverySnapshot>> inFlight_;
};

} // namespace ocspdash::health

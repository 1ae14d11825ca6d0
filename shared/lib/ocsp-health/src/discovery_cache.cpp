/**
 * @file discovery_cache.cpp
 * @brief Discovery cache manager implementation
 */

#include "ocspdash/health/discovery_cache.h"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace ocspdash::health {

// --- DiscoverySnapshot ---

std::optional<Chain> DiscoverySnapshot::selectChain(const KnownResponder& known, TimePoint now) const {
    const Chain* newestValid = nullptr;
    TimePoint newestValidAt{};
    const Chain* newestAny = nullptr;
    TimePoint newestAnyAt{};

    // Ties go to the later sighting
    for (const auto& sighting : known.sightings) {
        auto it = chains.find(sighting.chainId);
        if (it == chains.end()) continue;

        const Chain& chain = it->second;
        if (!newestAny || sighting.discoveredAt >= newestAnyAt) {
            newestAny = &chain;
            newestAnyAt = sighting.discoveredAt;
        }
        if (!chain.isExpiredAt(now) && (!newestValid || sighting.discoveredAt >= newestValidAt)) {
            newestValid = &chain;
            newestValidAt = sighting.discoveredAt;
        }
    }

    if (newestValid) return *newestValid;
    if (newestAny) return *newestAny;
    return std::nullopt;
}

std::vector<ProbeTarget> DiscoverySnapshot::targets(TimePoint now) const {
    std::vector<ProbeTarget> result;
    result.reserve(responders.size());
    for (const auto& known : responders) {
        auto chain = selectChain(known, now);
        if (!chain) continue;
        result.push_back({known.responder, std::move(*chain)});
    }
    return result;
}

// --- InMemoryDiscoveryStore ---

std::optional<DiscoverySnapshot> InMemoryDiscoveryStore::load(const std::string& authorityId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = snapshots_.find(authorityId);
    if (it == snapshots_.end()) return std::nullopt;
    return it->second;
}

void InMemoryDiscoveryStore::save(const DiscoverySnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshots_[snapshot.authorityId] = snapshot;
}

// --- DiscoveryCache ---

DiscoveryCache::DiscoveryCache(DiscoveryEngine* engine, IDiscoveryStore* store,
                               const IClock* clock, std::chrono::seconds ttl)
    : engine_(engine), store_(store), clock_(clock), ttl_(ttl)
{
    if (!engine_) {
        throw std::invalid_argument("DiscoveryCache: engine cannot be nullptr");
    }
    if (!store_) {
        throw std::invalid_argument("DiscoveryCache: store cannot be nullptr");
    }
    if (!clock_) {
        throw std::invalid_argument("DiscoveryCache: clock cannot be nullptr");
    }
}

bool DiscoveryCache::isFresh(const DiscoverySnapshot& snapshot) const {
    return clock_->now() - snapshot.refreshedAt < ttl_;
}

std::optional<DiscoverySnapshot> DiscoveryCache::peek(const std::string& authorityId) const {
    return store_->load(authorityId);
}

DiscoverySnapshot DiscoveryCache::getOrRefresh(const Authority& authority) {
    std::optional<DiscoverySnapshot> cached;
    std::shared_ptr<std::promise<DiscoverySnapshot>> promise;
    std::shared_future<DiscoverySnapshot> pending;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        cached = store_->load(authority.id);
        if (cached && isFresh(*cached)) {
            spdlog::debug("[DiscoveryCache] {} fresh (refreshed {})",
                          authority.id, formatIso8601(cached->refreshedAt));
            return *cached;
        }

        auto it = inFlight_.find(authority.id);
        if (it != inFlight_.end()) {
            pending = it->second;
        } else {
            promise = std::make_shared<std::promise<DiscoverySnapshot>>();
            inFlight_[authority.id] = promise->get_future().share();
        }
    }

    if (!promise) {
        spdlog::debug("[DiscoveryCache] {} refresh already in flight, waiting", authority.id);
        return pending.get();
    }

    spdlog::info("[DiscoveryCache] Refreshing {} ({})", authority.id,
                 cached ? "stale" : "absent");

    DiscoverySnapshot snapshot;
    auto degrade = [&](const std::string& reason) {
        spdlog::warn("[DiscoveryCache] Refresh of {} failed, serving {} snapshot: {}",
                     authority.id, cached ? "stale" : "empty", reason);
        if (cached) {
            snapshot = *cached;
        } else {
            snapshot = DiscoverySnapshot{};
            snapshot.authorityId = authority.id;
        }
        snapshot.degraded = true;
        snapshot.degradedReason = reason;

        // refreshedAt is unchanged, so the next caller retries the refresh
        try {
            store_->save(snapshot);
        } catch (const std::exception& saveError) {
            spdlog::error("[DiscoveryCache] Could not record degraded state of {}: {}",
                          authority.id, saveError.what());
        }
    };

    // Every path must clear inFlight_ and fulfil the promise, or waiters block forever
    try {
        DiscoveryBatch batch = engine_->discover(authority);
        snapshot = merge(cached, batch, clock_->now());
        store_->save(snapshot);
    } catch (const std::exception& e) {
        degrade(e.what());
    } catch (...) {
        degrade("unknown error");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        inFlight_.erase(authority.id);
    }
    promise->set_value(snapshot);
    return snapshot;
}

DiscoverySnapshot DiscoveryCache::merge(const std::optional<DiscoverySnapshot>& previous,
                                        const DiscoveryBatch& batch, TimePoint now) {
    DiscoverySnapshot merged;
    if (previous) {
        merged.responders = previous->responders;
        merged.chains = previous->chains;
    }
    merged.authorityId = batch.authorityId;
    merged.refreshedAt = now;
    merged.degraded = false;
    merged.lastStats = batch.stats;

    std::map<std::string, size_t> byUrl;
    for (size_t i = 0; i < merged.responders.size(); ++i) {
        byUrl[merged.responders[i].responder.url] = i;
    }

    for (const auto& binding : batch.bindings) {
        merged.chains.emplace(binding.chain.id, binding.chain);

        auto it = byUrl.find(binding.url);
        if (it == byUrl.end()) {
            KnownResponder known;
            known.responder.authorityId = batch.authorityId;
            known.responder.url = binding.url;
            known.responder.discoveredAt = now;
            merged.responders.push_back(std::move(known));
            it = byUrl.emplace(binding.url, merged.responders.size() - 1).first;
        }

        auto& sightings = merged.responders[it->second].sightings;
        auto sighting = std::find_if(sightings.begin(), sightings.end(),
            [&](const ChainSighting& s) { return s.chainId == binding.chain.id; });
        if (sighting != sightings.end()) {
            sighting->discoveredAt = now;
        } else {
            sightings.push_back({binding.chain.id, now});
        }
    }

    for (auto& known : merged.responders) {
        auto card = batch.urlCardinality.find(known.responder.url);
        if (card != batch.urlCardinality.end()) {
            known.responder.cardinality = card->second;
        }
    }

    std::sort(merged.responders.begin(), merged.responders.end(),
              [](const KnownResponder& a, const KnownResponder& b) {
                  return a.responder.url < b.responder.url;
              });
    return merged;
}

} // namespace ocspdash::health

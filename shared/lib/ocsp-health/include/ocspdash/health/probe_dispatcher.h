/**
 * @file probe_dispatcher.h
 * @brief Fans out one probe per (Location, Target) pair with bounded concurrency
 *
 * Slot accounting is per location, per responder and global. A worker takes
 * the first queued job whose location and responder both have free slots.
 * A location may hold at most min(maxPerLocation, maxInFlight / live locations)
 * workers, where live locations are those with queued or running jobs, so a
 * slow location never starves the others even when maxPerLocation >= maxInFlight.
 */

#pragma once

#include "ocspdash/health/classifier.h"
#include "ocspdash/health/models.h"
#include "ocspdash/health/ocsp_prober.h"
#include "ocspdash/health/providers.h"

#include <atomic>
#include <cstddef>
#include <vector>
#include <json/json.h>

namespace ocspdash::health {

/// @brief Concurrency ceilings (each clamped to at least 1)
struct DispatchPolicy {
    size_t maxInFlight = 32;
    size_t maxPerLocation = 4;
    size_t maxPerResponder = 2;
};

/**
 * @brief Cooperative cancellation flag shared between a cycle and its owner
 *
 * In-flight probes finish; jobs not yet started become BAD/CANCELLED Results.
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }
    void reset() { cancelled_.store(false); }

private:
    std::atomic<bool> cancelled_{false};
};

/// @brief Outcome of one dispatch
struct DispatchReport {
    std::vector<Result> results;    ///< Exactly one per (Location, Target) pair
    size_t good = 0;
    size_t questionable = 0;
    size_t bad = 0;
    size_t cancelled = 0;
    size_t sinkFailures = 0;        ///< Results the sink did not accept
    Millis duration{0};

    Json::Value toJson() const;
};

class ProbeDispatcher {
public:
    /**
     * @param prober Probe implementation (non-owning)
     * @param classifier Classification policy (non-owning)
     * @param sink Result Sink every Result is handed to (non-owning)
     * @param clock Clock for timestamps of cancelled jobs (non-owning)
     * @throws std::invalid_argument if a collaborator is nullptr
     */
    ProbeDispatcher(IProber* prober, const Classifier* classifier, IResultSink* sink,
                    const IClock* clock, DispatchPolicy policy = {});

    /**
     * @brief Probe every target from every location
     *
     * Returns only when every pair has a Result.
     */
    DispatchReport dispatch(const std::vector<Location>& locations,
                            const std::vector<ProbeTarget>& targets,
                            const CancellationToken& cancellation);

    const DispatchPolicy& policy() const { return policy_; }

private:
    IProber* prober_;
    const Classifier* classifier_;
    IResultSink* sink_;
    const IClock* clock_;
    DispatchPolicy policy_;
};

} // namespace ocspdash::health

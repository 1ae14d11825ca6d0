/**
 * @file probe_dispatcher.cpp
 * @brief Bounded-concurrency probe fan-out
 */

#include "ocspdash/health/probe_dispatcher.h"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <spdlog/spdlog.h>

namespace ocspdash::health {

namespace {

Result makeResult(const Location& location, const ProbeTarget& target,
                  const ProbeOutcome& outcome, HealthStatus status) {
    Result result;
    result.responderId = target.responder.id();
    result.authorityId = target.responder.authorityId;
    result.responderUrl = target.responder.url;
    result.locationId = location.id;
    result.chainId = target.chain.id;
    result.pingLatency = outcome.pingLatency;
    result.ocspLatency = outcome.ocspLatency;
    result.retrievedAt = outcome.retrievedAt;
    result.status = status;
    result.failure = outcome.failure;
    result.httpStatus = outcome.httpStatus;
    result.detail = outcome.detail;
    return result;
}

} // anonymous namespace

Json::Value DispatchReport::toJson() const {
    Json::Value json;
    json["results"] = static_cast<Json::UInt64>(results.size());
    json["good"] = static_cast<Json::UInt64>(good);
    json["questionable"] = static_cast<Json::UInt64>(questionable);
    json["bad"] = static_cast<Json::UInt64>(bad);
    json["cancelled"] = static_cast<Json::UInt64>(cancelled);
    json["sinkFailures"] = static_cast<Json::UInt64>(sinkFailures);
    json["durationMs"] = static_cast<Json::Int64>(duration.count());
    return json;
}

ProbeDispatcher::ProbeDispatcher(IProber* prober, const Classifier* classifier, IResultSink* sink,
                                 const IClock* clock, DispatchPolicy policy)
    : prober_(prober), classifier_(classifier), sink_(sink), clock_(clock), policy_(policy)
{
    if (!prober_) {
        throw std::invalid_argument("ProbeDispatcher: prober cannot be nullptr");
    }
    if (!classifier_) {
        throw std::invalid_argument("ProbeDispatcher: classifier cannot be nullptr");
    }
    if (!sink_) {
        throw std::invalid_argument("ProbeDispatcher: sink cannot be nullptr");
    }
    if (!clock_) {
        throw std::invalid_argument("ProbeDispatcher: clock cannot be nullptr");
    }
    policy_.maxInFlight = std::max<size_t>(1, policy_.maxInFlight);
    policy_.maxPerLocation = std::max<size_t>(1, policy_.maxPerLocation);
    policy_.maxPerResponder = std::max<size_t>(1, policy_.maxPerResponder);
}

DispatchReport ProbeDispatcher::dispatch(const std::vector<Location>& locations,
                                         const std::vector<ProbeTarget>& targets,
                                         const CancellationToken& cancellation) {
    const auto started = std::chrono::steady_clock::now();
    DispatchReport report;

    // Target-major order spreads consecutive jobs across locations
    struct Job {
        const Location* location;
        const ProbeTarget* target;
        std::string responderId;
    };
    std::vector<Job> jobs;
    jobs.reserve(locations.size() * targets.size());
    for (const auto& target : targets) {
        for (const auto& location : locations) {
            jobs.push_back({&location, &target, target.responder.id()});
        }
    }
    if (jobs.empty()) {
        return report;
    }

    std::vector<std::optional<Result>> slots(jobs.size());
    std::deque<size_t> queue;
    for (size_t i = 0; i < jobs.size(); ++i) queue.push_back(i);

    std::mutex mutex;
    std::condition_variable cv;
    std::map<std::string, size_t> activeByLocation;
    std::map<std::string, size_t> activeByResponder;
    std::atomic<size_t> sinkFailures{0};

    // Queued plus running jobs per location; a location leaves the share once it drains
    std::map<std::string, size_t> remainingByLocation;
    for (const auto& job : jobs) remainingByLocation[job.location->id]++;
    size_t liveLocations = remainingByLocation.size();

    auto finishJob = [&](const Job& job) {
        if (--remainingByLocation[job.location->id] == 0) liveLocations--;
    };

    // Each live location is capped at its share of the global slots
    auto locationCap = [&]() {
        size_t share = std::max<size_t>(1, policy_.maxInFlight / std::max<size_t>(1, liveLocations));
        return std::min(policy_.maxPerLocation, share);
    };

    // Each job index is written by exactly one worker
    auto record = [&](size_t index, Result result) {
        bool accepted = false;
        try {
            accepted = sink_->append(result);
        } catch (const std::exception& e) {
            spdlog::error("[ProbeDispatcher] Result sink threw: {}", e.what());
        }
        if (!accepted) sinkFailures++;
        slots[index] = std::move(result);
    };

    auto runJob = [&](const Job& job) {
        ProbeOutcome outcome;
        try {
            outcome = prober_->probe(*job.location, job.target->responder.url, job.target->chain);
        } catch (const std::exception& e) {
            spdlog::error("[ProbeDispatcher] Probe {} @ {} threw: {}",
                          job.target->responder.url, job.location->id, e.what());
            outcome = ProbeOutcome{};
            outcome.failure = ProbeFailure::INTERNAL_ERROR;
            outcome.retrievedAt = clock_->now();
            outcome.detail = e.what();
        }
        Classification classification = classifier_->explain(outcome);
        Result result = makeResult(*job.location, *job.target, outcome, classification.status);
        if (result.detail.empty()) result.detail = classification.reason;
        return result;
    };

    auto cancelledResult = [&](const Job& job) {
        ProbeOutcome outcome;
        outcome.failure = ProbeFailure::CANCELLED;
        outcome.retrievedAt = clock_->now();
        outcome.detail = "cycle cancelled before probe started";
        return makeResult(*job.location, *job.target, outcome, HealthStatus::BAD);
    };

    auto worker = [&]() {
        std::unique_lock<std::mutex> lock(mutex);
        while (!queue.empty()) {
            if (cancellation.isCancelled()) {
                size_t index = queue.front();
                queue.pop_front();
                lock.unlock();
                record(index, cancelledResult(jobs[index]));
                lock.lock();
                finishJob(jobs[index]);
                cv.notify_all();
                continue;
            }

            const size_t perLocation = locationCap();
            auto it = std::find_if(queue.begin(), queue.end(), [&](size_t index) {
                const Job& job = jobs[index];
                return activeByLocation[job.location->id] < perLocation
                    && activeByResponder[job.responderId] < policy_.maxPerResponder;
            });
            if (it == queue.end()) {
                // Woken by a finishing job; the timeout re-checks cancellation
                cv.wait_for(lock, std::chrono::milliseconds(50));
                continue;
            }

            size_t index = *it;
            queue.erase(it);
            const Job& job = jobs[index];
            activeByLocation[job.location->id]++;
            activeByResponder[job.responderId]++;

            lock.unlock();
            record(index, runJob(job));
            lock.lock();

            activeByLocation[job.location->id]--;
            activeByResponder[job.responderId]--;
            finishJob(job);
            cv.notify_all();
        }
    };

    const size_t workerCount = std::min(policy_.maxInFlight, jobs.size());
    spdlog::info("[ProbeDispatcher] Dispatching {} probes ({} locations x {} targets) on {} workers",
                 jobs.size(), locations.size(), targets.size(), workerCount);

    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (size_t i = 0; i < workerCount; ++i) {
        try {
            workers.emplace_back(worker);
        } catch (const std::system_error& e) {
            spdlog::error("[ProbeDispatcher] Could only start {} workers: {}", workers.size(), e.what());
            break;
        }
    }
    if (workers.empty()) {
        worker();
    }
    for (auto& t : workers) {
        t.join();
    }

    report.results.reserve(slots.size());
    for (auto& slot : slots) {
        Result& result = *slot;
        switch (result.status) {
            case HealthStatus::GOOD:         report.good++; break;
            case HealthStatus::QUESTIONABLE: report.questionable++; break;
            case HealthStatus::BAD:          report.bad++; break;
        }
        if (result.failure == ProbeFailure::CANCELLED) report.cancelled++;
        report.results.push_back(std::move(result));
    }
    report.sinkFailures = sinkFailures.load();
    report.duration = std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - started);

    spdlog::info("[ProbeDispatcher] Done in {}ms: good={}, questionable={}, bad={}, cancelled={}, sinkFailures={}",
                 report.duration.count(), report.good, report.questionable, report.bad,
                 report.cancelled, report.sinkFailures);
    return report;
}

} // namespace ocspdash::health

/**
 * @file result_store.h
 * @brief Append-only Result storage and the retrying sink in front of it
 */

#pragma once

#include "ocspdash/health/models.h"
#include "ocspdash/health/providers.h"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ocspdash::health {

/**
 * @brief In-memory Result Sink with the read contract
 *
 * Results are kept per (responder id, location id) pair, ordered by
 * retrieval timestamp regardless of arrival order.
 */
class ResultStore : public IResultSink {
public:
    bool append(const Result& result) override;

    /// @brief Most recent Result for the pair, std::nullopt if never tested
    std::optional<Result> latest(const std::string& responderId, const std::string& locationId) const;

    /// @brief Full history for the pair ordered by retrieval time
    std::vector<Result> history(const std::string& responderId, const std::string& locationId) const;

    size_t size() const;

private:
    using PairKey = std::pair<std::string, std::string>;

    mutable std::mutex mutex_;
    std::map<PairKey, std::vector<Result>> results_;
    size_t count_ = 0;
};

/**
 * @brief Decorator adding bounded retry with backoff to a sink
 *
 * After the last attempt fails, the Result is kept in an undelivered buffer
 * and a critical log line is emitted as the operational alert.
 */
class RetryingResultSink : public IResultSink {
public:
    /**
     * @param target Downstream sink (non-owning)
     * @param maxAttempts Total attempts per Result (at least 1)
     * @param backoff Initial delay, doubled after each failed attempt
     * @throws std::invalid_argument if target is nullptr
     */
    RetryingResultSink(IResultSink* target, int maxAttempts, std::chrono::milliseconds backoff);

    bool append(const Result& result) override;

    /// @brief Results whose delivery was exhausted
    std::vector<Result> undelivered() const;

    /**
     * @brief Retry every undelivered Result once through the full policy
     * @return Number of Results delivered
     */
    size_t redeliver();

private:
    bool deliver(const Result& result);

    IResultSink* target_;
    int maxAttempts_;
    std::chrono::milliseconds backoff_;

    mutable std::mutex undeliveredMutex_;
    std::vector<Result> undelivered_;
};

} // namespace ocspdash::health

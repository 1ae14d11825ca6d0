/**
 * @file result_store.cpp
 * @brief Result storage and retrying sink implementation
 */

#include "ocspdash/health/result_store.h"

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <spdlog/spdlog.h>

namespace ocspdash::health {

// --- ResultStore ---

bool ResultStore::append(const Result& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& list = results_[{result.responderId, result.locationId}];

    // Keep ordered by retrievedAt; equal timestamps keep arrival order
    auto pos = std::upper_bound(list.begin(), list.end(), result.retrievedAt,
        [](TimePoint t, const Result& r) { return t < r.retrievedAt; });
    list.insert(pos, result);
    count_++;
    return true;
}

std::optional<Result> ResultStore::latest(const std::string& responderId,
                                          const std::string& locationId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = results_.find({responderId, locationId});
    if (it == results_.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
}

std::vector<Result> ResultStore::history(const std::string& responderId,
                                         const std::string& locationId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = results_.find({responderId, locationId});
    if (it == results_.end()) return {};
    return it->second;
}

size_t ResultStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

// --- RetryingResultSink ---

RetryingResultSink::RetryingResultSink(IResultSink* target, int maxAttempts,
                                       std::chrono::milliseconds backoff)
    : target_(target), maxAttempts_(std::max(1, maxAttempts)), backoff_(backoff)
{
    if (!target_) {
        throw std::invalid_argument("RetryingResultSink: target cannot be nullptr");
    }
}

bool RetryingResultSink::deliver(const Result& result) {
    auto delay = backoff_;
    for (int attempt = 1; attempt <= maxAttempts_; ++attempt) {
        bool ok = false;
        try {
            ok = target_->append(result);
        } catch (const std::exception& e) {
            spdlog::warn("[ResultSink] append threw for {} @ {}: {}",
                         result.responderId, result.locationId, e.what());
        }
        if (ok) return true;

        if (attempt < maxAttempts_) {
            spdlog::warn("[ResultSink] append failed for {} @ {} (attempt {}/{}), retrying in {}ms",
                         result.responderId, result.locationId, attempt, maxAttempts_, delay.count());
            std::this_thread::sleep_for(delay);
            delay *= 2;
        }
    }
    return false;
}

bool RetryingResultSink::append(const Result& result) {
    if (deliver(result)) return true;

    spdlog::critical("[ResultSink] Result for {} @ {} undeliverable after {} attempts; buffered",
                     result.responderId, result.locationId, maxAttempts_);
    std::lock_guard<std::mutex> lock(undeliveredMutex_);
    undelivered_.push_back(result);
    return false;
}

std::vector<Result> RetryingResultSink::undelivered() const {
    std::lock_guard<std::mutex> lock(undeliveredMutex_);
    return undelivered_;
}

size_t RetryingResultSink::redeliver() {
    std::vector<Result> pending;
    {
        std::lock_guard<std::mutex> lock(undeliveredMutex_);
        pending.swap(undelivered_);
    }

    size_t delivered = 0;
    std::vector<Result> still;
    for (const auto& result : pending) {
        if (deliver(result)) {
            delivered++;
        } else {
            still.push_back(result);
        }
    }

    if (!still.empty()) {
        spdlog::critical("[ResultSink] {} Results remain undelivered", still.size());
        std::lock_guard<std::mutex> lock(undeliveredMutex_);
        undelivered_.insert(undelivered_.begin(), still.begin(), still.end());
    }
    return delivered;
}

} // namespace ocspdash::health

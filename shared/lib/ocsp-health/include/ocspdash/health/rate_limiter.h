/**
 * @file rate_limiter.h
 * @brief Call-rate limiting for the certificate-intelligence API
 */

#pragma once

#include "ocspdash/health/providers.h"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ocspdash::health {

/**
 * @brief Minimum interval between calls, one call at a time
 *
 * The lock is held for the duration of the wrapped call, so calls are
 * serialized as well as spaced.
 */
class RateLimiter {
public:
    /**
     * @param maxCallsPerSecond e.g. 0.2 for one call every five seconds
     * @throws std::invalid_argument if maxCallsPerSecond is not positive
     */
    explicit RateLimiter(double maxCallsPerSecond);

    /**
     * @brief Run fn once the interval since the previous call has elapsed
     */
    template <typename Fn>
    auto call(Fn&& fn) -> decltype(fn()) {
        std::lock_guard<std::mutex> lock(mutex_);
        waitForSlot();
        lastCall_ = std::chrono::steady_clock::now();
        return fn();
    }

    std::chrono::steady_clock::duration minInterval() const { return minInterval_; }

private:
    void waitForSlot();

    std::chrono::steady_clock::duration minInterval_;
    std::mutex mutex_;
    std::optional<std::chrono::steady_clock::time_point> lastCall_;
};

/**
 * @brief ICertificateSource decorator applying a RateLimiter to every call
 */
class RateLimitedCertificateSource : public ICertificateSource {
public:
    /**
     * @param inner Wrapped source (non-owning)
     * @param maxCallsPerSecond Rate shared by search and topAuthorities
     * @throws std::invalid_argument if inner is nullptr or the rate is not positive
     */
    RateLimitedCertificateSource(ICertificateSource* inner, double maxCallsPerSecond);

    std::vector<CertificateRecord> search(const std::string& authorityKeyId) override;
    std::vector<AuthorityRecord> topAuthorities(int n) override;

private:
    ICertificateSource* inner_;
    RateLimiter limiter_;
};

} // namespace ocspdash::health

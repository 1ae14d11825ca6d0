/**
 * @file rate_limiter.cpp
 * @brief Rate limiter implementation
 */

#include "ocspdash/health/rate_limiter.h"

#include <stdexcept>
#include <thread>
#include <spdlog/spdlog.h>

namespace ocspdash::health {

RateLimiter::RateLimiter(double maxCallsPerSecond) {
    if (!(maxCallsPerSecond > 0.0)) {
        throw std::invalid_argument("RateLimiter: maxCallsPerSecond must be positive");
    }
    minInterval_ = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(1.0 / maxCallsPerSecond));
}

void RateLimiter::waitForSlot() {
    if (!lastCall_) return;

    auto elapsed = std::chrono::steady_clock::now() - *lastCall_;
    auto left = minInterval_ - elapsed;
    if (left > std::chrono::steady_clock::duration::zero()) {
        spdlog::debug("[RateLimiter] throttling {:.2f}s",
                      std::chrono::duration<double>(left).count());
        std::this_thread::sleep_for(left);
    }
}

RateLimitedCertificateSource::RateLimitedCertificateSource(ICertificateSource* inner,
                                                           double maxCallsPerSecond)
    : inner_(inner), limiter_(maxCallsPerSecond)
{
    if (!inner_) {
        throw std::invalid_argument("RateLimitedCertificateSource: inner cannot be nullptr");
    }
}

std::vector<CertificateRecord> RateLimitedCertificateSource::search(const std::string& authorityKeyId) {
    return limiter_.call([&] { return inner_->search(authorityKeyId); });
}

std::vector<AuthorityRecord> RateLimitedCertificateSource::topAuthorities(int n) {
    return limiter_.call([&] { return inner_->topAuthorities(n); });
}

} // namespace ocspdash::health

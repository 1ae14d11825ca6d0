#pragma once

/**
 * @file probe_scheduler.h
 * @brief Periodic monitoring cycle scheduler for the OCSP monitor
 *
 * Runs a cycle shortly after startup, then every configured interval.
 * stop() cancels the running cycle cooperatively and joins the thread.
 */

#include "ocspdash/health/probe_dispatcher.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace ocspdash {
namespace monitor {
namespace infrastructure {

/**
 * @brief Scheduler for periodic monitoring cycles
 *
 * Supports:
 * - Initial cycle after a startup delay
 * - Fixed-interval cycles
 * - Manual trigger
 * - Cooperative cancellation on stop
 */
class ProbeScheduler {
public:
    using CycleFn = std::function<void(const health::CancellationToken&)>;

    ProbeScheduler();
    ~ProbeScheduler();

    ProbeScheduler(const ProbeScheduler&) = delete;
    ProbeScheduler& operator=(const ProbeScheduler&) = delete;

    /**
     * @brief Configure scheduler parameters
     * @param initialDelay Delay before the first cycle
     * @param interval Time between the end of one cycle and the start of the next
     */
    void configure(std::chrono::milliseconds initialDelay, std::chrono::milliseconds interval);

    /** @brief Set callback for the monitoring cycle */
    void setCycleFn(CycleFn fn);

    /** @brief Start the scheduler thread */
    void start();

    /** @brief Cancel the running cycle, stop the scheduler and join the thread */
    void stop();

    /** @brief Run a cycle now instead of waiting for the interval */
    void triggerNow();

    bool isRunning() const { return running_; }

    /** @brief Number of cycles completed (including failed ones) */
    int completedCycles() const { return completedCycles_; }

private:
    void loop();

    std::atomic<bool> running_{false};
    std::atomic<int> completedCycles_{0};
    bool forceCycle_ = false;

    std::chrono::milliseconds initialDelay_{std::chrono::seconds(10)};
    std::chrono::milliseconds interval_{std::chrono::minutes(60)};

    CycleFn cycleFn_;
    health::CancellationToken cancellation_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace infrastructure
} // namespace monitor
} // namespace ocspdash

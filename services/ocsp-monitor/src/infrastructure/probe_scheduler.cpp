/**
 * @file probe_scheduler.cpp
 * @brief ProbeScheduler implementation - startup cycle, interval cycles, manual trigger
 */

#include "probe_scheduler.h"
#include <spdlog/spdlog.h>

namespace ocspdash {
namespace monitor {
namespace infrastructure {

ProbeScheduler::ProbeScheduler() = default;

ProbeScheduler::~ProbeScheduler() {
    stop();
}

void ProbeScheduler::configure(std::chrono::milliseconds initialDelay, std::chrono::milliseconds interval) {
    initialDelay_ = initialDelay;
    interval_ = interval;
}

void ProbeScheduler::setCycleFn(CycleFn fn) {
    cycleFn_ = std::move(fn);
}

void ProbeScheduler::start() {
    if (running_.exchange(true)) {
        spdlog::warn("[ProbeScheduler] Already running");
        return;
    }
    cancellation_.reset();
    thread_ = std::thread([this]() { loop(); });
}

void ProbeScheduler::loop() {
    spdlog::info("[ProbeScheduler] Started (first cycle in {}ms, then every {} minutes)",
                 initialDelay_.count(),
                 std::chrono::duration_cast<std::chrono::minutes>(interval_).count());

    auto wait = initialDelay_;
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, wait, [this]() { return !running_ || forceCycle_; });
            if (!running_) break;
            forceCycle_ = false;
        }

        spdlog::info("=== Starting Monitoring Cycle ===");
        try {
            if (cycleFn_) {
                cycleFn_(cancellation_);
            }
            spdlog::info("=== Monitoring Cycle Completed ===");
        } catch (const std::exception& e) {
            spdlog::error("[ProbeScheduler] Monitoring cycle failed: {}", e.what());
        }
        completedCycles_++;
        wait = interval_;
    }

    spdlog::info("[ProbeScheduler] Stopped");
}

void ProbeScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cancellation_.cancel();
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

void ProbeScheduler::triggerNow() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        forceCycle_ = true;
    }
    cv_.notify_all();
}

} // namespace infrastructure
} // namespace monitor
} // namespace ocspdash

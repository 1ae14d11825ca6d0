/**
 * @file test_probe_scheduler.cpp
 * @brief Unit tests for the monitoring cycle scheduler
 */

#include <gtest/gtest.h>
#include "../src/infrastructure/probe_scheduler.h"

#include <atomic>
#include <thread>

using namespace ocspdash;
using namespace ocspdash::monitor::infrastructure;
using std::chrono::milliseconds;

namespace {

/// Poll until pred holds or the deadline passes
template <typename Pred>
bool waitFor(Pred pred, milliseconds deadline = milliseconds(5000)) {
    auto until = std::chrono::steady_clock::now() + deadline;
    while (std::chrono::steady_clock::now() < until) {
        if (pred()) return true;
        std::this_thread::sleep_for(milliseconds(10));
    }
    return pred();
}

} // anonymous namespace

TEST(ProbeSchedulerTest, InitialCycleAfterDelay) {
    ProbeScheduler scheduler;
    std::atomic<int> runs{0};
    scheduler.configure(milliseconds(20), std::chrono::minutes(60));
    scheduler.setCycleFn([&](const health::CancellationToken&) { runs++; });

    scheduler.start();
    EXPECT_TRUE(scheduler.isRunning());
    EXPECT_TRUE(waitFor([&]() { return runs.load() == 1; }));
    scheduler.stop();

    EXPECT_FALSE(scheduler.isRunning());
    EXPECT_EQ(scheduler.completedCycles(), 1);
}

TEST(ProbeSchedulerTest, TriggerNow_RunsWithoutWaiting) {
    ProbeScheduler scheduler;
    std::atomic<int> runs{0};
    scheduler.configure(std::chrono::minutes(60), std::chrono::minutes(60));
    scheduler.setCycleFn([&](const health::CancellationToken&) { runs++; });

    scheduler.start();
    scheduler.triggerNow();
    EXPECT_TRUE(waitFor([&]() { return runs.load() == 1; }));
    scheduler.triggerNow();
    EXPECT_TRUE(waitFor([&]() { return runs.load() == 2; }));
    scheduler.stop();
}

TEST(ProbeSchedulerTest, Stop_CancelsRunningCycle) {
    ProbeScheduler scheduler;
    std::atomic<bool> entered{false};
    std::atomic<bool> sawCancel{false};
    scheduler.configure(milliseconds(0), std::chrono::minutes(60));
    scheduler.setCycleFn([&](const health::CancellationToken& token) {
        entered = true;
        while (!token.isCancelled()) {
            std::this_thread::sleep_for(milliseconds(5));
        }
        sawCancel = true;
    });

    scheduler.start();
    ASSERT_TRUE(waitFor([&]() { return entered.load(); }));

    auto started = std::chrono::steady_clock::now();
    scheduler.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - started, milliseconds(2000));
    EXPECT_TRUE(sawCancel);
}

TEST(ProbeSchedulerTest, FailingCycle_DoesNotStopScheduler) {
    ProbeScheduler scheduler;
    std::atomic<int> runs{0};
    scheduler.configure(milliseconds(0), milliseconds(10));
    scheduler.setCycleFn([&](const health::CancellationToken&) {
        runs++;
        throw std::runtime_error("discovery failed");
    });

    scheduler.start();
    EXPECT_TRUE(waitFor([&]() { return runs.load() >= 3; }));
    scheduler.stop();
    EXPECT_GE(scheduler.completedCycles(), 3);
}

TEST(ProbeSchedulerTest, RestartAfterStop_ResetsCancellation) {
    ProbeScheduler scheduler;
    std::atomic<int> cleanRuns{0};
    scheduler.configure(milliseconds(0), std::chrono::minutes(60));
    scheduler.setCycleFn([&](const health::CancellationToken& token) {
        if (!token.isCancelled()) cleanRuns++;
    });

    scheduler.start();
    ASSERT_TRUE(waitFor([&]() { return cleanRuns.load() == 1; }));
    scheduler.stop();

    scheduler.start();
    EXPECT_TRUE(waitFor([&]() { return cleanRuns.load() == 2; }));
    scheduler.stop();
}

TEST(ProbeSchedulerTest, StopWithoutStart_IsSafe) {
    ProbeScheduler scheduler;
    EXPECT_NO_THROW(scheduler.stop());
    EXPECT_EQ(scheduler.completedCycles(), 0);
}

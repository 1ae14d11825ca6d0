/**
 * @file test_probe_dispatcher.cpp
 * @brief Unit tests for ProbeDispatcher fan-out, isolation and cancellation
 */

#include <gtest/gtest.h>
#include <ocspdash/health/probe_dispatcher.h>
#include <ocspdash/health/cert_ops.h>
#include "test_helpers.h"

#include <mutex>
#include <optional>
#include <set>

using namespace ocspdash::health;
using namespace test_helpers;

// ============================================================================
// Mock Prober tracking concurrency
// ============================================================================

class ConcurrencyProber : public IProber {
public:
    std::chrono::milliseconds delay{30};
    std::atomic<int> calls{0};

    ProbeOutcome probe(const Location& location, const std::string& responderUrl,
                       const Chain&) override {
        calls++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            int& active = activeByLocation_[location.id];
            active++;
            maxByLocation[location.id] = std::max(maxByLocation[location.id], active);
            int& perResponder = activeByResponder_[responderUrl];
            perResponder++;
            maxPerResponder = std::max(maxPerResponder, perResponder);
            totalActive_++;
            maxTotal = std::max(maxTotal, totalActive_);
        }
        std::this_thread::sleep_for(delay);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            activeByLocation_[location.id]--;
            activeByResponder_[responderUrl]--;
            totalActive_--;
        }
        if (location.id == "explodes") {
            throw std::runtime_error("unexpected prober failure");
        }
        ProbeOutcome outcome;
        outcome.failure = ProbeFailure::NETWORK_UNREACHABLE;
        outcome.detail = "scripted";
        return outcome;
    }

    std::map<std::string, int> maxByLocation;
    int maxPerResponder = 0;
    int maxTotal = 0;

private:
    std::mutex mutex_;
    std::map<std::string, int> activeByLocation_;
    std::map<std::string, int> activeByResponder_;
    int totalActive_ = 0;
};

/// Sleeps only for the "slow" location and records completion times
class SlowLocationProber : public IProber {
public:
    std::chrono::milliseconds slowDelay{300};

    ProbeOutcome probe(const Location& location, const std::string&, const Chain&) override {
        if (location.id == "slow") {
            std::this_thread::sleep_for(slowDelay);
        }
        auto now = std::chrono::steady_clock::now();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (location.id == "slow") {
                if (!firstSlowDone || now < *firstSlowDone) firstSlowDone = now;
            } else {
                if (!lastFastDone || now > *lastFastDone) lastFastDone = now;
            }
        }
        ProbeOutcome outcome;
        outcome.failure = ProbeFailure::NETWORK_UNREACHABLE;
        return outcome;
    }

    std::optional<std::chrono::steady_clock::time_point> firstSlowDone;
    std::optional<std::chrono::steady_clock::time_point> lastFastDone;

private:
    std::mutex mutex_;
};

// ============================================================================
// Test Fixture
// ============================================================================

class ProbeDispatcherTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        pki_ = new TestPki("Dispatch Trust");
    }

    static void TearDownTestSuite() {
        delete pki_;
        pki_ = nullptr;
    }

    void SetUp() override {
        auto chain = makeChain(toDer(pki_->intermediate.get()), toDer(pki_->root.get()));
        ASSERT_TRUE(chain.has_value());
        chain_ = *chain;
    }

    Location location(const std::string& id) const {
        Location l;
        l.id = id;
        l.name = id;
        l.address = id == "local" ? "local" : "https://" + id + ".agents.test";
        return l;
    }

    ProbeTarget target(const std::string& host) const {
        ProbeTarget t;
        t.responder.authorityId = pki_->rootKeyId();
        t.responder.url = "http://" + host + "/";
        t.chain = chain_;
        return t;
    }

    static TestPki* pki_;
    Chain chain_;
    FakeClock clock_;
    Classifier classifier_;
    FlakySink sink_{0};
};

TestPki* ProbeDispatcherTest::pki_ = nullptr;

// ============================================================================
// Constructor Validation
// ============================================================================

TEST_F(ProbeDispatcherTest, Constructor_NullCollaboratorsThrow) {
    ConcurrencyProber prober;
    EXPECT_THROW(ProbeDispatcher(nullptr, &classifier_, &sink_, &clock_), std::invalid_argument);
    EXPECT_THROW(ProbeDispatcher(&prober, nullptr, &sink_, &clock_), std::invalid_argument);
    EXPECT_THROW(ProbeDispatcher(&prober, &classifier_, nullptr, &clock_), std::invalid_argument);
    EXPECT_THROW(ProbeDispatcher(&prober, &classifier_, &sink_, nullptr), std::invalid_argument);
}

TEST_F(ProbeDispatcherTest, Constructor_ZeroLimitsClampedToOne) {
    ConcurrencyProber prober;
    DispatchPolicy policy{0, 0, 0};
    ProbeDispatcher dispatcher(&prober, &classifier_, &sink_, &clock_, policy);
    EXPECT_EQ(dispatcher.policy().maxInFlight, 1u);
    EXPECT_EQ(dispatcher.policy().maxPerLocation, 1u);
    EXPECT_EQ(dispatcher.policy().maxPerResponder, 1u);
}

// ============================================================================
// Completeness
// ============================================================================

TEST_F(ProbeDispatcherTest, OneResultPerPair) {
    MockVantagePoint vantage;
    vantage.defaultExchange = okExchange(pki_->respond());
    OcspProber prober(&vantage, &clock_, Millis(1000));
    ProbeDispatcher dispatcher(&prober, &classifier_, &sink_, &clock_);

    std::vector<Location> locations{location("local"), location("eu"), location("us")};
    std::vector<ProbeTarget> targets{target("a.test"), target("b.test")};
    CancellationToken token;

    auto report = dispatcher.dispatch(locations, targets, token);

    ASSERT_EQ(report.results.size(), 6u);
    EXPECT_EQ(report.good, 6u);
    EXPECT_EQ(report.sinkFailures, 0u);
    EXPECT_EQ(sink_.accepted.size(), 6u);

    std::set<std::pair<std::string, std::string>> pairs;
    for (const auto& r : report.results) {
        pairs.insert({r.locationId, r.responderUrl});
        EXPECT_EQ(r.chainId, chain_.id);
        EXPECT_EQ(r.authorityId, pki_->rootKeyId());
    }
    EXPECT_EQ(pairs.size(), 6u);
}

TEST_F(ProbeDispatcherTest, EmptyInputs_EmptyReport) {
    ConcurrencyProber prober;
    ProbeDispatcher dispatcher(&prober, &classifier_, &sink_, &clock_);
    CancellationToken token;

    EXPECT_TRUE(dispatcher.dispatch({}, {target("a.test")}, token).results.empty());
    EXPECT_TRUE(dispatcher.dispatch({location("local")}, {}, token).results.empty());
    EXPECT_EQ(prober.calls, 0);
}

// ============================================================================
// Isolation
// ============================================================================

TEST_F(ProbeDispatcherTest, FailingLocation_DoesNotAffectOthers) {
    MockVantagePoint vantage;
    vantage.defaultExchange = okExchange(pki_->respond());
    vantage.throwingLocations.push_back("broken");
    OcspProber prober(&vantage, &clock_, Millis(1000));
    ProbeDispatcher dispatcher(&prober, &classifier_, &sink_, &clock_);
    CancellationToken token;

    auto report = dispatcher.dispatch({location("local"), location("broken")},
                                      {target("a.test"), target("b.test")}, token);

    ASSERT_EQ(report.results.size(), 4u);
    for (const auto& r : report.results) {
        if (r.locationId == "broken") {
            EXPECT_EQ(r.status, HealthStatus::BAD);
            EXPECT_EQ(r.failure, ProbeFailure::LOCATION_UNREACHABLE);
        } else {
            EXPECT_EQ(r.status, HealthStatus::GOOD);
        }
    }
    EXPECT_EQ(report.good, 2u);
    EXPECT_EQ(report.bad, 2u);
}

TEST_F(ProbeDispatcherTest, SlowLocation_DoesNotHoldBackOthers) {
    SlowLocationProber prober;
    DispatchPolicy policy;
    policy.maxInFlight = 4;
    policy.maxPerLocation = 4;
    policy.maxPerResponder = 8;
    ProbeDispatcher dispatcher(&prober, &classifier_, &sink_, &clock_, policy);
    CancellationToken token;

    std::vector<ProbeTarget> targets;
    for (int i = 0; i < 20; ++i) targets.push_back(target("r" + std::to_string(i) + ".test"));

    auto report = dispatcher.dispatch({location("slow"), location("fast")}, targets, token);

    EXPECT_EQ(report.results.size(), 40u);
    ASSERT_TRUE(prober.firstSlowDone.has_value());
    ASSERT_TRUE(prober.lastFastDone.has_value());
    // Every fast-location probe completes while the first slow batch is still sleeping
    EXPECT_TRUE(*prober.lastFastDone < *prober.firstSlowDone);
}

TEST_F(ProbeDispatcherTest, ProberThrows_InternalErrorResult) {
    ConcurrencyProber prober;
    prober.delay = std::chrono::milliseconds(1);
    ProbeDispatcher dispatcher(&prober, &classifier_, &sink_, &clock_);
    CancellationToken token;

    auto report = dispatcher.dispatch({location("explodes"), location("local")},
                                      {target("a.test")}, token);

    ASSERT_EQ(report.results.size(), 2u);
    for (const auto& r : report.results) {
        EXPECT_EQ(r.status, HealthStatus::BAD);
        if (r.locationId == "explodes") {
            EXPECT_EQ(r.failure, ProbeFailure::INTERNAL_ERROR);
            EXPECT_EQ(r.retrievedAt, clock_.now());
        } else {
            EXPECT_EQ(r.failure, ProbeFailure::NETWORK_UNREACHABLE);
        }
    }
}

// ============================================================================
// Concurrency bounds
// ============================================================================

TEST_F(ProbeDispatcherTest, PerLocationAndGlobalLimitsHold) {
    ConcurrencyProber prober;
    DispatchPolicy policy;
    policy.maxInFlight = 4;
    policy.maxPerLocation = 2;
    policy.maxPerResponder = 8;
    ProbeDispatcher dispatcher(&prober, &classifier_, &sink_, &clock_, policy);
    CancellationToken token;

    std::vector<ProbeTarget> targets;
    for (int i = 0; i < 6; ++i) targets.push_back(target("r" + std::to_string(i) + ".test"));

    auto report = dispatcher.dispatch({location("local"), location("eu"), location("us")}, targets, token);

    EXPECT_EQ(report.results.size(), 18u);
    EXPECT_LE(prober.maxTotal, 4);
    for (const auto& entry : prober.maxByLocation) {
        EXPECT_LE(entry.second, 2) << entry.first;
    }
}

TEST_F(ProbeDispatcherTest, PerResponderLimitHolds) {
    ConcurrencyProber prober;
    DispatchPolicy policy;
    policy.maxInFlight = 8;
    policy.maxPerLocation = 8;
    policy.maxPerResponder = 1;
    ProbeDispatcher dispatcher(&prober, &classifier_, &sink_, &clock_, policy);
    CancellationToken token;

    std::vector<Location> locations;
    for (int i = 0; i < 5; ++i) locations.push_back(location("loc" + std::to_string(i)));

    auto report = dispatcher.dispatch(locations, {target("only.test")}, token);

    EXPECT_EQ(report.results.size(), 5u);
    EXPECT_EQ(prober.maxPerResponder, 1);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(ProbeDispatcherTest, CancelledBeforeStart_AllCancelled) {
    ConcurrencyProber prober;
    ProbeDispatcher dispatcher(&prober, &classifier_, &sink_, &clock_);
    CancellationToken token;
    token.cancel();

    auto report = dispatcher.dispatch({location("local"), location("eu")},
                                      {target("a.test"), target("b.test")}, token);

    ASSERT_EQ(report.results.size(), 4u);
    EXPECT_EQ(report.cancelled, 4u);
    EXPECT_EQ(report.bad, 4u);
    EXPECT_EQ(prober.calls, 0);
    for (const auto& r : report.results) {
        EXPECT_EQ(r.failure, ProbeFailure::CANCELLED);
        EXPECT_FALSE(r.pingLatency.has_value());
    }
    // Cancelled results still reach the sink
    EXPECT_EQ(sink_.accepted.size(), 4u);
}

TEST_F(ProbeDispatcherTest, CancelledMidCycle_EveryPairStillHasResult) {
    ConcurrencyProber prober;
    prober.delay = std::chrono::milliseconds(100);
    DispatchPolicy policy;
    policy.maxInFlight = 1;
    ProbeDispatcher dispatcher(&prober, &classifier_, &sink_, &clock_, policy);
    CancellationToken token;

    std::vector<ProbeTarget> targets;
    for (int i = 0; i < 10; ++i) targets.push_back(target("r" + std::to_string(i) + ".test"));

    std::thread canceller([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        token.cancel();
    });
    auto report = dispatcher.dispatch({location("local")}, targets, token);
    canceller.join();

    EXPECT_EQ(report.results.size(), 10u);
    EXPECT_GT(report.cancelled, 0u);
    EXPECT_LT(report.cancelled, 10u);
    EXPECT_EQ(static_cast<size_t>(prober.calls) + report.cancelled, 10u);
}

// ============================================================================
// Sink failures
// ============================================================================

TEST_F(ProbeDispatcherTest, SinkRejections_Counted) {
    ConcurrencyProber prober;
    prober.delay = std::chrono::milliseconds(1);
    FlakySink flaky(2);
    DispatchPolicy policy;
    policy.maxInFlight = 1;
    ProbeDispatcher dispatcher(&prober, &classifier_, &flaky, &clock_, policy);
    CancellationToken token;

    auto report = dispatcher.dispatch({location("local")},
                                      {target("a.test"), target("b.test"), target("c.test")}, token);

    EXPECT_EQ(report.results.size(), 3u);
    EXPECT_EQ(report.sinkFailures, 2u);
    EXPECT_EQ(flaky.accepted.size(), 1u);
}

TEST_F(ProbeDispatcherTest, ReportJsonShape) {
    ConcurrencyProber prober;
    prober.delay = std::chrono::milliseconds(1);
    ProbeDispatcher dispatcher(&prober, &classifier_, &sink_, &clock_);
    CancellationToken token;

    auto json = dispatcher.dispatch({location("local")}, {target("a.test")}, token).toJson();
    EXPECT_EQ(json["results"].asUInt64(), 1u);
    EXPECT_EQ(json["bad"].asUInt64(), 1u);
    EXPECT_TRUE(json.isMember("durationMs"));
    EXPECT_TRUE(json.isMember("sinkFailures"));
}

/**
 * @file test_ocsp_prober.cpp
 * @brief Unit tests for OcspProber failure mapping and latency recording
 */

#include <gtest/gtest.h>
#include <ocspdash/health/ocsp_prober.h>
#include <ocspdash/health/cert_ops.h>
#include <ocspdash/health/classifier.h>
#include "test_helpers.h"

using namespace ocspdash::health;
using namespace test_helpers;

class OcspProberTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        pki_ = new TestPki("Prober Trust");
    }

    static void TearDownTestSuite() {
        delete pki_;
        pki_ = nullptr;
    }

    void SetUp() override {
        auto chain = makeChain(toDer(pki_->intermediate.get()), toDer(pki_->root.get()));
        ASSERT_TRUE(chain.has_value());
        chain_ = *chain;
        location_.id = "local";
        location_.name = "Local";
        location_.address = "local";
    }

    static TestPki* pki_;
    Chain chain_;
    Location location_;
    MockVantagePoint vantage_;
    FakeClock clock_;
};

TestPki* OcspProberTest::pki_ = nullptr;

// ============================================================================
// URL parsing
// ============================================================================

TEST(ResponderUrlTest, DefaultsAndExplicitPorts) {
    auto plain = parseResponderUrl("http://ocsp.example.com");
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(plain->host, "ocsp.example.com");
    EXPECT_EQ(plain->port, 80);
    EXPECT_EQ(plain->path, "/");

    auto tls = parseResponderUrl("HTTPS://ocsp.example.com/status");
    ASSERT_TRUE(tls.has_value());
    EXPECT_EQ(tls->scheme, "https");
    EXPECT_EQ(tls->port, 443);
    EXPECT_EQ(tls->path, "/status");

    auto custom = parseResponderUrl("http://10.0.0.1:8080/ocsp");
    ASSERT_TRUE(custom.has_value());
    EXPECT_EQ(custom->port, 8080);
}

TEST(ResponderUrlTest, RejectsNonHttp) {
    EXPECT_FALSE(parseResponderUrl("ldap://ocsp.example.com").has_value());
    EXPECT_FALSE(parseResponderUrl("ocsp.example.com").has_value());
    EXPECT_FALSE(parseResponderUrl("http://").has_value());
    EXPECT_FALSE(parseResponderUrl("http://host:99999/").has_value());
}

// ============================================================================
// Constructor Validation
// ============================================================================

TEST_F(OcspProberTest, Constructor_NullCollaboratorsThrow) {
    EXPECT_THROW(OcspProber(nullptr, &clock_, Millis(1000)), std::invalid_argument);
    EXPECT_THROW(OcspProber(&vantage_, nullptr, Millis(1000)), std::invalid_argument);
}

// ============================================================================
// Success
// ============================================================================

TEST_F(OcspProberTest, GoodResponse_BothLatenciesRecorded) {
    vantage_.defaultExchange = okExchange(pki_->respond(), 15, 45);
    OcspProber prober(&vantage_, &clock_, Millis(5000));

    auto outcome = prober.probe(location_, "http://ocsp.test.example/", chain_);

    EXPECT_EQ(outcome.failure, ProbeFailure::NONE);
    EXPECT_TRUE(outcome.reachable);
    ASSERT_TRUE(outcome.pingLatency.has_value());
    ASSERT_TRUE(outcome.ocspLatency.has_value());
    EXPECT_EQ(outcome.pingLatency->count(), 15);
    EXPECT_EQ(outcome.ocspLatency->count(), 45);
    EXPECT_EQ(outcome.httpStatus, 200);
    EXPECT_EQ(outcome.certStatus, OcspCertStatus::GOOD);
    EXPECT_TRUE(outcome.signatureVerified);
    EXPECT_EQ(outcome.retrievedAt, clock_.now());
}

/// Lets simulated time pass while the exchange is in flight
class SlowExchangeVantagePoint : public IVantagePoint {
public:
    SlowExchangeVantagePoint(FakeClock* clock, std::chrono::seconds duration, ProbeExchange exchange)
        : clock_(clock), duration_(duration), exchange_(std::move(exchange)) {}

    ProbeExchange run(const Location&, const ProbeTask&) override {
        clock_->advance(duration_);
        return exchange_;
    }

private:
    FakeClock* clock_;
    std::chrono::seconds duration_;
    ProbeExchange exchange_;
};

TEST_F(OcspProberTest, RetrievedAt_StampedWhenExchangeCompletes) {
    OcspResponseProfile profile;
    profile.nextUpdateOffset = 60;
    const TimePoint started = clock_.now();
    SlowExchangeVantagePoint slow(&clock_, std::chrono::seconds(120), okExchange(pki_->respond(profile)));
    OcspProber prober(&slow, &clock_, Millis(5000));

    auto outcome = prober.probe(location_, "http://ocsp.test.example/", chain_);

    EXPECT_EQ(outcome.retrievedAt, started + std::chrono::seconds(120));
    // nextUpdate expired while the response was in flight
    EXPECT_EQ(Classifier().classify(outcome), HealthStatus::QUESTIONABLE);
}

TEST_F(OcspProberTest, TaskCarriesHostPortAndTimeout) {
    vantage_.defaultExchange = okExchange(pki_->respond());
    OcspProber prober(&vantage_, &clock_, Millis(2500));

    prober.probe(location_, "http://ocsp.test.example:8888/path", chain_);

    EXPECT_EQ(vantage_.calls, 1);
    EXPECT_EQ(vantage_.lastTask.host, "ocsp.test.example");
    EXPECT_EQ(vantage_.lastTask.port, 8888);
    EXPECT_EQ(vantage_.lastTask.timeout.count(), 2500);
    EXPECT_EQ(vantage_.lastTask.responderUrl, "http://ocsp.test.example:8888/path");
    EXPECT_FALSE(vantage_.lastTask.requestBody.empty());
}

TEST_F(OcspProberTest, RevokedResponse_ReasonInDetail) {
    OcspResponseProfile profile;
    profile.certStatus = V_OCSP_CERTSTATUS_REVOKED;
    vantage_.defaultExchange = okExchange(pki_->respond(profile));
    OcspProber prober(&vantage_, &clock_, Millis(5000));

    auto outcome = prober.probe(location_, "http://ocsp.test.example/", chain_);
    EXPECT_EQ(outcome.certStatus, OcspCertStatus::REVOKED);
    EXPECT_EQ(outcome.revocationReason, "keyCompromise");
    EXPECT_NE(outcome.detail.find("keyCompromise"), std::string::npos);
}

// ============================================================================
// Network layer
// ============================================================================

TEST_F(OcspProberTest, Unreachable_NoLatencies) {
    ProbeExchange refused;
    refused.connected = false;
    refused.error = "Connection refused";
    vantage_.defaultExchange = refused;
    OcspProber prober(&vantage_, &clock_, Millis(5000));

    auto outcome = prober.probe(location_, "http://ocsp.test.example/", chain_);

    EXPECT_EQ(outcome.failure, ProbeFailure::NETWORK_UNREACHABLE);
    EXPECT_FALSE(outcome.reachable);
    EXPECT_FALSE(outcome.pingLatency.has_value());
    EXPECT_FALSE(outcome.ocspLatency.has_value());
    EXPECT_EQ(outcome.detail, "Connection refused");
}

TEST_F(OcspProberTest, InvalidUrl_NetworkUnreachableWithoutExchange) {
    OcspProber prober(&vantage_, &clock_, Millis(5000));
    auto outcome = prober.probe(location_, "not a url", chain_);

    EXPECT_EQ(outcome.failure, ProbeFailure::NETWORK_UNREACHABLE);
    EXPECT_EQ(vantage_.calls, 0);
}

TEST_F(OcspProberTest, VantagePointThrows_LocationUnreachable) {
    vantage_.throwingLocations.push_back("local");
    OcspProber prober(&vantage_, &clock_, Millis(5000));

    ProbeOutcome outcome;
    EXPECT_NO_THROW(outcome = prober.probe(location_, "http://ocsp.test.example/", chain_));
    EXPECT_EQ(outcome.failure, ProbeFailure::LOCATION_UNREACHABLE);
    EXPECT_NE(outcome.detail.find("refused"), std::string::npos);
}

TEST_F(OcspProberTest, VantagePointNotReached_LocationUnreachable) {
    ProbeExchange lost;
    lost.locationReached = false;
    vantage_.defaultExchange = lost;
    OcspProber prober(&vantage_, &clock_, Millis(5000));

    auto outcome = prober.probe(location_, "http://ocsp.test.example/", chain_);
    EXPECT_EQ(outcome.failure, ProbeFailure::LOCATION_UNREACHABLE);
    EXPECT_FALSE(outcome.pingLatency.has_value());
}

// ============================================================================
// HTTP layer
// ============================================================================

TEST_F(OcspProberTest, Http503_PingButNoOcspLatency) {
    ProbeExchange unavailable = okExchange(Der{'e', 'r', 'r'}, 20, 30);
    unavailable.httpStatus = 503;
    vantage_.defaultExchange = unavailable;
    OcspProber prober(&vantage_, &clock_, Millis(5000));

    auto outcome = prober.probe(location_, "http://ocsp.test.example/", chain_);

    EXPECT_EQ(outcome.failure, ProbeFailure::HTTP_ERROR);
    EXPECT_EQ(failureLayer(outcome.failure), FailureLayer::HTTP);
    ASSERT_TRUE(outcome.pingLatency.has_value());
    EXPECT_EQ(outcome.pingLatency->count(), 20);
    EXPECT_FALSE(outcome.ocspLatency.has_value());
    EXPECT_EQ(outcome.httpStatus, 503);
}

TEST_F(OcspProberTest, Timeout_HttpTimeout) {
    ProbeExchange slow;
    slow.connected = true;
    slow.connectLatency = Millis(8);
    slow.timedOut = true;
    vantage_.defaultExchange = slow;
    OcspProber prober(&vantage_, &clock_, Millis(3000));

    auto outcome = prober.probe(location_, "http://ocsp.test.example/", chain_);

    EXPECT_EQ(outcome.failure, ProbeFailure::HTTP_TIMEOUT);
    EXPECT_TRUE(outcome.pingLatency.has_value());
    EXPECT_FALSE(outcome.ocspLatency.has_value());
    EXPECT_NE(outcome.detail.find("3000"), std::string::npos);
}

TEST_F(OcspProberTest, NoStatusAfterConnect_HttpError) {
    ProbeExchange reset;
    reset.connected = true;
    reset.connectLatency = Millis(8);
    reset.error = "Connection reset by peer";
    vantage_.defaultExchange = reset;
    OcspProber prober(&vantage_, &clock_, Millis(3000));

    auto outcome = prober.probe(location_, "http://ocsp.test.example/", chain_);
    EXPECT_EQ(outcome.failure, ProbeFailure::HTTP_ERROR);
    EXPECT_EQ(outcome.detail, "Connection reset by peer");
}

// ============================================================================
// Protocol layer
// ============================================================================

TEST_F(OcspProberTest, HtmlBody_Malformed) {
    std::string html = "<html>maintenance</html>";
    vantage_.defaultExchange = okExchange(Der(html.begin(), html.end()));
    OcspProber prober(&vantage_, &clock_, Millis(5000));

    auto outcome = prober.probe(location_, "http://ocsp.test.example/", chain_);
    EXPECT_EQ(outcome.failure, ProbeFailure::MALFORMED_RESPONSE);
    EXPECT_EQ(failureLayer(outcome.failure), FailureLayer::PROTOCOL);
    // The exchange itself succeeded
    EXPECT_TRUE(outcome.ocspLatency.has_value());
}

TEST_F(OcspProberTest, UnusableChain_NoExchange) {
    Chain broken;
    broken.id = "broken";
    broken.subject = Der{0x30, 0x00};
    broken.issuer = toDer(pki_->root.get());
    OcspProber prober(&vantage_, &clock_, Millis(5000));

    auto outcome = prober.probe(location_, "http://ocsp.test.example/", broken);
    EXPECT_EQ(outcome.failure, ProbeFailure::CHAIN_UNUSABLE);
    EXPECT_EQ(vantage_.calls, 0);
}

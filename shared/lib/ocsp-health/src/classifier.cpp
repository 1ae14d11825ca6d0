/**
 * @file classifier.cpp
 * @brief Probe outcome classification
 */

#include "ocspdash/health/classifier.h"

namespace ocspdash::health {

Classifier::Classifier(ClassifierPolicy policy)
    : policy_(policy) {
    if (policy_.nextUpdateGrace.count() < 0) {
        policy_.nextUpdateGrace = std::chrono::seconds(0);
    }
}

HealthStatus Classifier::classify(const ProbeOutcome& outcome) const {
    return explain(outcome).status;
}

Classification Classifier::explain(const ProbeOutcome& outcome) const {
    // --- Rule 1: bad ---
    if (outcome.failure != ProbeFailure::NONE) {
        return {HealthStatus::BAD, failureLayerToString(failureLayer(outcome.failure))
                                   + " failure: " + probeFailureToString(outcome.failure)};
    }
    if (!outcome.reachable) {
        return {HealthStatus::BAD, "responder unreachable"};
    }
    if (!outcome.signatureVerified) {
        return {HealthStatus::BAD, "signature not verified"};
    }
    if (outcome.certStatus != OcspCertStatus::GOOD) {
        return {HealthStatus::BAD, "certificate status " + ocspCertStatusToString(outcome.certStatus)};
    }
    if (!outcome.thisUpdate) {
        return {HealthStatus::BAD, "thisUpdate missing"};
    }

    // --- Rule 2: questionable ---
    const auto grace = policy_.nextUpdateGrace;
    if (outcome.nextUpdate && *outcome.nextUpdate + grace < outcome.retrievedAt) {
        return {HealthStatus::QUESTIONABLE, "nextUpdate is in the past"};
    }
    if (outcome.thisUpdate && *outcome.thisUpdate - grace > outcome.retrievedAt) {
        return {HealthStatus::QUESTIONABLE, "thisUpdate is in the future"};
    }
    if (!outcome.responderMatchesIssuer) {
        return {HealthStatus::QUESTIONABLE, "responder is not the issuer or an authorized delegate"};
    }

    // --- Rule 3: good ---
    return {HealthStatus::GOOD, "validity window covers retrieval time"};
}

} // namespace ocspdash::health

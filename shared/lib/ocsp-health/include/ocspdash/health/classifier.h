/**
 * @file classifier.h
 * @brief Reduces a ProbeOutcome to {good, questionable, bad}
 *
 * Rules, first match wins:
 *   1. BAD: any network/HTTP/protocol failure, unverified signature,
 *      certificate status other than good
 *   2. QUESTIONABLE: nextUpdate before retrieval (minus grace), thisUpdate
 *      after retrieval (plus grace), or a responder that is neither the
 *      issuer nor an authorized delegate
 *   3. GOOD: everything else that reached this point
 *
 * Any outcome not proven good or questionable is BAD.
 */

#pragma once

#include "ocspdash/health/types.h"

#include <chrono>
#include <string>

namespace ocspdash::health {

/// @brief Tunables for classification
struct ClassifierPolicy {
    std::chrono::seconds nextUpdateGrace{0};    ///< Tolerance applied to both validity bounds
};

/// @brief Classification with the rule that decided it
struct Classification {
    HealthStatus status = HealthStatus::BAD;
    std::string reason;
};

class Classifier {
public:
    explicit Classifier(ClassifierPolicy policy = {});

    /// @brief Pure function of the outcome and the policy
    HealthStatus classify(const ProbeOutcome& outcome) const;

    /// @brief Same as classify, plus a human-readable reason
    Classification explain(const ProbeOutcome& outcome) const;

    const ClassifierPolicy& policy() const { return policy_; }

private:
    ClassifierPolicy policy_;
};

} // namespace ocspdash::health

/**
 * @file models.h
 * @brief Domain records: Authority, Chain, Responder, Location, Result
 *
 * Plain value types. Binary certificate data is DER throughout.
 */

#pragma once

#include "ocspdash/health/types.h"

#include <cstdint>
#include <string>
#include <vector>
#include <json/json.h>

namespace ocspdash::health {

using Der = std::vector<unsigned char>;

/// @brief Root certificate authority being monitored
struct Authority {
    std::string id;             ///< Hex key identifier of the authority public key
    std::string name;           ///< Display name (issuer organization)
    int64_t cardinality = 0;    ///< Estimated certificate population
    Der rootCertificate;        ///< Optional DER of the root certificate
};

/**
 * @brief Ordered [subject, issuer] pair sufficient to build an OCSP request
 *
 * Content addressed: id is the SHA-256 over subject DER followed by issuer DER,
 * so byte-identical pairs collapse to one record.
 */
struct Chain {
    std::string id;
    Der subject;
    Der issuer;
    TimePoint subjectNotAfter{};

    bool isExpiredAt(TimePoint when) const { return subjectNotAfter <= when; }
};

/// @brief One OCSP endpoint URL tied to exactly one Authority
struct Responder {
    std::string authorityId;
    std::string url;
    TimePoint discoveredAt{};
    int64_t cardinality = 0;    ///< Certificates seen carrying this URL

    /// Stable identifier: authority id and URL
    std::string id() const { return authorityId + "|" + url; }
};

/// @brief Operator-managed vantage point
struct Location {
    std::string id;
    std::string name;
    std::string address;        ///< "local" / empty for this host, else agent base URL
    std::string credentialRef;  ///< Name of the environment variable holding the agent token

    bool isLocal() const { return address.empty() || address == "local"; }
};

/// @brief Responder plus the chain selected for testing it
struct ProbeTarget {
    Responder responder;
    Chain chain;
};

/**
 * @brief Outcome for one (Responder, Location) pair at one time
 *
 * Immutable once handed to the Result Sink.
 */
struct Result {
    std::string responderId;
    std::string authorityId;
    std::string responderUrl;
    std::string locationId;
    std::string chainId;
    std::optional<Millis> pingLatency;
    std::optional<Millis> ocspLatency;
    TimePoint retrievedAt{};
    HealthStatus status = HealthStatus::BAD;
    ProbeFailure failure = ProbeFailure::NONE;
    std::optional<int> httpStatus;
    std::string detail;

    /**
     * @brief Convert to JSON representation
     *
     * Nullable latencies and HTTP status are rendered as JSON null.
     */
    Json::Value toJson() const;
};

/// @brief Format a time point as ISO 8601 UTC (YYYY-MM-DDTHH:MM:SSZ)
std::string formatIso8601(TimePoint tp);

} // namespace ocspdash::health

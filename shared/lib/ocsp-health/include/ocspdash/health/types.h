/**
 * @file types.h
 * @brief Common types for the OCSP health library
 *
 * Shared enums and the raw probe outcome consumed by the classifier.
 * RFC 6960 (OCSP) terminology throughout.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace ocspdash::health {

using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::system_clock::time_point;
using Millis = std::chrono::milliseconds;

/// @brief Tri-state responder health
enum class HealthStatus {
    GOOD,           ///< Parses, verifies, status good, validity window covers retrieval
    QUESTIONABLE,   ///< Usable answer with a stale window or unexpected signer
    BAD             ///< Unreachable, HTTP failure, protocol failure or non-good status
};

/// @brief Failure sub-reason recorded with every Result
enum class ProbeFailure {
    NONE,
    LOCATION_UNREACHABLE,     ///< Vantage point itself could not be reached
    NETWORK_UNREACHABLE,      ///< Responder host did not accept a connection
    HTTP_TIMEOUT,             ///< Connected, but the exchange exceeded the probe timeout
    HTTP_ERROR,               ///< Non-2xx status or transfer error after connect
    MALFORMED_RESPONSE,       ///< Body is not a DER OCSPResponse / BasicOCSPResponse
    RESPONSE_NOT_SUCCESSFUL,  ///< OCSPResponseStatus other than successful(0)
    CERT_ID_NOT_FOUND,        ///< No SingleResponse for the requested CertID
    SIGNATURE_INVALID,        ///< Signature does not verify against the chain issuer
    CHAIN_UNUSABLE,           ///< Request could not be built from the stored chain
    CANCELLED,                ///< Cycle cancelled before the probe started
    INTERNAL_ERROR            ///< Unexpected exception inside the probe pipeline
};

/// @brief Layer a failure belongs to
enum class FailureLayer {
    NONE,
    NETWORK,
    HTTP,
    PROTOCOL,
    INTERNAL
};

/// @brief Certificate status carried in the SingleResponse (RFC 6960 4.2.1)
enum class OcspCertStatus {
    NOT_PRESENT,  ///< Response was not parsed far enough to read a status
    GOOD,
    REVOKED,
    UNKNOWN,
    MALFORMED     ///< Bytes received but not a valid OCSP structure
};

/**
 * @brief Everything a single probe observed, before classification
 *
 * Latencies are set only for the steps that completed: an unreachable
 * responder has neither, an HTTP failure has only pingLatency.
 */
struct ProbeOutcome {
    ProbeFailure failure = ProbeFailure::NONE;
    bool reachable = false;                     ///< TCP/TLS connect to responder succeeded
    std::optional<Millis> pingLatency;          ///< Bare connect latency
    std::optional<Millis> ocspLatency;          ///< Full HTTP request/response latency
    std::optional<int> httpStatus;
    OcspCertStatus certStatus = OcspCertStatus::NOT_PRESENT;
    bool signatureVerified = false;
    bool responderMatchesIssuer = false;        ///< ResponderID is the issuer or an authorized delegate
    std::optional<TimePoint> thisUpdate;
    std::optional<TimePoint> nextUpdate;
    std::string revocationReason;               ///< RFC 5280 CRLReason text, if revoked
    TimePoint retrievedAt{};
    std::string detail;                         ///< Diagnostic message
};

/// @brief Convert HealthStatus to its wire name
inline std::string healthStatusToString(HealthStatus s) {
    switch (s) {
        case HealthStatus::GOOD:         return "good";
        case HealthStatus::QUESTIONABLE: return "questionable";
        case HealthStatus::BAD:          return "bad";
    }
    return "bad";
}

/// @brief Convert ProbeFailure to string
inline std::string probeFailureToString(ProbeFailure f) {
    switch (f) {
        case ProbeFailure::NONE:                    return "NONE";
        case ProbeFailure::LOCATION_UNREACHABLE:    return "LOCATION_UNREACHABLE";
        case ProbeFailure::NETWORK_UNREACHABLE:     return "NETWORK_UNREACHABLE";
        case ProbeFailure::HTTP_TIMEOUT:            return "HTTP_TIMEOUT";
        case ProbeFailure::HTTP_ERROR:              return "HTTP_ERROR";
        case ProbeFailure::MALFORMED_RESPONSE:      return "MALFORMED_RESPONSE";
        case ProbeFailure::RESPONSE_NOT_SUCCESSFUL: return "RESPONSE_NOT_SUCCESSFUL";
        case ProbeFailure::CERT_ID_NOT_FOUND:       return "CERT_ID_NOT_FOUND";
        case ProbeFailure::SIGNATURE_INVALID:       return "SIGNATURE_INVALID";
        case ProbeFailure::CHAIN_UNUSABLE:          return "CHAIN_UNUSABLE";
        case ProbeFailure::CANCELLED:               return "CANCELLED";
        case ProbeFailure::INTERNAL_ERROR:          return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

/// @brief Map a failure sub-reason to its layer
inline FailureLayer failureLayer(ProbeFailure f) {
    switch (f) {
        case ProbeFailure::NONE:
            return FailureLayer::NONE;
        case ProbeFailure::LOCATION_UNREACHABLE:
        case ProbeFailure::NETWORK_UNREACHABLE:
            return FailureLayer::NETWORK;
        case ProbeFailure::HTTP_TIMEOUT:
        case ProbeFailure::HTTP_ERROR:
            return FailureLayer::HTTP;
        case ProbeFailure::MALFORMED_RESPONSE:
        case ProbeFailure::RESPONSE_NOT_SUCCESSFUL:
        case ProbeFailure::CERT_ID_NOT_FOUND:
        case ProbeFailure::SIGNATURE_INVALID:
            return FailureLayer::PROTOCOL;
        case ProbeFailure::CHAIN_UNUSABLE:
        case ProbeFailure::CANCELLED:
        case ProbeFailure::INTERNAL_ERROR:
            return FailureLayer::INTERNAL;
    }
    return FailureLayer::INTERNAL;
}

/// @brief Convert FailureLayer to string
inline std::string failureLayerToString(FailureLayer l) {
    switch (l) {
        case FailureLayer::NONE:     return "NONE";
        case FailureLayer::NETWORK:  return "NETWORK";
        case FailureLayer::HTTP:     return "HTTP";
        case FailureLayer::PROTOCOL: return "PROTOCOL";
        case FailureLayer::INTERNAL: return "INTERNAL";
    }
    return "UNKNOWN";
}

/// @brief Convert OcspCertStatus to string
inline std::string ocspCertStatusToString(OcspCertStatus s) {
    switch (s) {
        case OcspCertStatus::NOT_PRESENT: return "NOT_PRESENT";
        case OcspCertStatus::GOOD:        return "GOOD";
        case OcspCertStatus::REVOKED:     return "REVOKED";
        case OcspCertStatus::UNKNOWN:     return "UNKNOWN";
        case OcspCertStatus::MALFORMED:   return "MALFORMED";
    }
    return "UNKNOWN";
}

} // namespace ocspdash::health

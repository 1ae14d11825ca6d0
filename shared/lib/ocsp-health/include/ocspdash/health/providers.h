/**
 * @file providers.h
 * @brief Provider interfaces for infrastructure abstraction
 *
 * These interfaces decouple the health library from external systems.
 * The monitor service implements concrete adapters:
 *   - CensysCertificateSource (certificate-intelligence REST API)
 *   - HttpIssuerFetcher (AIA caIssuers download)
 *   - LocalVantagePoint / AgentVantagePoint (probe transports)
 */

#pragma once

#include "ocspdash/health/models.h"

#include <optional>
#include <string>
#include <vector>

namespace ocspdash::health {

/// @brief Raw certificate as returned by the certificate-intelligence API
struct CertificateRecord {
    std::string fingerprint;    ///< SHA-256 hex as reported by the source (may be empty)
    Der der;
};

/// @brief Authority ranking entry as returned by the certificate-intelligence API
struct AuthorityRecord {
    std::string keyId;
    std::string name;
    int64_t cardinality = 0;
    Der rootCertificate;        ///< Empty when the source does not return it
};

/**
 * @brief Certificate-intelligence capability
 *
 * May throw CertificateSourceException on rate limiting or transient network
 * errors. Callers hold it by composition; rate limiting is a decorator.
 */
class ICertificateSource {
public:
    virtual ~ICertificateSource() = default;

    /**
     * @brief Find certificates issued under an authority key
     * @param authorityKeyId Hex key identifier of the authority
     * @return Raw records, possibly empty
     */
    virtual std::vector<CertificateRecord> search(const std::string& authorityKeyId) = 0;

    /**
     * @brief Rank authorities by certificate population
     * @param n Number of authorities to return
     * @return Records sorted by descending cardinality
     */
    virtual std::vector<AuthorityRecord> topAuthorities(int n) = 0;
};

/**
 * @brief Downloads an issuer certificate from an AIA caIssuers URL
 */
class IIssuerFetcher {
public:
    virtual ~IIssuerFetcher() = default;

    /**
     * @param url caIssuers URL
     * @return Certificate bytes (DER or PEM), or std::nullopt on any failure
     */
    virtual std::optional<Der> fetch(const std::string& url) = 0;
};

/// @brief Probe work handed to a vantage point
struct ProbeTask {
    std::string responderUrl;
    std::string host;
    int port = 80;
    Der requestBody;            ///< DER OCSPRequest
    Millis timeout{10000};
};

/**
 * @brief Raw timing + bytes returned by a vantage point
 *
 * Interpretation (classification, parsing) is the prober's job.
 */
struct ProbeExchange {
    bool locationReached = true;    ///< False if the vantage point itself failed
    bool connected = false;         ///< Bare connect to the responder succeeded
    std::optional<Millis> connectLatency;
    bool timedOut = false;          ///< HTTP exchange exceeded the timeout
    std::optional<int> httpStatus;
    std::optional<Millis> exchangeLatency;
    Der body;
    std::string error;
};

/**
 * @brief "Run this probe from this Location and return timing + raw bytes"
 *
 * Implementations report a failed vantage point through locationReached=false.
 * Anything thrown is folded into LOCATION_UNREACHABLE by the prober.
 */
class IVantagePoint {
public:
    virtual ~IVantagePoint() = default;

    virtual ProbeExchange run(const Location& location, const ProbeTask& task) = 0;
};

/**
 * @brief Append-only write boundary to persistence
 */
class IResultSink {
public:
    virtual ~IResultSink() = default;

    /**
     * @return true if the Result was accepted
     */
    virtual bool append(const Result& result) = 0;
};

/**
 * @brief Injected wall clock
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual TimePoint now() const = 0;
};

/// @brief IClock backed by std::chrono::system_clock
class SystemClock : public IClock {
public:
    TimePoint now() const override { return Clock::now(); }
};

} // namespace ocspdash::health

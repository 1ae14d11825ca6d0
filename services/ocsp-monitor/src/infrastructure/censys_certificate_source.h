#pragma once

/**
 * @file censys_certificate_source.h
 * @brief Certificate-intelligence adapter for the Censys v1 REST API
 *
 * search(keyId)      -> POST {api}/search/certificates, base64 "raw" DER records
 * topAuthorities(n)  -> POST {api}/report/certificates bucketed by authority key id,
 *                       then one report per bucket for the issuer organization
 *
 * HTTP 429 is reported as CertificateSourceException with rateLimited() set.
 * Wrap the instance in health::RateLimitedCertificateSource to pace calls.
 */

#include "ocspdash/health/providers.h"
#include "ocspdash/health/rate_limiter.h"

#include <json/json.h>

#include <chrono>
#include <string>
#include <vector>

namespace ocspdash {
namespace monitor {
namespace infrastructure {

struct CensysOptions {
    std::string apiUrl = "https://censys.io/api/v1";
    std::string apiId;
    std::string apiSecret;
    int maxPages = 1;
    double pageRate = 0.2;              ///< calls per second between requests of one capability call
    std::chrono::milliseconds timeout{30000};
    std::string userAgent;
};

/// @brief One decoded page of /search/certificates
struct CensysSearchPage {
    std::vector<health::CertificateRecord> records;
    int pages = 1;                      ///< metadata.pages
    int skipped = 0;                    ///< results whose "raw" was missing or not base64
};

class CensysCertificateSource : public health::ICertificateSource {
public:
    /**
     * @throws std::invalid_argument if apiUrl is empty or pageRate is not positive
     */
    explicit CensysCertificateSource(CensysOptions options);

    std::vector<health::CertificateRecord> search(const std::string& authorityKeyId) override;
    std::vector<health::AuthorityRecord> topAuthorities(int n) override;

    /// @brief Query string for intermediates issued under an authority key
    static std::string buildSearchQuery(const std::string& authorityKeyId);

    /**
     * @brief Decode a /search/certificates response body
     * @throws common::ParsingException on invalid JSON or missing "results"
     */
    static CensysSearchPage parseSearchPage(const std::string& body);

    /**
     * @brief Decode a /report/certificates response body into authorities
     *
     * Buckets are sorted by descending doc_count and truncated to n.
     * Names are left as the key id; the caller resolves them.
     * @throws common::ParsingException on invalid JSON or missing "results"
     */
    static std::vector<health::AuthorityRecord> parseReportBuckets(const std::string& body, int n);

    /**
     * @brief Top bucket key of a report, or empty if there is none
     * @throws common::ParsingException on invalid JSON
     */
    static std::string parseTopBucketKey(const std::string& body);

private:
    /**
     * @brief POST a JSON body to {apiUrl}{path}
     * @throws common::CertificateSourceException on transport or HTTP errors
     */
    std::string post(const std::string& path, const Json::Value& body);

    std::string resolveAuthorityName(const std::string& keyId);

    CensysOptions options_;
    health::RateLimiter requestLimiter_;    ///< spaces pages and name lookups within one capability call
};

} // namespace infrastructure
} // namespace monitor
} // namespace ocspdash

/**
 * @file discovery_engine.h
 * @brief Turns raw certificate records into deduplicated responder bindings
 *
 * For each candidate intermediate (CA certificate, not self-signed) under an
 * authority, extracts the AIA OCSP URLs and pairs the intermediate with its
 * issuer to form a Chain. Only a representative sample is examined; the
 * source decides how many records a search returns.
 */

#pragma once

#include "ocspdash/health/models.h"
#include "ocspdash/health/providers.h"

#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <json/json.h>

namespace ocspdash::health {

/// @brief One discovered (URL, Chain) pair
struct ResponderBinding {
    std::string url;
    Chain chain;
};

/// @brief Per-run discovery counters
struct DiscoveryStats {
    size_t recordsSeen = 0;
    size_t malformed = 0;          ///< Records that are not certificates
    size_t notIntermediate = 0;    ///< Self-signed or not a CA
    size_t withoutOcspUrl = 0;
    size_t withoutIssuer = 0;      ///< No issuer in batch, root or caIssuers
    size_t duplicates = 0;         ///< (URL, chain id) already seen

    Json::Value toJson() const;
};

/// @brief Result of one discovery run for one authority
struct DiscoveryBatch {
    std::string authorityId;
    std::vector<ResponderBinding> bindings;         ///< In record order, deduplicated
    std::map<std::string, int64_t> urlCardinality;  ///< Certificates seen per URL
    DiscoveryStats stats;
};

class DiscoveryEngine {
public:
    /**
     * @param source Certificate-intelligence capability (non-owning)
     * @param issuerFetcher Optional caIssuers fetcher (non-owning, may be nullptr)
     * @throws std::invalid_argument if source is nullptr
     */
    explicit DiscoveryEngine(ICertificateSource* source, IIssuerFetcher* issuerFetcher = nullptr);

    /**
     * @brief Discover responder bindings for an authority
     *
     * Malformed records are skipped and counted. No OCSP-bearing
     * intermediates yields an empty batch, not an error.
     *
     * @throws CertificateSourceException (propagated from the source)
     */
    DiscoveryBatch discover(const Authority& authority);

private:
    ICertificateSource* source_;
    IIssuerFetcher* issuerFetcher_;
};

} // namespace ocspdash::health

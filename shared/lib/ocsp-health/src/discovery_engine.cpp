/**
 * @file discovery_engine.cpp
 * @brief Responder discovery implementation
 */

#include "ocspdash/health/discovery_engine.h"
#include "ocspdash/health/cert_ops.h"

#include <set>
#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>

namespace ocspdash::health {

Json::Value DiscoveryStats::toJson() const {
    Json::Value json;
    json["recordsSeen"] = static_cast<Json::UInt64>(recordsSeen);
    json["malformed"] = static_cast<Json::UInt64>(malformed);
    json["notIntermediate"] = static_cast<Json::UInt64>(notIntermediate);
    json["withoutOcspUrl"] = static_cast<Json::UInt64>(withoutOcspUrl);
    json["withoutIssuer"] = static_cast<Json::UInt64>(withoutIssuer);
    json["duplicates"] = static_cast<Json::UInt64>(duplicates);
    return json;
}

DiscoveryEngine::DiscoveryEngine(ICertificateSource* source, IIssuerFetcher* issuerFetcher)
    : source_(source), issuerFetcher_(issuerFetcher)
{
    if (!source_) {
        throw std::invalid_argument("DiscoveryEngine: source cannot be nullptr");
    }
}

DiscoveryBatch DiscoveryEngine::discover(const Authority& authority) {
    DiscoveryBatch batch;
    batch.authorityId = authority.id;

    std::vector<CertificateRecord> records = source_->search(authority.id);
    batch.stats.recordsSeen = records.size();

    // Step 1: Parse everything; parsed records double as the issuer pool
    std::vector<X509Ptr> parsed;
    parsed.reserve(records.size() + 1);
    for (const auto& record : records) {
        X509Ptr cert = parseCertificate(record.der);
        if (!cert) {
            batch.stats.malformed++;
            spdlog::debug("[DiscoveryEngine] Skipping malformed record {}", record.fingerprint);
            continue;
        }
        parsed.push_back(std::move(cert));
    }
    const size_t candidateCount = parsed.size();

    if (!authority.rootCertificate.empty()) {
        X509Ptr root = parseCertificate(authority.rootCertificate);
        if (root) {
            parsed.push_back(std::move(root));
        } else {
            spdlog::warn("[DiscoveryEngine] Root certificate of {} does not parse", authority.id);
        }
    }

    // Fetched issuers are cached per caIssuers URL for the duration of the run
    std::map<std::string, X509Ptr> fetched;

    auto findIssuer = [&](X509* cert) -> X509* {
        for (const auto& candidate : parsed) {
            if (candidate.get() == cert) continue;
            if (isIssuedBy(cert, candidate.get())) return candidate.get();
        }
        if (!issuerFetcher_) return nullptr;

        for (const auto& url : getCaIssuerUrls(cert)) {
            auto it = fetched.find(url);
            if (it == fetched.end()) {
                X509Ptr downloaded;
                if (auto bytes = issuerFetcher_->fetch(url)) {
                    downloaded = parseCertificate(*bytes);
                }
                it = fetched.emplace(url, std::move(downloaded)).first;
            }
            if (it->second && isIssuedBy(cert, it->second.get())) {
                return it->second.get();
            }
        }
        return nullptr;
    };

    // Step 2: Build chains for OCSP-bearing intermediates
    std::set<std::pair<std::string, std::string>> seen;
    for (size_t i = 0; i < candidateCount; ++i) {
        X509* cert = parsed[i].get();

        if (!isCaCertificate(cert) || isSelfSigned(cert)) {
            batch.stats.notIntermediate++;
            continue;
        }

        std::vector<std::string> urls = getOcspUrls(cert);
        if (urls.empty()) {
            batch.stats.withoutOcspUrl++;
            continue;
        }

        X509* issuer = findIssuer(cert);
        if (!issuer) {
            batch.stats.withoutIssuer++;
            spdlog::debug("[DiscoveryEngine] No issuer found for {}", getSubjectDn(cert));
            continue;
        }

        auto chain = makeChain(certificateToDer(cert), certificateToDer(issuer));
        if (!chain) {
            batch.stats.malformed++;
            continue;
        }

        for (const auto& url : urls) {
            batch.urlCardinality[url]++;
            if (!seen.emplace(url, chain->id).second) {
                batch.stats.duplicates++;
                continue;
            }
            batch.bindings.push_back({url, *chain});
        }
    }

    spdlog::info("[DiscoveryEngine] {}: {} records, {} bindings, {} URLs (malformed={}, notIntermediate={}, "
                 "withoutOcspUrl={}, withoutIssuer={}, duplicates={})",
                 authority.id, batch.stats.recordsSeen, batch.bindings.size(), batch.urlCardinality.size(),
                 batch.stats.malformed, batch.stats.notIntermediate, batch.stats.withoutOcspUrl,
                 batch.stats.withoutIssuer, batch.stats.duplicates);
    return batch;
}

} // namespace ocspdash::health

/**
 * @file censys_certificate_source.cpp
 * @brief Censys v1 search/report client
 */

#include "censys_certificate_source.h"
#include "http_client.h"
#include "json_codec.h"
#include "exceptions.h"

#include "ocspdash/health/cert_ops.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace ocspdash {
namespace monitor {
namespace infrastructure {

namespace {

const char* const FIELD_RAW = "raw";
const char* const FIELD_FINGERPRINT = "parsed.fingerprint_sha256";
const char* const FIELD_AUTHORITY_KEY_ID = "parsed.extensions.authority_key_id";
const char* const FIELD_ISSUER_ORG = "parsed.issuer.organization";

} // namespace

CensysCertificateSource::CensysCertificateSource(CensysOptions options)
    : options_(std::move(options)), requestLimiter_(options_.pageRate) {
    if (options_.apiUrl.empty()) {
        throw std::invalid_argument("CensysCertificateSource: apiUrl cannot be empty");
    }
    while (!options_.apiUrl.empty() && options_.apiUrl.back() == '/') {
        options_.apiUrl.pop_back();
    }
    if (options_.maxPages < 1) options_.maxPages = 1;
}

std::string CensysCertificateSource::buildSearchQuery(const std::string& authorityKeyId) {
    return std::string(FIELD_AUTHORITY_KEY_ID) + ": " + authorityKeyId +
           " AND parsed.extensions.basic_constraints.is_ca: true";
}

std::string CensysCertificateSource::post(const std::string& path, const Json::Value& body) {
    HttpRequest request;
    request.method = "POST";
    request.url = options_.apiUrl + path;
    request.body = writeCompactJson(body);
    request.headers = {"Content-Type: application/json", "Accept: application/json"};
    request.timeout = options_.timeout;
    request.userPwd = options_.apiId + ":" + options_.apiSecret;
    request.userAgent = options_.userAgent;

    HttpResponse response = requestLimiter_.call([&request]() { return performRequest(request); });

    if (!response.transportOk()) {
        throw common::CertificateSourceException(path + ": " + response.error);
    }
    if (response.status == 429) {
        throw common::CertificateSourceException(path + ": rate limit exceeded (HTTP 429)", true);
    }
    if (response.status < 200 || response.status >= 300) {
        throw common::CertificateSourceException(path + ": HTTP " + std::to_string(response.status));
    }
    return response.body;
}

CensysSearchPage CensysCertificateSource::parseSearchPage(const std::string& body) {
    Json::Value root = parseJson(body, "search response");
    if (!root.isObject() || !root["results"].isArray()) {
        throw common::ParsingException("search response has no results array");
    }

    CensysSearchPage page;
    const Json::Value& metadata = root["metadata"];
    if (metadata.isObject() && metadata["pages"].isIntegral()) {
        page.pages = std::max(1, metadata["pages"].asInt());
    }

    for (const auto& item : root["results"]) {
        const Json::Value& raw = item[FIELD_RAW];
        if (!raw.isString()) {
            page.skipped++;
            continue;
        }
        auto der = health::base64Decode(raw.asString());
        if (!der || der->empty()) {
            page.skipped++;
            continue;
        }
        health::CertificateRecord record;
        record.der = std::move(*der);
        if (item[FIELD_FINGERPRINT].isString()) {
            record.fingerprint = item[FIELD_FINGERPRINT].asString();
        }
        page.records.push_back(std::move(record));
    }
    return page;
}

std::vector<health::AuthorityRecord> CensysCertificateSource::parseReportBuckets(const std::string& body, int n) {
    Json::Value root = parseJson(body, "report response");
    if (!root.isObject() || !root["results"].isArray()) {
        throw common::ParsingException("report response has no results array");
    }

    std::vector<health::AuthorityRecord> authorities;
    for (const auto& bucket : root["results"]) {
        if (!bucket["key"].isString() || bucket["key"].asString().empty()) continue;
        health::AuthorityRecord record;
        record.keyId = bucket["key"].asString();
        record.name = record.keyId;
        record.cardinality = bucket["doc_count"].isNumeric() ? bucket["doc_count"].asInt64() : 0;
        authorities.push_back(std::move(record));
    }

    std::stable_sort(authorities.begin(), authorities.end(),
        [](const health::AuthorityRecord& a, const health::AuthorityRecord& b) {
            return a.cardinality > b.cardinality;
        });
    if (n >= 0 && authorities.size() > static_cast<size_t>(n)) {
        authorities.resize(static_cast<size_t>(n));
    }
    return authorities;
}

std::string CensysCertificateSource::parseTopBucketKey(const std::string& body) {
    auto buckets = parseReportBuckets(body, 1);
    return buckets.empty() ? std::string() : buckets.front().keyId;
}

std::vector<health::CertificateRecord> CensysCertificateSource::search(const std::string& authorityKeyId) {
    std::vector<health::CertificateRecord> records;

    Json::Value body;
    body["query"] = buildSearchQuery(authorityKeyId);
    body["fields"] = Json::arrayValue;
    body["fields"].append(FIELD_RAW);
    body["fields"].append(FIELD_FINGERPRINT);

    int lastPage = 1;
    for (int page = 1; page <= lastPage; ++page) {
        body["page"] = page;
        CensysSearchPage result = parseSearchPage(post("/search/certificates", body));
        if (result.skipped > 0) {
            spdlog::warn("[Censys] {} records without usable raw data (authority={}, page={})",
                         result.skipped, authorityKeyId, page);
        }
        for (auto& record : result.records) {
            records.push_back(std::move(record));
        }
        lastPage = std::min(options_.maxPages, result.pages);
    }

    spdlog::info("[Censys] search authority={} -> {} records", authorityKeyId, records.size());
    return records;
}

std::string CensysCertificateSource::resolveAuthorityName(const std::string& keyId) {
    Json::Value body;
    body["query"] = std::string(FIELD_AUTHORITY_KEY_ID) + ": " + keyId;
    body["field"] = FIELD_ISSUER_ORG;
    body["buckets"] = 1;
    return parseTopBucketKey(post("/report/certificates", body));
}

std::vector<health::AuthorityRecord> CensysCertificateSource::topAuthorities(int n) {
    if (n <= 0) return {};

    Json::Value body;
    body["query"] = "validation.nss.valid: true";
    body["field"] = FIELD_AUTHORITY_KEY_ID;
    body["buckets"] = n;

    auto authorities = parseReportBuckets(post("/report/certificates", body), n);

    for (auto& authority : authorities) {
        try {
            std::string name = resolveAuthorityName(authority.keyId);
            if (!name.empty()) {
                authority.name = name;
            }
        } catch (const common::CertificateSourceException& e) {
            if (e.rateLimited()) throw;
            spdlog::warn("[Censys] Name lookup failed for authority {}: {}", authority.keyId, e.what());
        } catch (const common::ParsingException& e) {
            spdlog::warn("[Censys] Name lookup failed for authority {}: {}", authority.keyId, e.what());
        }
    }

    spdlog::info("[Censys] topAuthorities({}) -> {} authorities", n, authorities.size());
    return authorities;
}

} // namespace infrastructure
} // namespace monitor
} // namespace ocspdash

/**
 * @file http_issuer_fetcher.cpp
 */

#include "http_issuer_fetcher.h"
#include "http_client.h"

#include <spdlog/spdlog.h>

namespace ocspdash {
namespace monitor {
namespace infrastructure {

HttpIssuerFetcher::HttpIssuerFetcher(std::chrono::milliseconds timeout, std::string userAgent)
    : timeout_(timeout), userAgent_(std::move(userAgent)) {}

std::optional<health::Der> HttpIssuerFetcher::fetch(const std::string& url) {
    HttpRequest request;
    request.url = url;
    request.timeout = timeout_;
    request.userAgent = userAgent_;
    request.followRedirects = true;

    HttpResponse response = performRequest(request);
    if (!response.ok()) {
        spdlog::warn("[IssuerFetcher] Failed to download issuer cert from {}: {}", url,
                     response.transportOk() ? "HTTP " + std::to_string(response.status) : response.error);
        return std::nullopt;
    }
    if (response.body.empty()) {
        spdlog::warn("[IssuerFetcher] Empty issuer cert from {}", url);
        return std::nullopt;
    }

    spdlog::debug("[IssuerFetcher] Downloaded {} bytes from {}", response.body.size(), url);
    return health::Der(response.body.begin(), response.body.end());
}

} // namespace infrastructure
} // namespace monitor
} // namespace ocspdash

#pragma once

/**
 * @file http_issuer_fetcher.h
 * @brief Downloads issuer certificates from AIA caIssuers URLs over HTTP
 */

#include "ocspdash/health/providers.h"

#include <chrono>
#include <string>

namespace ocspdash {
namespace monitor {
namespace infrastructure {

class HttpIssuerFetcher : public health::IIssuerFetcher {
public:
    HttpIssuerFetcher(std::chrono::milliseconds timeout, std::string userAgent);

    /// @return Response body on HTTP 2xx with a non-empty body, else std::nullopt
    std::optional<health::Der> fetch(const std::string& url) override;

private:
    std::chrono::milliseconds timeout_;
    std::string userAgent_;
};

} // namespace infrastructure
} // namespace monitor
} // namespace ocspdash

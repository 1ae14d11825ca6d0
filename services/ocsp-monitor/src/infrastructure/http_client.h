#pragma once

/**
 * @file http_client.h
 * @brief Minimal libcurl wrapper shared by the monitor's HTTP adapters
 */

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <curl/curl.h>

namespace ocspdash {
namespace monitor {
namespace infrastructure {

/// @brief RAII deleter for CURL easy handles
struct CurlDeleter {
    void operator()(CURL* c) const { if (c) curl_easy_cleanup(c); }
};
using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;

/// @brief RAII deleter for curl header lists
struct CurlSlistDeleter {
    void operator()(curl_slist* l) const { if (l) curl_slist_free_all(l); }
};
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

struct HttpRequest {
    std::string method = "GET";     ///< GET or POST
    std::string url;
    std::string body;
    std::vector<std::string> headers;
    std::chrono::milliseconds timeout{10000};
    std::string userPwd;            ///< "id:secret" for basic auth, empty for none
    std::string userAgent;
    bool followRedirects = false;
};

struct HttpResponse {
    CURLcode code = CURLE_OK;
    long status = 0;                ///< 0 when no response was received
    std::string body;
    std::string error;
    std::chrono::milliseconds elapsed{0};

    bool transportOk() const { return code == CURLE_OK; }
    bool ok() const { return code == CURLE_OK && status >= 200 && status < 300; }
    bool timedOut() const { return code == CURLE_OPERATION_TIMEDOUT; }
};

/**
 * @brief Perform one blocking HTTP request
 *
 * Never throws for transport errors; they are reported in HttpResponse.
 */
HttpResponse performRequest(const HttpRequest& request);

} // namespace infrastructure
} // namespace monitor
} // namespace ocspdash

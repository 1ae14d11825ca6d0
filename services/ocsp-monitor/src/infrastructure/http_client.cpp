/**
 * @file http_client.cpp
 * @brief libcurl request execution
 */

#include "http_client.h"
#include <spdlog/spdlog.h>

namespace ocspdash {
namespace monitor {
namespace infrastructure {

static size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* out) {
    size_t totalSize = size * nmemb;
    out->append(static_cast<char*>(contents), totalSize);
    return totalSize;
}

HttpResponse performRequest(const HttpRequest& request) {
    HttpResponse response;

    CurlPtr curl(curl_easy_init());
    if (!curl) {
        response.code = CURLE_FAILED_INIT;
        response.error = "Failed to initialize CURL";
        return response;
    }

    CurlSlistPtr headers;
    for (const auto& h : request.headers) {
        curl_slist* appended = curl_slist_append(headers.get(), h.c_str());
        if (!appended) {
            response.code = CURLE_OUT_OF_MEMORY;
            response.error = "Failed to build header list";
            return response;
        }
        headers.release();
        headers.reset(appended);
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    if (request.followRedirects) {
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
    }
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }
    if (!request.userAgent.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, request.userAgent.c_str());
    }
    if (!request.userPwd.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
        curl_easy_setopt(curl.get(), CURLOPT_USERPWD, request.userPwd.c_str());
    }
    if (request.method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    auto startTime = std::chrono::steady_clock::now();
    response.code = curl_easy_perform(curl.get());
    response.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

    if (response.code != CURLE_OK) {
        response.error = curl_easy_strerror(response.code);
        spdlog::debug("[HttpClient] {} {} failed: {}", request.method, request.url, response.error);
    }
    return response;
}

} // namespace infrastructure
} // namespace monitor
} // namespace ocspdash

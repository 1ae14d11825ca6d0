/**
 * @file local_vantage_point.cpp
 * @brief Direct connect + OCSP POST using libcurl
 */

#include "local_vantage_point.h"
#include "http_client.h"

#include <spdlog/spdlog.h>

namespace ocspdash {
namespace monitor {
namespace infrastructure {

LocalVantagePoint::LocalVantagePoint(std::string userAgent)
    : userAgent_(std::move(userAgent)) {}

health::ProbeExchange LocalVantagePoint::run(const health::Location& location, const health::ProbeTask& task) {
    health::ProbeExchange result;
    result.locationReached = true;

    connect(task, result);
    if (!result.connected) {
        spdlog::debug("[LocalVantagePoint] {} connect to {}:{} failed: {}",
                      location.id, task.host, task.port, result.error);
        return result;
    }

    exchange(task, result);
    return result;
}

void LocalVantagePoint::connect(const health::ProbeTask& task, health::ProbeExchange& result) const {
    CurlPtr curl(curl_easy_init());
    if (!curl) {
        result.error = "Failed to initialize CURL";
        return;
    }

    // Plain scheme: CONNECT_ONLY then stops after the TCP handshake
    std::string target = "http://" + task.host + ":" + std::to_string(task.port) + "/";
    curl_easy_setopt(curl.get(), CURLOPT_URL, target.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECT_ONLY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(task.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        result.error = curl_easy_strerror(res);
        return;
    }

    curl_off_t connectUs = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_CONNECT_TIME_T, &connectUs);
    result.connected = true;
    result.connectLatency = health::Millis(static_cast<long long>(connectUs / 1000));
}

void LocalVantagePoint::exchange(const health::ProbeTask& task, health::ProbeExchange& result) const {
    HttpRequest request;
    request.method = "POST";
    request.url = task.responderUrl;
    request.body.assign(task.requestBody.begin(), task.requestBody.end());
    request.headers = {"Content-Type: application/ocsp-request", "Accept: application/ocsp-response"};
    request.timeout = task.timeout;
    request.userAgent = userAgent_;

    HttpResponse response = performRequest(request);

    if (response.timedOut()) {
        result.timedOut = true;
        result.error = response.error;
        return;
    }
    if (response.status > 0) {
        result.httpStatus = static_cast<int>(response.status);
    }
    if (!response.transportOk()) {
        result.error = response.error;
        return;
    }

    result.exchangeLatency = response.elapsed;
    result.body.assign(response.body.begin(), response.body.end());
}

} // namespace infrastructure
} // namespace monitor
} // namespace ocspdash

/**
 * @file models.cpp
 * @brief JSON rendering for domain records
 */

#include "ocspdash/health/models.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace ocspdash::health {

std::string formatIso8601(TimePoint tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

Json::Value Result::toJson() const {
    Json::Value json;
    json["responderId"] = responderId;
    json["authorityId"] = authorityId;
    json["responderUrl"] = responderUrl;
    json["locationId"] = locationId;
    json["chainId"] = chainId;
    json["ping"] = pingLatency ? Json::Value(static_cast<Json::Int64>(pingLatency->count()))
                               : Json::Value(Json::nullValue);
    json["ocsp"] = ocspLatency ? Json::Value(static_cast<Json::Int64>(ocspLatency->count()))
                               : Json::Value(Json::nullValue);
    json["retrieved"] = formatIso8601(retrievedAt);
    json["status"] = healthStatusToString(status);
    json["failure"] = probeFailureToString(failure);
    json["failureLayer"] = failureLayerToString(failureLayer(failure));
    json["httpStatus"] = httpStatus ? Json::Value(*httpStatus) : Json::Value(Json::nullValue);
    if (!detail.empty()) {
        json["detail"] = detail;
    }
    return json;
}

} // namespace ocspdash::health

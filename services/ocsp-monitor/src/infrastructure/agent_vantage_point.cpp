/**
 * @file agent_vantage_point.cpp
 * @brief Remote agent probe transport
 */

#include "agent_vantage_point.h"
#include "http_client.h"
#include "json_codec.h"
#include "config_manager.h"
#include "exceptions.h"

#include "ocspdash/health/cert_ops.h"

#include <spdlog/spdlog.h>

namespace ocspdash {
namespace monitor {
namespace infrastructure {

AgentVantagePoint::AgentVantagePoint(std::chrono::milliseconds overhead, std::string userAgent)
    : overhead_(overhead), userAgent_(std::move(userAgent)) {}

Json::Value AgentVantagePoint::encodeTask(const health::ProbeTask& task) {
    Json::Value json;
    json["responder_url"] = task.responderUrl;
    json["host"] = task.host;
    json["port"] = task.port;
    json["ocsp_request"] = health::base64Encode(task.requestBody);
    json["timeout_ms"] = static_cast<Json::Int64>(task.timeout.count());
    return json;
}

health::ProbeExchange AgentVantagePoint::decodeReply(const std::string& body) {
    Json::Value root = parseJson(body, "agent reply");
    if (!root.isObject()) {
        throw common::ParsingException("agent reply is not an object");
    }

    health::ProbeExchange exchange;
    exchange.locationReached = true;
    exchange.connected = root.get("connected", false).asBool();
    if (root["connect_ms"].isNumeric()) {
        exchange.connectLatency = health::Millis(root["connect_ms"].asInt64());
    }
    exchange.timedOut = root.get("timed_out", false).asBool();
    if (root["http_status"].isIntegral() && root["http_status"].asInt() > 0) {
        exchange.httpStatus = root["http_status"].asInt();
    }
    if (root["exchange_ms"].isNumeric()) {
        exchange.exchangeLatency = health::Millis(root["exchange_ms"].asInt64());
    }
    if (root["body"].isString() && !root["body"].asString().empty()) {
        auto der = health::base64Decode(root["body"].asString());
        if (!der) {
            throw common::ParsingException("agent reply body is not valid base64");
        }
        exchange.body = std::move(*der);
    }
    exchange.error = root.get("error", "").asString();
    return exchange;
}

health::ProbeExchange AgentVantagePoint::run(const health::Location& location, const health::ProbeTask& task) {
    health::ProbeExchange unreachable;
    unreachable.locationReached = false;

    std::string address = location.address;
    while (!address.empty() && address.back() == '/') {
        address.pop_back();
    }

    HttpRequest request;
    request.method = "POST";
    request.url = address + "/probe";
    request.body = writeCompactJson(encodeTask(task));
    request.headers = {"Content-Type: application/json", "Accept: application/json"};
    request.timeout = task.timeout + overhead_;
    request.userAgent = userAgent_;

    if (!location.credentialRef.empty()) {
        std::string token = common::ConfigManager::getInstance().getString(location.credentialRef);
        if (token.empty()) {
            spdlog::error("[AgentVantagePoint] {}: credential {} is not set", location.id, location.credentialRef);
            unreachable.error = "credential " + location.credentialRef + " is not set";
            return unreachable;
        }
        request.headers.push_back("Authorization: Bearer " + token);
    }

    HttpResponse response = performRequest(request);
    if (!response.ok()) {
        unreachable.error = response.transportOk() ? "agent returned HTTP " + std::to_string(response.status)
                                                   : response.error;
        spdlog::error("[AgentVantagePoint] {} ({}) unreachable: {}", location.id, address, unreachable.error);
        return unreachable;
    }

    try {
        return decodeReply(response.body);
    } catch (const common::ParsingException& e) {
        spdlog::error("[AgentVantagePoint] {}: {}", location.id, e.what());
        unreachable.error = e.what();
        return unreachable;
    }
}

} // namespace infrastructure
} // namespace monitor
} // namespace ocspdash

#pragma once

/**
 * @file agent_vantage_point.h
 * @brief Probe transport that delegates to a remote agent over HTTP
 *
 * POST {location.address}/probe
 *   Authorization: Bearer <value of env var named by location.credentialRef>
 *   {"responder_url", "host", "port", "ocsp_request" (base64), "timeout_ms"}
 *
 * Reply:
 *   {"connected", "connect_ms", "timed_out", "http_status", "exchange_ms",
 *    "body" (base64), "error"}
 *
 * Any failure talking to the agent yields locationReached=false.
 */

#include "ocspdash/health/providers.h"

#include <json/json.h>

#include <chrono>
#include <string>

namespace ocspdash {
namespace monitor {
namespace infrastructure {

class AgentVantagePoint : public health::IVantagePoint {
public:
    /**
     * @param overhead Time added to the probe timeout for the agent round trip
     */
    AgentVantagePoint(std::chrono::milliseconds overhead, std::string userAgent);

    health::ProbeExchange run(const health::Location& location, const health::ProbeTask& task) override;

    /// @brief JSON probe task sent to the agent
    static Json::Value encodeTask(const health::ProbeTask& task);

    /**
     * @brief Decode an agent reply
     * @throws common::ParsingException on invalid JSON or invalid base64 body
     */
    static health::ProbeExchange decodeReply(const std::string& body);

private:
    std::chrono::milliseconds overhead_;
    std::string userAgent_;
};

} // namespace infrastructure
} // namespace monitor
} // namespace ocspdash

/**
 * @file ocsp_prober.cpp
 * @brief OCSP prober implementation
 */

#include "ocspdash/health/ocsp_prober.h"
#include "ocspdash/health/cert_ops.h"
#include "ocspdash/health/ocsp_codec.h"

#include <cctype>
#include <regex>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace ocspdash::health {

std::optional<ResponderUrl> parseResponderUrl(const std::string& url) {
    // Matches: scheme://host[:port][/path]
    static const std::regex urlRegex(R"(^(https?)://([^/:?#]+)(?::(\d{1,5}))?([/?#].*)?$)",
                                     std::regex::icase);
    std::smatch match;
    if (!std::regex_match(url, match, urlRegex)) {
        return std::nullopt;
    }

    ResponderUrl parts;
    parts.scheme = match.str(1);
    for (char& c : parts.scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    parts.host = match.str(2);
    if (match[3].matched) {
        parts.port = std::stoi(match.str(3));
        if (parts.port <= 0 || parts.port > 65535) return std::nullopt;
    } else {
        parts.port = parts.scheme == "https" ? 443 : 80;
    }
    parts.path = match[4].matched && !match.str(4).empty() ? match.str(4) : "/";
    return parts;
}

OcspProber::OcspProber(IVantagePoint* vantagePoint, const IClock* clock, Millis timeout)
    : vantagePoint_(vantagePoint), clock_(clock), timeout_(timeout)
{
    if (!vantagePoint_) {
        throw std::invalid_argument("OcspProber: vantagePoint cannot be nullptr");
    }
    if (!clock_) {
        throw std::invalid_argument("OcspProber: clock cannot be nullptr");
    }
}

ProbeOutcome OcspProber::probe(const Location& location,
                               const std::string& responderUrl,
                               const Chain& chain) {
    ProbeOutcome outcome;
    outcome.retrievedAt = clock_->now();

    // Step 1: Build request from chain
    X509Ptr subject = parseCertificate(chain.subject);
    X509Ptr issuer = parseCertificate(chain.issuer);
    if (!subject || !issuer) {
        outcome.failure = ProbeFailure::CHAIN_UNUSABLE;
        outcome.detail = "chain " + chain.id + " does not contain parseable certificates";
        return outcome;
    }

    std::string buildError;
    auto request = buildOcspRequest(subject.get(), issuer.get(), &buildError);
    if (!request) {
        outcome.failure = ProbeFailure::CHAIN_UNUSABLE;
        outcome.detail = buildError;
        return outcome;
    }

    auto url = parseResponderUrl(responderUrl);
    if (!url) {
        outcome.failure = ProbeFailure::NETWORK_UNREACHABLE;
        outcome.detail = "invalid responder URL: " + responderUrl;
        return outcome;
    }

    ProbeTask task;
    task.responderUrl = responderUrl;
    task.host = url->host;
    task.port = url->port;
    task.requestBody = std::move(*request);
    task.timeout = timeout_;

    // Step 2: Exchange through the vantage point
    // retrievedAt marks when the response arrived; the exchange may take up to the timeout
    ProbeExchange exchange;
    try {
        exchange = vantagePoint_->run(location, task);
        outcome.retrievedAt = clock_->now();
    } catch (const std::exception& e) {
        outcome.retrievedAt = clock_->now();
        spdlog::warn("[OcspProber] Vantage point {} failed: {}", location.id, e.what());
        outcome.failure = ProbeFailure::LOCATION_UNREACHABLE;
        outcome.detail = e.what();
        return outcome;
    }

    // Step 3: Network and HTTP layers
    if (!exchange.locationReached) {
        outcome.failure = ProbeFailure::LOCATION_UNREACHABLE;
        outcome.detail = exchange.error.empty() ? "vantage point unreachable" : exchange.error;
        return outcome;
    }
    if (!exchange.connected) {
        outcome.failure = ProbeFailure::NETWORK_UNREACHABLE;
        outcome.detail = exchange.error.empty() ? "connect failed" : exchange.error;
        return outcome;
    }

    outcome.reachable = true;
    outcome.pingLatency = exchange.connectLatency;

    if (exchange.timedOut) {
        outcome.failure = ProbeFailure::HTTP_TIMEOUT;
        outcome.detail = "no response within " + std::to_string(timeout_.count()) + " ms";
        return outcome;
    }
    if (!exchange.httpStatus) {
        outcome.failure = ProbeFailure::HTTP_ERROR;
        outcome.detail = exchange.error.empty() ? "no HTTP response" : exchange.error;
        return outcome;
    }
    outcome.httpStatus = exchange.httpStatus;
    if (*exchange.httpStatus < 200 || *exchange.httpStatus >= 300) {
        outcome.failure = ProbeFailure::HTTP_ERROR;
        outcome.detail = "HTTP " + std::to_string(*exchange.httpStatus);
        return outcome;
    }
    outcome.ocspLatency = exchange.exchangeLatency;

    // Step 4: Protocol layer
    OcspResponseInfo info = parseOcspResponse(exchange.body, subject.get(), issuer.get());
    outcome.failure = info.failure;
    outcome.certStatus = info.certStatus;
    outcome.signatureVerified = info.signatureVerified;
    outcome.responderMatchesIssuer = info.responderMatchesIssuer;
    outcome.thisUpdate = info.thisUpdate;
    outcome.nextUpdate = info.nextUpdate;
    outcome.revocationReason = info.revocationReason;
    outcome.detail = info.message;
    if (outcome.certStatus == OcspCertStatus::REVOKED && outcome.detail.empty()) {
        outcome.detail = "revoked: " + outcome.revocationReason;
    }

    spdlog::debug("[OcspProber] {} from {}: status={}, failure={}, ping={}ms, ocsp={}ms",
                  responderUrl, location.id,
                  ocspCertStatusToString(outcome.certStatus),
                  probeFailureToString(outcome.failure),
                  outcome.pingLatency ? outcome.pingLatency->count() : -1,
                  outcome.ocspLatency ? outcome.ocspLatency->count() : -1);
    return outcome;
}

} // namespace ocspdash::health

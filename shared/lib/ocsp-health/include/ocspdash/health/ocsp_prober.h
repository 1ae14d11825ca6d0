/**
 * @file ocsp_prober.h
 * @brief Runs one OCSP probe from one Location and reports what happened
 *
 * The prober never throws: every failure, including a vantage point that
 * throws, is folded into the returned ProbeOutcome.
 */

#pragma once

#include "ocspdash/health/models.h"
#include "ocspdash/health/providers.h"
#include "ocspdash/health/types.h"

#include <optional>
#include <string>

namespace ocspdash::health {

/// @brief Components of an http(s) responder URL
struct ResponderUrl {
    std::string scheme;     ///< "http" or "https"
    std::string host;
    int port = 80;
    std::string path = "/";
};

/**
 * @brief Split a responder URL into scheme, host, port and path
 * @return std::nullopt for anything that is not an http(s) URL with a host
 */
std::optional<ResponderUrl> parseResponderUrl(const std::string& url);

/**
 * @brief Probe seam used by the dispatcher
 */
class IProber {
public:
    virtual ~IProber() = default;

    virtual ProbeOutcome probe(const Location& location,
                               const std::string& responderUrl,
                               const Chain& chain) = 0;
};

/**
 * @brief OCSP prober over an IVantagePoint transport
 *
 * Steps:
 *   1. Build the DER OCSP request from chain subject + issuer
 *   2. Hand the exchange to the vantage point (connect timing, then POST)
 *   3. Map location/network/HTTP failures to the failure layers
 *   4. Parse and verify the DER response against the chain issuer
 *
 * ocspLatency is recorded only for a 2xx exchange; an unreachable responder
 * leaves both latencies unset.
 */
class OcspProber : public IProber {
public:
    /**
     * @param vantagePoint Transport (non-owning)
     * @param clock Clock used for retrieval timestamps (non-owning)
     * @param timeout Per-probe timeout passed to the transport
     * @throws std::invalid_argument if vantagePoint or clock is nullptr
     */
    OcspProber(IVantagePoint* vantagePoint, const IClock* clock, Millis timeout);

    ProbeOutcome probe(const Location& location,
                       const std::string& responderUrl,
                       const Chain& chain) override;

private:
    IVantagePoint* vantagePoint_;
    const IClock* clock_;
    Millis timeout_;
};

} // namespace ocspdash::health

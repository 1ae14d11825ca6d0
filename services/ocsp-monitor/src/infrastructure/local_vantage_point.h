#pragma once

/**
 * @file local_vantage_point.h
 * @brief Probe transport that runs directly from this host
 *
 * Step 1: bare TCP connect to host:port (ping latency)
 * Step 2: HTTP POST of the DER OCSPRequest (OCSP latency)
 */

#include "ocspdash/health/providers.h"

#include <string>

namespace ocspdash {
namespace monitor {
namespace infrastructure {

class LocalVantagePoint : public health::IVantagePoint {
public:
    explicit LocalVantagePoint(std::string userAgent);

    health::ProbeExchange run(const health::Location& location, const health::ProbeTask& task) override;

private:
    void connect(const health::ProbeTask& task, health::ProbeExchange& exchange) const;
    void exchange(const health::ProbeTask& task, health::ProbeExchange& exchange) const;

    std::string userAgent_;
};

} // namespace infrastructure
} // namespace monitor
} // namespace ocspdash

#pragma once

/**
 * @file vantage_point_router.h
 * @brief Selects the local or agent transport per Location
 */

#include "ocspdash/health/providers.h"

namespace ocspdash {
namespace monitor {
namespace infrastructure {

class VantagePointRouter : public health::IVantagePoint {
public:
    /**
     * @param local Transport for Locations with address "local" or empty (non-owning)
     * @param agent Transport for remote agent Locations (non-owning)
     * @throws std::invalid_argument if either is nullptr
     */
    VantagePointRouter(health::IVantagePoint* local, health::IVantagePoint* agent);

    health::ProbeExchange run(const health::Location& location, const health::ProbeTask& task) override;

private:
    health::IVantagePoint* local_;
    health::IVantagePoint* agent_;
};

} // namespace infrastructure
} // namespace monitor
} // namespace ocspdash

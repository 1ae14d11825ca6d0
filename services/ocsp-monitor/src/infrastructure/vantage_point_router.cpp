/**
 * @file vantage_point_router.cpp
 */

#include "vantage_point_router.h"

#include <stdexcept>

namespace ocspdash {
namespace monitor {
namespace infrastructure {

VantagePointRouter::VantagePointRouter(health::IVantagePoint* local, health::IVantagePoint* agent)
    : local_(local), agent_(agent) {
    if (!local_) {
        throw std::invalid_argument("VantagePointRouter: local cannot be nullptr");
    }
    if (!agent_) {
        throw std::invalid_argument("VantagePointRouter: agent cannot be nullptr");
    }
}

health::ProbeExchange VantagePointRouter::run(const health::Location& location, const health::ProbeTask& task) {
    return location.isLocal() ? local_->run(location, task) : agent_->run(location, task);
}

} // namespace infrastructure
} // namespace monitor
} // namespace ocspdash

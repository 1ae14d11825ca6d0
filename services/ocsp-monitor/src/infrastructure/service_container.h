#pragma once

/**
 * @file service_container.h
 * @brief Centralized service container for OCSP Monitor dependency management
 *
 * Owns the certificate source, discovery, transports, probing pipeline and
 * scheduler. Provides non-owning pointer accessors for dependency injection.
 */

#include <memory>

namespace ocspdash { namespace monitor { struct Config; } }

// Forward declarations - Health library
namespace ocspdash::health {
    class ICertificateSource;
    class DiscoveryCache;
    class LocationRegistry;
    class ResultStore;
    class RetryingResultSink;
    class ProbeDispatcher;
    class HealthMonitor;
}

namespace ocspdash {
namespace monitor {
namespace infrastructure {

class ProbeScheduler;

/**
 * @brief Centralized service container managing all OCSP Monitor dependencies
 *
 * Initialization order:
 * 1. Certificate source (Censys client wrapped by the rate limiter)
 * 2. Discovery engine, snapshot store and cache
 * 3. Location registry (LOCATIONS_FILE or the local vantage point)
 * 4. Transports (local, agent, router) and prober
 * 5. Result store, retrying sink, dispatcher
 * 6. Health monitor and scheduler
 */
class ServiceContainer {
public:
    ServiceContainer();
    ~ServiceContainer();

    // Non-copyable, non-movable
    ServiceContainer(const ServiceContainer&) = delete;
    ServiceContainer& operator=(const ServiceContainer&) = delete;

    /**
     * @brief Initialize all components in dependency order
     * @param config Monitor configuration
     * @return true on success, false on failure (details logged)
     */
    bool initialize(const Config& config);

    /**
     * @brief Stop the scheduler and release all resources (called automatically by destructor)
     */
    void shutdown();

    health::ICertificateSource* certificateSource() const;
    health::DiscoveryCache* discoveryCache() const;
    health::LocationRegistry* locationRegistry() const;
    health::ResultStore* resultStore() const;
    health::RetryingResultSink* resultSink() const;
    health::ProbeDispatcher* dispatcher() const;
    health::HealthMonitor* healthMonitor() const;
    ProbeScheduler* scheduler() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace infrastructure
} // namespace monitor
} // namespace ocspdash

/**
 * @file service_container.cpp
 * @brief OCSP Monitor ServiceContainer implementation
 *
 * Wires the health library to the concrete adapters in dependency order.
 */

#include "service_container.h"
#include "../common/config.h"

#include <spdlog/spdlog.h>

// Adapters
#include "censys_certificate_source.h"
#include "http_issuer_fetcher.h"
#include "local_vantage_point.h"
#include "agent_vantage_point.h"
#include "vantage_point_router.h"
#include "location_loader.h"
#include "probe_scheduler.h"

// Health library
#include "ocspdash/health/classifier.h"
#include "ocspdash/health/discovery_cache.h"
#include "ocspdash/health/discovery_engine.h"
#include "ocspdash/health/health_monitor.h"
#include "ocspdash/health/location_registry.h"
#include "ocspdash/health/ocsp_prober.h"
#include "ocspdash/health/probe_dispatcher.h"
#include "ocspdash/health/rate_limiter.h"
#include "ocspdash/health/result_store.h"

namespace ocspdash {
namespace monitor {
namespace infrastructure {

namespace {
// Agent round trip allowance on top of the probe timeout
constexpr std::chrono::milliseconds AGENT_OVERHEAD{5000};
}

struct ServiceContainer::Impl {
    health::SystemClock clock;

    // Certificate source
    std::unique_ptr<CensysCertificateSource> censys;
    std::unique_ptr<health::RateLimitedCertificateSource> source;
    std::unique_ptr<HttpIssuerFetcher> issuerFetcher;

    // Discovery
    std::unique_ptr<health::DiscoveryEngine> engine;
    std::unique_ptr<health::InMemoryDiscoveryStore> discoveryStore;
    std::unique_ptr<health::DiscoveryCache> cache;

    // Locations + transports
    std::unique_ptr<health::LocationRegistry> registry;
    std::unique_ptr<LocalVantagePoint> localVantagePoint;
    std::unique_ptr<AgentVantagePoint> agentVantagePoint;
    std::unique_ptr<VantagePointRouter> router;

    // Probing pipeline
    std::unique_ptr<health::OcspProber> prober;
    std::unique_ptr<health::Classifier> classifier;
    std::unique_ptr<health::ResultStore> resultStore;
    std::unique_ptr<health::RetryingResultSink> resultSink;
    std::unique_ptr<health::ProbeDispatcher> dispatcher;

    // Orchestration
    std::unique_ptr<health::HealthMonitor> monitor;
    std::unique_ptr<ProbeScheduler> scheduler;
};

ServiceContainer::ServiceContainer() : impl_(std::make_unique<Impl>()) {}

ServiceContainer::~ServiceContainer() {
    shutdown();
}

bool ServiceContainer::initialize(const Config& config) {
    spdlog::info("Initializing OCSP Monitor dependencies...");

    try {
        // Step 1: Certificate source
        CensysOptions options;
        options.apiUrl = config.censysApiUrl;
        options.apiId = config.censysApiId;
        options.apiSecret = config.censysApiSecret;
        options.maxPages = config.censysMaxPages;
        options.pageRate = config.censysRateLimit;
        options.userAgent = config.userAgent;
        impl_->censys = std::make_unique<CensysCertificateSource>(options);
        impl_->source = std::make_unique<health::RateLimitedCertificateSource>(
            impl_->censys.get(), config.censysRateLimit);
        impl_->issuerFetcher = std::make_unique<HttpIssuerFetcher>(
            std::chrono::milliseconds(config.probeTimeoutMs), config.userAgent);
        spdlog::info("Certificate source: {} ({} calls/s, {} pages)",
                     config.censysApiUrl, config.censysRateLimit, config.censysMaxPages);

        // Step 2: Discovery
        impl_->engine = std::make_unique<health::DiscoveryEngine>(
            impl_->source.get(), impl_->issuerFetcher.get());
        impl_->discoveryStore = std::make_unique<health::InMemoryDiscoveryStore>();
        impl_->cache = std::make_unique<health::DiscoveryCache>(
            impl_->engine.get(), impl_->discoveryStore.get(), &impl_->clock,
            std::chrono::hours(config.discoveryTtlHours));

        // Step 3: Locations
        impl_->registry = std::make_unique<health::LocationRegistry>();
        if (config.locationsFile.empty()) {
            impl_->registry->upsert(LocationLoader::defaultLocal());
            spdlog::info("No LOCATIONS_FILE configured, probing from this host only");
        } else {
            size_t loaded = LocationLoader::loadFile(config.locationsFile, *impl_->registry);
            spdlog::info("Loaded {} locations from {}", loaded, config.locationsFile);
        }
        if (impl_->registry->size() == 0) {
            spdlog::critical("No locations configured");
            return false;
        }

        // Step 4: Transports + prober
        impl_->localVantagePoint = std::make_unique<LocalVantagePoint>(config.userAgent);
        impl_->agentVantagePoint = std::make_unique<AgentVantagePoint>(AGENT_OVERHEAD, config.userAgent);
        impl_->router = std::make_unique<VantagePointRouter>(
            impl_->localVantagePoint.get(), impl_->agentVantagePoint.get());
        impl_->prober = std::make_unique<health::OcspProber>(
            impl_->router.get(), &impl_->clock, health::Millis(config.probeTimeoutMs));

        health::ClassifierPolicy policy;
        policy.nextUpdateGrace = std::chrono::seconds(config.nextUpdateGraceSeconds);
        impl_->classifier = std::make_unique<health::Classifier>(policy);

        // Step 5: Results + dispatcher
        impl_->resultStore = std::make_unique<health::ResultStore>();
        impl_->resultSink = std::make_unique<health::RetryingResultSink>(
            impl_->resultStore.get(), config.sinkMaxAttempts,
            std::chrono::milliseconds(config.sinkBackoffMs));

        health::DispatchPolicy dispatchPolicy;
        dispatchPolicy.maxInFlight = config.maxInFlight;
        dispatchPolicy.maxPerLocation = config.maxPerLocation;
        dispatchPolicy.maxPerResponder = config.maxPerResponder;
        impl_->dispatcher = std::make_unique<health::ProbeDispatcher>(
            impl_->prober.get(), impl_->classifier.get(), impl_->resultSink.get(),
            &impl_->clock, dispatchPolicy);

        // Step 6: Monitor + scheduler
        health::MonitorSettings settings;
        settings.topAuthorities = config.topAuthorities;
        settings.catalogTtl = std::chrono::hours(config.discoveryTtlHours);
        impl_->monitor = std::make_unique<health::HealthMonitor>(
            impl_->source.get(), impl_->cache.get(), impl_->registry.get(),
            impl_->dispatcher.get(), impl_->resultStore.get(), &impl_->clock, settings);

        impl_->scheduler = std::make_unique<ProbeScheduler>();
        impl_->scheduler->configure(std::chrono::seconds(10), std::chrono::minutes(config.cycleIntervalMinutes));

        health::HealthMonitor* monitor = impl_->monitor.get();
        health::RetryingResultSink* sink = impl_->resultSink.get();
        impl_->scheduler->setCycleFn([monitor, sink](const health::CancellationToken& cancellation) {
            if (!sink->undelivered().empty()) {
                size_t redelivered = sink->redeliver();
                spdlog::info("[ServiceContainer] Redelivered {} buffered results", redelivered);
            }
            health::CycleSummary summary = monitor->runCycle(cancellation);
            spdlog::info("Cycle summary: {}", summary.toJson().toStyledString());
        });

        spdlog::info("All OCSP Monitor dependencies initialized successfully");
        return true;

    } catch (const std::exception& e) {
        spdlog::critical("Failed to initialize OCSP Monitor: {}", e.what());
        return false;
    }
}

void ServiceContainer::shutdown() {
    if (!impl_) return;

    spdlog::info("Shutting down OCSP Monitor dependencies...");

    // Scheduler first so no cycle touches the pipeline while it is torn down
    if (impl_->scheduler) {
        impl_->scheduler->stop();
        impl_->scheduler.reset();
    }

    impl_->monitor.reset();
    impl_->dispatcher.reset();
    impl_->resultSink.reset();
    impl_->resultStore.reset();
    impl_->classifier.reset();
    impl_->prober.reset();
    impl_->router.reset();
    impl_->agentVantagePoint.reset();
    impl_->localVantagePoint.reset();
    impl_->registry.reset();
    impl_->cache.reset();
    impl_->discoveryStore.reset();
    impl_->engine.reset();
    impl_->issuerFetcher.reset();
    impl_->source.reset();
    impl_->censys.reset();

    spdlog::info("OCSP Monitor dependencies shut down");
}

health::ICertificateSource* ServiceContainer::certificateSource() const {
    return impl_->source.get();
}

health::DiscoveryCache* ServiceContainer::discoveryCache() const {
    return impl_->cache.get();
}

health::LocationRegistry* ServiceContainer::locationRegistry() const {
    return impl_->registry.get();
}

health::ResultStore* ServiceContainer::resultStore() const {
    return impl_->resultStore.get();
}

health::RetryingResultSink* ServiceContainer::resultSink() const {
    return impl_->resultSink.get();
}

health::ProbeDispatcher* ServiceContainer::dispatcher() const {
    return impl_->dispatcher.get();
}

health::HealthMonitor* ServiceContainer::healthMonitor() const {
    return impl_->monitor.get();
}

ProbeScheduler* ServiceContainer::scheduler() const {
    return impl_->scheduler.get();
}

} // namespace infrastructure
} // namespace monitor
} // namespace ocspdash

/**
 * @file main.cpp
 * @brief OCSP Monitor entry point
 *
 * Usage:
 *   ocsp-monitor              run cycles on the configured interval until SIGINT/SIGTERM
 *   ocsp-monitor --once       run one cycle, print the report JSON and exit
 *   ocsp-monitor --manifest   run one cycle, print the manifest as JSON Lines and exit
 */

#include "common/config.h"
#include "infrastructure/probe_scheduler.h"
#include "infrastructure/service_container.h"
#include "logger.h"

#include "ocspdash/health/health_monitor.h"
#include "ocspdash/health/probe_dispatcher.h"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

using namespace ocspdash;

namespace {

volatile std::sig_atomic_t g_stopRequested = 0;

void handleSignal(int) {
    g_stopRequested = 1;
}

enum class RunMode { DAEMON, ONCE, MANIFEST };

RunMode parseArgs(int argc, char* argv[]) {
    RunMode mode = RunMode::DAEMON;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--once") {
            mode = RunMode::ONCE;
        } else if (arg == "--manifest") {
            mode = RunMode::MANIFEST;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            std::cerr << "Usage: " << argv[0] << " [--once | --manifest]" << std::endl;
            std::exit(2);
        }
    }
    return mode;
}

int runOnce(monitor::infrastructure::ServiceContainer& container, RunMode mode) {
    health::CancellationToken cancellation;
    health::CycleSummary summary = container.healthMonitor()->runCycle(cancellation);
    spdlog::info("Cycle finished: {} results ({} good, {} questionable, {} bad)",
                 summary.results, summary.good, summary.questionable, summary.bad);

    if (mode == RunMode::MANIFEST) {
        std::cout << health::HealthMonitor::toJsonLines(container.healthMonitor()->manifest());
    } else {
        std::cout << container.healthMonitor()->report().toJson().toStyledString();
    }
    return 0;
}

} // namespace

// =============================================================================
// Main
// =============================================================================
int main(int argc, char* argv[]) {
    RunMode mode = parseArgs(argc, argv);

    // Initialize CURL library (must be done before any threads)
    curl_global_init(CURL_GLOBAL_DEFAULT);

    monitor::Config config;
    config.loadFromEnv();

    common::Logger::initialize("ocsp-monitor", config.logLevel, !config.logFile.empty(), config.logFile);

    spdlog::info("===========================================");
    spdlog::info("  OCSP Responder Health Monitor v1.0.0");
    spdlog::info("===========================================");

    try {
        config.validateRequiredCredentials();
        config.validate();
    } catch (const common::ConfigException& e) {
        spdlog::critical("{}", e.what());
        curl_global_cleanup();
        return 1;
    }

    spdlog::info("Top authorities: {}, discovery TTL: {}h, cycle interval: {}min",
                 config.topAuthorities, config.discoveryTtlHours, config.cycleIntervalMinutes);
    spdlog::info("Probe timeout: {}ms, in flight: {}, per location: {}, per responder: {}",
                 config.probeTimeoutMs, config.maxInFlight, config.maxPerLocation, config.maxPerResponder);

    int exitCode = 0;
    {
        monitor::infrastructure::ServiceContainer container;
        if (!container.initialize(config)) {
            spdlog::critical("Initialization failed, exiting");
            curl_global_cleanup();
            return 1;
        }

        if (mode != RunMode::DAEMON) {
            exitCode = runOnce(container, mode);
        } else {
            std::signal(SIGINT, handleSignal);
            std::signal(SIGTERM, handleSignal);

            container.scheduler()->start();
            while (!g_stopRequested) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            spdlog::info("Stop requested, cancelling the running cycle...");
        }
        container.shutdown();
    }

    common::Logger::flush();
    curl_global_cleanup();
    return exitCode;
}

/**
 * @file main.cpp
 * @brief camfleetd entry point
 *
 * Thin executable that wires the library components together:
 * - Orchestrator for discovery, endpoint negotiation and certificate scanning
 * - Health monitor with built-in checks and recovery
 * - One-shot certificate minting
 */

#include <camfleet/core/certificate_manager.hpp>
#include <camfleet/core/errors.hpp>
#include <camfleet/core/orchestrator.hpp>
#include <camfleet/core/system_metrics.hpp>
#include <camfleet/daemon/config.hpp>
#include <camfleet/net/http_client.hpp>
#include <camfleet/utils/logger.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>

using namespace camfleet;
using namespace camfleet::daemon;

// Global shutdown flag
static std::atomic<bool> g_shutdown{false};

// Signal handler
void signalHandler(int) {
    g_shutdown.store(true);
}

static int generateCertificate(const Config& config) {
    core::CertificateConfig certConfig;
    certConfig.cert_dir = config.cert_dir;
    core::CertificateTrustManager manager(certConfig);

    try {
        auto generated = manager.generateSelfSigned(config.generate_cert, {"127.0.0.1", "::1"});
        LOG_INFO("Daemon", "Certificate: {}", generated.cert_path);
        LOG_INFO("Daemon", "Private key: {}", generated.key_path);
        return 0;
    } catch (const core::CryptoError& e) {
        LOG_ERROR("Daemon", "Certificate generation failed: {}", e.what());
    } catch (const core::StorageError& e) {
        LOG_ERROR("Daemon", "Cannot write certificate: {}", e.what());
    }
    return 1;
}

int main(int argc, char* argv[]) {
    // Parse command line arguments
    Config config = parseArgs(argc, argv);

    if (config.help) {
        printUsage(argv[0]);
        return 0;
    }

    if (!config.config_file.empty()) {
        try {
            applyConfigFile(config, config.config_file);
        } catch (const core::StorageError& e) {
            LOG_FATAL("Daemon", "{}", e.what());
            return 1;
        }
    }

    // Configure logging
    utils::Logger::instance().setLevel(utils::logLevelFromString(config.log_level));

    if (!config.generate_cert.empty()) {
        return generateCertificate(config);
    }

    LOG_INFO("Daemon", "camfleetd starting...");
    LOG_INFO("Daemon", "Network: {}", config.network);
    LOG_INFO("Daemon", "Output directory: {}", config.output_dir);
    LOG_INFO("Daemon", "Certificate directory: {}", config.cert_dir);

    // Install signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);

    try {
        auto http = std::make_shared<net::CurlHttpClient>();
        auto collector = std::make_shared<core::LinuxMetricsCollector>();
        core::Orchestrator orchestrator(toOrchestratorConfig(config), http, collector);

        // Forward the shutdown flag to the orchestrator
        std::atomic<bool> finished{false};
        std::thread watcher([&]() {
            while (!g_shutdown.load() && !finished.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            if (g_shutdown.load()) {
                LOG_INFO("Daemon", "Received shutdown signal");
                orchestrator.requestStop();
            }
        });

        bool ok = false;
        std::string fatal;
        try {
            ok = config.once ? orchestrator.configure() : orchestrator.run();
        } catch (const core::DiscoveryError& e) {
            fatal = e.what();
        } catch (const std::exception& e) {
            fatal = std::string("Fatal error: ") + e.what();
        }

        finished.store(true);
        watcher.join();

        if (!fatal.empty()) {
            LOG_FATAL("Daemon", "{}", fatal);
            return 1;
        }

        LOG_INFO("Daemon", "camfleetd stopped");
        return ok ? 0 : 1;

    } catch (const std::exception& e) {
        LOG_FATAL("Daemon", "Fatal error: {}", e.what());
        return 1;
    }
}

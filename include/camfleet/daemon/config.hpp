/**
 * @file config.hpp
 * @brief camfleetd configuration and CLI parsing
 */

#pragma once

#include "camfleet/core/health_checks.hpp"
#include "camfleet/core/orchestrator.hpp"

#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

namespace camfleet {
namespace daemon {

/**
 * @brief Daemon configuration structure
 */
struct Config {
    std::string username = "root";
    std::string password = "admin";
    std::string network = "192.168.1.0/24";
    std::string config_file;
    std::string output_dir = ".";
    std::string cert_dir = "./certificates";
    std::string log_level = "INFO";
    std::string webhook_url;                    ///< empty = alerts are only logged
    int status_interval_s = 60;
    int rediscovery_interval_s = 3600;          ///< 0 disables periodic rediscovery
    bool monitor_without_devices = false;
    bool once = false;                          ///< run configuration phases and exit
    std::string generate_cert;                  ///< hostname to mint a certificate for
    bool help = false;

    // Only settable through the config file
    core::ResourceThresholds thresholds;
    std::vector<core::ServiceSpec> services = {core::ServiceSpec{}};
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "camfleetd - Camera fleet auto-configuration and health recovery\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  -u, --username <name>        Camera username (default: root)\n"
              << "  -p, --password <pass>        Camera password (default: admin)\n"
              << "  -n, --network <cidr>         Network range to scan (default: 192.168.1.0/24)\n"
              << "  -c, --config-file <path>     JSON config file; its keys override the CLI\n"
              << "  --output-dir <dir>           Directory for JSON snapshots (default: .)\n"
              << "  --cert-dir <dir>             Certificate store (default: ./certificates)\n"
              << "  --log-level <level>          TRACE, DEBUG, INFO, WARN, ERROR, FATAL (default: INFO)\n"
              << "  --webhook <url>              POST alerts to this URL\n"
              << "\nScheduling Options:\n"
              << "  --status-interval <s>        Fleet status summary interval (default: 60)\n"
              << "  --rediscovery-interval <s>   Periodic rediscovery, 0=off (default: 3600)\n"
              << "  --monitor-without-devices    Keep monitoring when discovery finds nothing\n"
              << "\nOne-shot Options:\n"
              << "  --once                       Run discovery, negotiation and cert scan, then exit\n"
              << "  --generate-cert <hostname>   Mint a self-signed certificate and exit\n"
              << "\n  -h, --help                   Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " -u root -p secret -n 10.0.0.0/24\n"
              << "  " << program_name << " --config-file fleet.json --webhook http://alerts:9000/hook\n";
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Flags without a value
        if (std::strcmp(arg, "--monitor-without-devices") == 0) {
            config.monitor_without_devices = true;
            continue;
        }
        if (std::strcmp(arg, "--once") == 0) {
            config.once = true;
            continue;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            std::cerr << "Error: Option " << arg << " requires a value\n";
            config.help = true;
            return config;
        }

        const char* value = argv[++i];

        if (std::strcmp(arg, "--username") == 0 || std::strcmp(arg, "-u") == 0) {
            config.username = value;
        } else if (std::strcmp(arg, "--password") == 0 || std::strcmp(arg, "-p") == 0) {
            config.password = value;
        } else if (std::strcmp(arg, "--network") == 0 || std::strcmp(arg, "-n") == 0) {
            config.network = value;
        } else if (std::strcmp(arg, "--config-file") == 0 || std::strcmp(arg, "-c") == 0) {
            config.config_file = value;
        } else if (std::strcmp(arg, "--output-dir") == 0) {
            config.output_dir = value;
        } else if (std::strcmp(arg, "--cert-dir") == 0) {
            config.cert_dir = value;
        } else if (std::strcmp(arg, "--log-level") == 0) {
            config.log_level = value;
        } else if (std::strcmp(arg, "--webhook") == 0) {
            config.webhook_url = value;
        } else if (std::strcmp(arg, "--status-interval") == 0) {
            config.status_interval_s = std::stoi(value);
        } else if (std::strcmp(arg, "--rediscovery-interval") == 0) {
            config.rediscovery_interval_s = std::stoi(value);
        } else if (std::strcmp(arg, "--generate-cert") == 0) {
            config.generate_cert = value;
        } else {
            std::cerr << "Error: Unknown option " << arg << "\n";
            config.help = true;
            return config;
        }
    }

    return config;
}

/**
 * @brief Overlay keys present in a JSON config file onto @p config.
 * @throws core::StorageError if the file is missing or malformed.
 */
void applyConfigFile(Config& config, const std::string& path);

/**
 * @brief Build the orchestrator settings from the daemon configuration.
 */
core::OrchestratorConfig toOrchestratorConfig(const Config& config);

} // namespace daemon
} // namespace camfleet

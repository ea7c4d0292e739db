/**
 * @file config.hpp
 * @brief lumend configuration and CLI parsing
 */

#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace lumen {
namespace daemon {

/**
 * @brief Daemon configuration structure
 */
struct Config {
    // Default device, seeded from BULB_IP / BULB_PORT
    std::string device_address = "192.168.1.45";
    uint16_t device_port = 4000;
    bool connect_default_device = true;

    // Command settings
    int timeout_ms = 5000;                      ///< Per-command deadline
    size_t max_in_flight = 256;                 ///< Per-device outstanding command limit (0 = unbounded)

    // Discovery settings
    std::vector<uint16_t> discovery_ports = {4000, 4001, 4002, 8000, 8080};
    std::vector<std::string> discovery_addresses = {"255.255.255.255", "192.168.1.255"};

    // gRPC control service
    std::string listen_addr = "0.0.0.0:50061";
    int workers = 4;                            ///< Threads running blocking device calls

    std::string log_level = "INFO";
    bool help = false;
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "lumend - Smart Bulb Control Daemon\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Device Options:\n"
              << "  --device-address <ip>   Default bulb address (default: $BULB_IP or 192.168.1.45)\n"
              << "  --device-port <port>    Default bulb UDP port (default: $BULB_PORT or 4000)\n"
              << "  --no-default-device     Do not connect a default bulb at startup\n"
              << "  --timeout-ms <ms>       Per-command timeout (default: 5000)\n"
              << "  --max-in-flight <n>     Outstanding commands per bulb, 0=unbounded (default: 256)\n"
              << "\nDiscovery Options:\n"
              << "  --discovery-ports <list>      Comma-separated UDP ports (default: 4000,4001,4002,8000,8080)\n"
              << "  --discovery-addresses <list>  Comma-separated broadcast addresses\n"
              << "                                (default: 255.255.255.255,192.168.1.255)\n"
              << "\nService Options:\n"
              << "  --listen <addr:port>    gRPC listen address (default: 0.0.0.0:50061)\n"
              << "  --workers <n>           Worker threads for device calls (default: 4)\n"
              << "  --log-level <level>     Log level: TRACE, DEBUG, INFO, WARN, ERROR, OFF (default: INFO)\n"
              << "\n  --help                  Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " --device-address 10.0.0.5 --device-port 4000\n"
              << "  BULB_IP=10.0.0.5 " << program_name << " --listen 127.0.0.1:50061\n";
}

/**
 * @brief Split a comma-separated list, skipping empty items
 */
inline std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

/**
 * @brief Parse a port number
 * @throws std::invalid_argument / std::out_of_range on bad input
 */
inline uint16_t parsePort(const std::string& value) {
    int port = std::stoi(value);
    if (port <= 0 || port > 65535) {
        throw std::out_of_range("port out of range: " + value);
    }
    return static_cast<uint16_t>(port);
}

/**
 * @brief Apply BULB_IP / BULB_PORT from the environment
 * @param config Configuration to update
 */
inline void applyEnvironment(Config& config) {
    if (const char* ip = std::getenv("BULB_IP")) {
        if (*ip != '\0') {
            config.device_address = ip;
        }
    }
    if (const char* port = std::getenv("BULB_PORT")) {
        try {
            config.device_port = parsePort(port);
        } catch (const std::exception&) {
            std::cerr << "Warning: Ignoring invalid BULB_PORT '" << port << "'\n";
        }
    }
}

/**
 * @brief Parse command line arguments
 *
 * Environment defaults are applied first so that flags override them.
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;
    applyEnvironment(config);

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        if (std::strcmp(arg, "--no-default-device") == 0) {
            config.connect_default_device = false;
            continue;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            std::cerr << "Error: Option " << arg << " requires a value\n";
            config.help = true;
            return config;
        }

        const char* value = argv[++i];

        try {
            if (std::strcmp(arg, "--device-address") == 0) {
                config.device_address = value;
            } else if (std::strcmp(arg, "--device-port") == 0) {
                config.device_port = parsePort(value);
            } else if (std::strcmp(arg, "--timeout-ms") == 0) {
                config.timeout_ms = std::stoi(value);
            } else if (std::strcmp(arg, "--max-in-flight") == 0) {
                config.max_in_flight = std::stoull(value);
            } else if (std::strcmp(arg, "--listen") == 0) {
                config.listen_addr = value;
            } else if (std::strcmp(arg, "--workers") == 0) {
                config.workers = std::stoi(value);
            } else if (std::strcmp(arg, "--discovery-ports") == 0) {
                config.discovery_ports.clear();
                for (const auto& port : splitList(value)) {
                    config.discovery_ports.push_back(parsePort(port));
                }
            } else if (std::strcmp(arg, "--discovery-addresses") == 0) {
                config.discovery_addresses = splitList(value);
            } else if (std::strcmp(arg, "--log-level") == 0) {
                config.log_level = value;
            } else {
                std::cerr << "Error: Unknown option " << arg << "\n";
                config.help = true;
                return config;
            }
        } catch (const std::exception&) {
            std::cerr << "Error: Invalid value '" << value << "' for " << arg << "\n";
            config.help = true;
            return config;
        }
    }

    if (config.timeout_ms <= 0 || config.workers <= 0) {
        std::cerr << "Error: --timeout-ms and --workers must be positive\n";
        config.help = true;
    }

    return config;
}

} // namespace daemon
} // namespace lumen

/**
 * @file main.cpp
 * @brief lumend entry point
 *
 * This is the thin executable that wires together the library components:
 * - Device registry owning one proxy per connected bulb
 * - Discovery broadcaster for finding bulbs on the LAN
 * - BulbControl gRPC service for applications and lumen-cli
 */

#include <lumen/daemon/config.hpp>
#include <lumen/net/platform.hpp>
#include <lumen/utils/logger.hpp>
#include <lumen/core/device_registry.hpp>
#include <lumen/core/discovery_broadcaster.hpp>
#include <lumen/services/control_service.hpp>

#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>

#include <csignal>
#include <atomic>
#include <memory>
#include <thread>
#include <chrono>

using namespace lumen;
using namespace lumen::daemon;

// Global shutdown flag
static std::atomic<bool> g_shutdown{false};

// Signal handler
void signalHandler(int /*signal*/) {
    g_shutdown.store(true);
}

int main(int argc, char* argv[]) {
    // Parse command line arguments
    Config config = parseArgs(argc, argv);

    if (config.help) {
        printUsage(argv[0]);
        return 0;
    }

    // Configure logging
    utils::Logger::instance().setLevel(utils::parseLogLevel(config.log_level));

    LOG_INFO("Daemon", "lumend starting...");
    LOG_INFO("Daemon", "Default bulb: {}", config.connect_default_device
             ? config.device_address + ":" + std::to_string(config.device_port)
             : std::string("none"));
    LOG_INFO("Daemon", "Command timeout: {}ms, max in flight: {}",
             config.timeout_ms, config.max_in_flight);

    // Install signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    net::SocketInitializer sockets;
    if (!sockets.isInitialized()) {
        LOG_ERROR("Daemon", "Failed to initialize sockets");
        return 1;
    }

    try {
        core::RegistryConfig registryConfig;
        registryConfig.timeout_ms = config.timeout_ms;
        registryConfig.max_in_flight = config.max_in_flight;
        auto registry = std::make_shared<core::DeviceRegistry>(registryConfig);

        core::DiscoveryConfig discoveryConfig;
        discoveryConfig.ports = config.discovery_ports;
        discoveryConfig.addresses = config.discovery_addresses;
        auto discovery = std::make_shared<core::DiscoveryBroadcaster>(discoveryConfig);

        // A missing default bulb is not fatal; it can be connected later
        if (config.connect_default_device) {
            try {
                registry->getOrConnect(config.device_address, config.device_port);
                LOG_INFO("Daemon", "Connected to default bulb at {}:{}",
                         config.device_address, config.device_port);
            } catch (const core::LumenError& e) {
                LOG_ERROR("Daemon", "Failed to connect to default bulb: {}", e.what());
            }
        }

        services::ControlServiceConfig serviceConfig;
        serviceConfig.has_default_device = config.connect_default_device;
        serviceConfig.default_address = config.device_address;
        serviceConfig.default_port = config.device_port;
        serviceConfig.workers = static_cast<size_t>(config.workers);
        auto control_service = std::make_unique<services::ControlServiceImpl>(
            registry, discovery, serviceConfig);

        // Build and start control gRPC server
        grpc::ServerBuilder builder;
        builder.AddListeningPort(config.listen_addr, grpc::InsecureServerCredentials());
        builder.RegisterService(control_service.get());
        auto server = builder.BuildAndStart();

        if (!server) {
            LOG_ERROR("Daemon", "Failed to start control server on {}", config.listen_addr);
            registry->disconnectAll();
            return 1;
        }
        LOG_INFO("Daemon", "Control server listening on {}", config.listen_addr);
        LOG_INFO("Daemon", "lumend is ready");

        // Main loop - wait for shutdown signal
        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        // Graceful shutdown
        LOG_INFO("Daemon", "Shutting down...");

        auto deadline = std::chrono::system_clock::now() + std::chrono::seconds(5);
        server->Shutdown(deadline);
        server->Wait();

        // Drains the worker pool before the devices go away
        control_service.reset();
        registry->disconnectAll();

        LOG_INFO("Daemon", "lumend stopped");
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("Daemon", "Fatal error: {}", e.what());
        return 1;
    }
}

/**
 * @file main.cpp
 * @brief lumen-mock-bulb entry point
 *
 * Runs a simulated bulb for manual testing of lumend and lumen-cli:
 *
 *   lumen-mock-bulb [port] [name]
 */

#include "mock_bulb.hpp"

#include "lumen/net/platform.hpp"
#include "lumen/utils/logger.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

using namespace lumen;

static std::atomic<bool> g_shutdown{false};

void signalHandler(int /*signal*/) {
    g_shutdown.store(true);
}

int main(int argc, char* argv[]) {
    uint16_t port = 4000;
    if (argc > 1) {
        int parsed = std::atoi(argv[1]);
        if (parsed > 0 && parsed <= 65535) {
            port = static_cast<uint16_t>(parsed);
        }
    }
    std::string name = argc > 2 ? argv[2] : "Mock Smart Bulb";

    std::cout << "Starting Mock Smart Bulb Server\n"
              << "   Name: " << name << "\n"
              << "   Port: " << port << "\n"
              << "   Press Ctrl+C to stop\n\n";

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    net::SocketInitializer sockets;
    mock::MockBulb bulb(port, name);
    if (!bulb.start()) {
        LOG_ERROR("MockBulb", "Could not start on port {}", port);
        return 1;
    }

    std::cout << "Initial state: " << core::protocol::toCompactJson(bulb.state().toJson()) << "\n";

    // Print the state every 10 seconds
    auto nextReport = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (std::chrono::steady_clock::now() >= nextReport) {
            std::cout << "\nCurrent State: "
                      << core::protocol::toCompactJson(bulb.state().toJson()) << "\n";
            nextReport += std::chrono::seconds(10);
        }
    }

    std::cout << "\nShutting down mock bulb...\n";
    bulb.stop();
    return 0;
}

/**
 * @file mock_bulb.hpp
 * @brief In-process bulb simulator speaking the JSON-over-UDP protocol.
 *
 * Used by the lumen-mock-bulb executable and as a test fixture. Besides
 * answering commands like a real bulb, it exposes knobs that let tests
 * count requests, drop them, delay replies or send each reply twice.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/core/protocol.hpp"
#include "lumen/net/udp_socket.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lumen {
namespace mock {

/**
 * @struct MockBulbState
 * @brief Simulated bulb state. Starts off at 50% warm white.
 */
struct MockBulbState {
    bool power = false;
    int brightness = 50;
    core::RgbColor color;
    int temperature = 3000;

    Json::Value toJson() const;
};

/**
 * @class MockBulb
 * @brief A fake bulb on a loopback or LAN UDP port.
 *
 * Usage:
 * @code
 * mock::MockBulb bulb(0, "Test Bulb", "127.0.0.1");
 * ASSERT_TRUE(bulb.start());
 * core::DeviceConfig config;
 * config.address = "127.0.0.1";
 * config.port = bulb.port();
 * @endcode
 */
class MockBulb {
public:
    /**
     * @param port UDP port to listen on, 0 for an ephemeral one.
     * @param name Name reported in discovery replies.
     * @param bindAddress Local address to bind.
     */
    explicit MockBulb(uint16_t port = 4000,
                      std::string name = "Mock Smart Bulb",
                      std::string bindAddress = "0.0.0.0");
    ~MockBulb();

    MockBulb(const MockBulb&) = delete;
    MockBulb& operator=(const MockBulb&) = delete;

    /**
     * @brief Bind the socket and start answering.
     * @return False if the port could not be bound.
     */
    bool start();

    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Bound port (resolved after start() when constructed with 0).
     */
    uint16_t port() const { return port_; }

    const std::string& name() const { return name_; }

    MockBulbState state() const;

    /// Datagrams received, including ones dropped while muted
    std::size_t requestCount() const { return requestCount_.load(); }

    /// Command names in arrival order
    std::vector<std::string> commands() const;

    /// When muted, requests are counted but never answered
    void setMuted(bool muted) { muted_.store(muted); }

    /// Delay before each reply is sent
    void setReplyDelayMs(int delayMs) { replyDelayMs_.store(delayMs); }

    /// Send every reply twice
    void setDuplicateReplies(bool enabled) { duplicateReplies_.store(enabled); }

private:
    uint16_t port_;
    std::string name_;
    std::string bindAddress_;

    net::UdpSocket socket_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    mutable std::mutex stateMutex_;
    MockBulbState state_;
    std::vector<std::string> commands_;

    std::atomic<std::size_t> requestCount_{0};
    std::atomic<bool> muted_{false};
    std::atomic<int> replyDelayMs_{0};
    std::atomic<bool> duplicateReplies_{false};

    void serveLoop();

    // Build the reply for one request
    Json::Value handleRequest(const Json::Value& request);
};

}  // namespace mock
}  // namespace lumen

/**
 * @file discovery_broadcaster.hpp
 * @brief Broadcast discovery of bulbs on the local network.
 *
 * A discovery round sends one request to every configured
 * (address, port) pair, then collects replies for a fixed window.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/core/export.hpp"
#include "lumen/core/protocol.hpp"
#include "lumen/net/udp_socket.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace lumen {
namespace core {

/**
 * @struct DiscoveryConfig
 * @brief Where discovery requests go and how long a round lasts.
 */
struct LUMEN_CORE_API DiscoveryConfig {
    std::vector<uint16_t> ports = {4000, 4001, 4002, 8000, 8080};
    std::vector<std::string> addresses = {"255.255.255.255", "192.168.1.255"};
    int default_timeout_ms = 5000;
};

/**
 * @class DiscoveryBroadcaster
 * @brief Finds bulbs by UDP broadcast.
 *
 * Rounds are serialized: a second caller waits for the running round to
 * finish before starting its own. discovered() may be read at any time.
 */
class LUMEN_CORE_API DiscoveryBroadcaster {
public:
    /**
     * @throws TransportError if the broadcast socket cannot be set up.
     */
    explicit DiscoveryBroadcaster(DiscoveryConfig config = {});
    ~DiscoveryBroadcaster();

    DiscoveryBroadcaster(const DiscoveryBroadcaster&) = delete;
    DiscoveryBroadcaster& operator=(const DiscoveryBroadcaster&) = delete;

    /**
     * @brief Run one discovery round.
     * @param timeoutMs Listening window; values <= 0 use the configured default.
     * @return Devices that replied within the window, one per address:port.
     */
    std::vector<DiscoveredDevice> discover(int timeoutMs = 0);

    /**
     * @brief Devices found so far in the current or most recent round.
     */
    std::vector<DiscoveredDevice> discovered() const;

    const DiscoveryConfig& config() const { return config_; }

    uint16_t getLocalPort() const { return socket_.getLocalPort(); }

private:
    DiscoveryConfig config_;
    net::UdpSocket socket_;

    // One round at a time on the shared socket
    std::mutex roundMutex_;

    mutable std::mutex devicesMutex_;
    std::map<std::string, DiscoveredDevice> devices_;

    void drainStale();
    void broadcastRequest();
    void recordReply(const char* data, std::size_t length, const net::SocketAddress& sender);
};

}  // namespace core
}  // namespace lumen

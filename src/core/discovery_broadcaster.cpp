/**
 * @file discovery_broadcaster.cpp
 * @brief DiscoveryBroadcaster implementation.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#include "lumen/core/discovery_broadcaster.hpp"
#include "lumen/core/errors.hpp"
#include "lumen/utils/logger.hpp"

#include <chrono>

namespace lumen {
namespace core {

namespace {

constexpr std::size_t kReceiveBufferSize = 65535;

}  // namespace

DiscoveryBroadcaster::DiscoveryBroadcaster(DiscoveryConfig config)
    : config_(std::move(config))
{
    if (!socket_.isValid()) {
        throw TransportError("Failed to create discovery socket: " +
                             socket_.getLastErrorString());
    }
    if (!socket_.setBroadcast(true)) {
        throw TransportError("Failed to enable broadcast: " + socket_.getLastErrorString());
    }
    if (!socket_.bind(0)) {
        throw TransportError("Failed to bind discovery socket: " +
                             socket_.getLastErrorString());
    }

    LOG_DEBUG("Discovery", "Broadcaster ready on local port {} ({} ports x {} addresses)",
              socket_.getLocalPort(), config_.ports.size(), config_.addresses.size());
}

DiscoveryBroadcaster::~DiscoveryBroadcaster() {
    socket_.close();
}

std::vector<DiscoveredDevice> DiscoveryBroadcaster::discover(int timeoutMs) {
    if (timeoutMs <= 0) {
        timeoutMs = config_.default_timeout_ms;
    }

    std::lock_guard<std::mutex> round(roundMutex_);

    // Replies that trickled in after the previous window belong to no round
    drainStale();
    {
        std::lock_guard<std::mutex> lock(devicesMutex_);
        devices_.clear();
    }

    LOG_INFO("Discovery", "Starting discovery round ({}ms)", timeoutMs);
    broadcastRequest();

    std::vector<char> buffer(kReceiveBufferSize);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        net::SocketAddress sender;
        int received = socket_.receiveFrom(buffer.data(), buffer.size(),
                                           static_cast<int>(remaining.count()), sender);
        if (received > 0) {
            recordReply(buffer.data(), static_cast<std::size_t>(received), sender);
        } else if (received < 0) {
            // e.g. WSAECONNRESET after an ICMP unreachable; the window stays open
            LOG_ERROR("Discovery", "Receive error: {}", socket_.getLastErrorString());
            if (!socket_.isValid()) {
                break;
            }
        }
    }

    auto result = discovered();
    LOG_INFO("Discovery", "Discovery round finished, {} device(s) found", result.size());
    return result;
}

std::vector<DiscoveredDevice> DiscoveryBroadcaster::discovered() const {
    std::lock_guard<std::mutex> lock(devicesMutex_);
    std::vector<DiscoveredDevice> result;
    result.reserve(devices_.size());
    for (const auto& [key, device] : devices_) {
        result.push_back(device);
    }
    return result;
}

void DiscoveryBroadcaster::drainStale() {
    std::vector<char> buffer(kReceiveBufferSize);
    net::SocketAddress sender;
    while (socket_.receiveFrom(buffer.data(), buffer.size(), 0, sender) > 0) {
        LOG_TRACE("Discovery", "Discarding stale datagram from {}", sender.toString());
    }
}

void DiscoveryBroadcaster::broadcastRequest() {
    const std::string request = protocol::encodeDiscoveryRequest();

    for (const auto& address : config_.addresses) {
        for (uint16_t port : config_.ports) {
            net::SocketAddress dest(address, port);
            int sent = socket_.sendTo(dest, request.data(), request.size());
            if (sent < 0) {
                LOG_ERROR("Discovery", "Failed to send discovery to {}: {}",
                          dest.toString(), socket_.getLastErrorString());
            } else {
                LOG_TRACE("Discovery", "Sent discovery to {}", dest.toString());
            }
        }
    }
}

void DiscoveryBroadcaster::recordReply(const char* data, std::size_t length,
                                       const net::SocketAddress& sender) {
    auto device = protocol::decodeDiscoveryResponse(data, length, sender);
    if (!device) {
        LOG_TRACE("Discovery", "Ignoring non-discovery datagram from {}", sender.toString());
        return;
    }

    LOG_DEBUG("Discovery", "Found bulb at {} ({})", device->key(),
              device->name ? *device->name : std::string("unnamed"));

    std::lock_guard<std::mutex> lock(devicesMutex_);
    devices_[device->key()] = *device;
}

}  // namespace core
}  // namespace lumen

/**
 * @file device_registry.hpp
 * @brief Owner of every open device connection.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/core/device_proxy.hpp"
#include "lumen/core/export.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace lumen {
namespace core {

/**
 * @struct RegistryConfig
 * @brief Settings applied to every proxy the registry creates.
 */
struct LUMEN_CORE_API RegistryConfig {
    int timeout_ms = 5000;
    std::size_t max_in_flight = 256;
    bool probe_on_connect = true;   ///< Ping a device once when it is first connected
};

/**
 * @class DeviceRegistry
 * @brief Maps "address:port" to a shared DeviceProxy.
 *
 * The registry is the owner of record. Handles it hands out stay usable
 * until the device is disconnected, after which they report ClosedError.
 *
 * Thread-safe.
 */
class LUMEN_CORE_API DeviceRegistry {
public:
    explicit DeviceRegistry(RegistryConfig config = {});
    ~DeviceRegistry();

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    /**
     * @brief Return the proxy for a device, connecting it if needed.
     *
     * A newly connected device is pinged when configured to;
     * an unanswered ping is logged and the proxy is kept.
     * @throws TransportError on socket or address resolution failure.
     */
    std::shared_ptr<DeviceProxy> getOrConnect(const std::string& address, uint16_t port);

    /**
     * @return The proxy, or nullptr if the device is not connected.
     */
    std::shared_ptr<DeviceProxy> find(const std::string& address, uint16_t port) const;

    std::vector<std::shared_ptr<DeviceProxy>> all() const;

    /**
     * @brief Query every device's status concurrently.
     * @return (device, status) pairs ordered by address:port; unreachable
     *         devices report connected=false.
     */
    std::vector<std::pair<DeviceConfig, DeviceStatus>> allStatuses() const;

    /**
     * @return False if the device was not connected.
     */
    bool disconnect(const std::string& address, uint16_t port);

    void disconnectAll();

    std::size_t size() const;

    const RegistryConfig& config() const { return config_; }

    static std::string makeKey(const std::string& address, uint16_t port) {
        return address + ":" + std::to_string(port);
    }

private:
    RegistryConfig config_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<DeviceProxy>> devices_;
};

}  // namespace core
}  // namespace lumen

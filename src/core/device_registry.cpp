/**
 * @file device_registry.cpp
 * @brief DeviceRegistry implementation.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#include "lumen/core/device_registry.hpp"
#include "lumen/utils/logger.hpp"

#include <future>

namespace lumen {
namespace core {

DeviceRegistry::DeviceRegistry(RegistryConfig config)
    : config_(std::move(config))
{
}

DeviceRegistry::~DeviceRegistry() {
    disconnectAll();
}

std::shared_ptr<DeviceProxy> DeviceRegistry::getOrConnect(const std::string& address,
                                                          uint16_t port) {
    const std::string key = makeKey(address, port);

    if (auto existing = find(address, port)) {
        return existing;
    }

    DeviceConfig deviceConfig;
    deviceConfig.address = address;
    deviceConfig.port = port;
    deviceConfig.timeout_ms = config_.timeout_ms;
    deviceConfig.max_in_flight = config_.max_in_flight;

    // Built outside the lock: resolving a host name may block on DNS.
    // Throws TransportError; nothing is registered in that case.
    auto proxy = std::make_shared<DeviceProxy>(deviceConfig);

    std::shared_ptr<DeviceProxy> winner;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        winner = devices_.emplace(key, proxy).first->second;
    }

    if (winner != proxy) {
        // Another caller connected the same device first
        proxy->close();
        return winner;
    }

    LOG_INFO("Registry", "Registered bulb {} ({} total)", key, size());

    // Ping outside the lock so other devices are not held up by a timeout
    if (config_.probe_on_connect && !proxy->ping()) {
        LOG_WARN("Registry", "Bulb {} did not answer the connection ping", key);
    }

    return proxy;
}

std::shared_ptr<DeviceProxy> DeviceRegistry::find(const std::string& address,
                                                  uint16_t port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(makeKey(address, port));
    return it == devices_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<DeviceProxy>> DeviceRegistry::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<DeviceProxy>> result;
    result.reserve(devices_.size());
    for (const auto& [key, proxy] : devices_) {
        result.push_back(proxy);
    }
    return result;
}

std::vector<std::pair<DeviceConfig, DeviceStatus>> DeviceRegistry::allStatuses() const {
    auto proxies = all();

    std::vector<std::future<DeviceStatus>> queries;
    queries.reserve(proxies.size());
    for (const auto& proxy : proxies) {
        queries.push_back(std::async(std::launch::async,
                                     [proxy]() { return proxy->getStatus(); }));
    }

    std::vector<std::pair<DeviceConfig, DeviceStatus>> result;
    result.reserve(proxies.size());
    for (std::size_t i = 0; i < proxies.size(); ++i) {
        result.emplace_back(proxies[i]->config(), queries[i].get());
    }
    return result;
}

bool DeviceRegistry::disconnect(const std::string& address, uint16_t port) {
    std::shared_ptr<DeviceProxy> proxy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(makeKey(address, port));
        if (it == devices_.end()) {
            return false;
        }
        proxy = std::move(it->second);
        devices_.erase(it);
    }

    proxy->close();
    LOG_INFO("Registry", "Removed bulb {}", makeKey(address, port));
    return true;
}

void DeviceRegistry::disconnectAll() {
    std::map<std::string, std::shared_ptr<DeviceProxy>> closing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closing.swap(devices_);
    }

    for (auto& [key, proxy] : closing) {
        proxy->close();
    }

    if (!closing.empty()) {
        LOG_INFO("Registry", "Disconnected {} bulb(s)", closing.size());
    }
}

std::size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

}  // namespace core
}  // namespace lumen

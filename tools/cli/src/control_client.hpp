/**
 * @file control_client.hpp
 * @brief gRPC client for the lumend BulbControl service
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace lumen::cli {

/**
 * @brief Bulb an RPC acts on. An empty address means the daemon's default bulb.
 */
struct DeviceTarget {
    std::string address;
    uint16_t port = 0;

    bool is_default() const { return address.empty(); }
};

/**
 * @brief Status of one bulb as reported by the daemon
 */
struct BulbStatus {
    std::string address;
    uint16_t port = 0;
    bool power = false;
    int brightness = 0;
    int r = 0;
    int g = 0;
    int b = 0;
    std::optional<int> temperature;
    bool connected = false;
};

/**
 * @brief Bulb found by a discovery round
 */
struct DiscoveredBulb {
    std::string address;
    uint16_t port = 0;
    std::string name;
    std::string model;
    std::string firmware_version;
    std::string mac_address;
};

/**
 * @brief A failed RPC. what() carries the server's message.
 */
class RpcError : public std::runtime_error {
public:
    RpcError(std::string code, const std::string& message)
        : std::runtime_error(message), code_(std::move(code)) {}

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

/**
 * @brief gRPC client for lumend
 *
 * Every call throws RpcError when the daemon answers with a non-OK status.
 */
class ControlClient {
public:
    ControlClient();
    ~ControlClient();

    /**
     * @brief Connect to the daemon
     * @param address Host:port address
     * @return true if the channel became ready within 5 seconds
     */
    bool connect(const std::string& address);

    std::string get_address() const;

    // Device operations; each returns the daemon's confirmation message
    std::string turn_on(const DeviceTarget& target);
    std::string turn_off(const DeviceTarget& target);
    std::string set_brightness(const DeviceTarget& target, int brightness);
    std::string set_color_hex(const DeviceTarget& target, const std::string& hex);
    std::string set_color_rgb(const DeviceTarget& target, int r, int g, int b);

    BulbStatus get_status(const DeviceTarget& target);
    bool ping(const DeviceTarget& target);

    // Device management
    std::vector<DiscoveredBulb> discover(int timeout_ms);
    std::string connect_device(const std::string& address, uint16_t port);
    std::string disconnect_device(const std::string& address, uint16_t port);
    std::vector<BulbStatus> get_all_statuses();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lumen::cli

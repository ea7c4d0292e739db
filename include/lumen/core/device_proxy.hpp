/**
 * @file device_proxy.hpp
 * @brief Caller-facing handle for one remote bulb.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/core/command_correlator.hpp"
#include "lumen/core/export.hpp"
#include "lumen/core/protocol.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace lumen {
namespace core {

/**
 * @struct DeviceConfig
 * @brief Identity and limits of a device connection.
 */
struct LUMEN_CORE_API DeviceConfig {
    std::string address = "192.168.1.45";
    uint16_t port = 4000;
    int timeout_ms = 5000;
    std::size_t max_in_flight = 256;    ///< 0 = unbounded

    /// "address:port"
    std::string key() const { return address + ":" + std::to_string(port); }
};

/**
 * @brief Called with the merged status after every status update.
 * Runs on the correlator's listener thread; keep it short.
 */
using StatusListener = std::function<void(const DeviceStatus& status)>;

/**
 * @class DeviceProxy
 * @brief Validated bulb operations plus a cached status.
 *
 * Every mutating operation validates its arguments before touching the
 * network and propagates correlator failures unchanged. getStatus() and
 * ping() never throw.
 *
 * Thread-safe: operations may be issued concurrently from any thread.
 * Once closed a proxy cannot be reopened.
 */
class LUMEN_CORE_API DeviceProxy {
public:
    /**
     * @brief Open a socket for the device and start listening.
     * @throws TransportError if the socket cannot be set up.
     */
    explicit DeviceProxy(const DeviceConfig& config);

    ~DeviceProxy();

    DeviceProxy(const DeviceProxy&) = delete;
    DeviceProxy& operator=(const DeviceProxy&) = delete;

    void setPower(bool on);
    void turnOn() { setPower(true); }
    void turnOff() { setPower(false); }

    /**
     * @throws ValidationError unless 0 <= brightness <= 100.
     */
    void setBrightness(int brightness);

    /**
     * @throws ValidationError unless every channel is within 0-255.
     */
    void setColor(int r, int g, int b);

    /**
     * @brief Set the colour from "#RRGGBB" or "RRGGBB" (any case).
     * @throws FormatError if the string is not six hex digits.
     */
    void setColorFromHex(const std::string& hex);

    /**
     * @brief Query the device and return the merged status.
     *
     * On any failure the cached status is returned with connected=false,
     * and the cache keeps that flag until the next successful exchange.
     */
    DeviceStatus getStatus();

    /**
     * @return True on any successful round trip.
     */
    bool ping();

    /**
     * @brief Cached status, no I/O.
     */
    DeviceStatus lastStatus() const;

    void setStatusListener(StatusListener listener);

    const DeviceConfig& config() const { return config_; }

    /**
     * @brief Fail in-flight commands with ClosedError and release the socket.
     */
    void close();

    bool isClosed() const;

    /**
     * @brief Commands currently awaiting a reply.
     */
    std::size_t inFlight() const;

    /**
     * @brief Parse a hex colour without sending anything.
     * @throws FormatError if the string is not six hex digits.
     */
    static RgbColor parseHexColor(const std::string& hex);

private:
    DeviceConfig config_;

    mutable std::mutex statusMutex_;
    DeviceStatus status_;
    StatusListener listener_;

    std::unique_ptr<CommandCorrelator> correlator_;

    // Send through the correlator; a successful reply marks the device connected
    Response execute(Command command);

    void applyStatus(const Json::Value& data);
    void markDisconnected();
};

}  // namespace core
}  // namespace lumen

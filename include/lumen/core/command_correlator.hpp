/**
 * @file command_correlator.hpp
 * @brief Request/response correlation over a connectionless UDP socket.
 *
 * The CommandCorrelator handles:
 * - Tagging each outgoing command with a fresh correlation token
 * - Tracking in-flight commands until matched, timed out or closed
 * - A background listener that matches replies by token
 * - Handing status data from any reply to its owner
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/core/export.hpp"
#include "lumen/core/protocol.hpp"
#include "lumen/net/udp_socket.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace lumen {
namespace core {

/**
 * @struct CorrelatorConfig
 * @brief Destination and limits for one correlator.
 */
struct LUMEN_CORE_API CorrelatorConfig {
    std::string address;            ///< Device IPv4 address or host name
    uint16_t port;                  ///< Device UDP port
    int timeout_ms;                 ///< Per-command deadline
    std::size_t max_in_flight;      ///< Outstanding command limit (0 = unbounded)
    int poll_interval_ms;           ///< Listener wake-up interval, bounds close() latency

    CorrelatorConfig()
        : port(0)
        , timeout_ms(5000)
        , max_in_flight(256)
        , poll_interval_ms(100)
    {}
};

/**
 * @brief Receives the "data" object of every reply, matched or not.
 * Invoked on the listener thread.
 */
using StatusHook = std::function<void(const Json::Value& data)>;

/**
 * @class CommandCorrelator
 * @brief Matches fire-and-forget UDP datagrams to waiting callers.
 *
 * send() may be called from any number of threads at once; each call
 * blocks until its reply arrives, its deadline passes or the correlator
 * is closed. Replies may arrive in any order.
 *
 * Usage:
 * @code
 * CorrelatorConfig config;
 * config.address = "192.168.1.45";
 * config.port = 4000;
 *
 * CommandCorrelator correlator(config);
 * correlator.setStatusHook([](const Json::Value& data) { ... });
 * correlator.start();
 *
 * Response reply = correlator.send(Command("ping"));
 * correlator.close();
 * @endcode
 */
class LUMEN_CORE_API CommandCorrelator {
public:
    /**
     * @brief Create the socket and resolve the destination.
     * @throws TransportError if the socket cannot be created or bound,
     *         or the destination cannot be resolved.
     */
    explicit CommandCorrelator(const CorrelatorConfig& config);

    /**
     * @brief Destructor - closes the correlator if still open.
     */
    ~CommandCorrelator();

    CommandCorrelator(const CommandCorrelator&) = delete;
    CommandCorrelator& operator=(const CommandCorrelator&) = delete;

    /**
     * @brief Install the status hook. Call before start().
     */
    void setStatusHook(StatusHook hook);

    /**
     * @brief Start the background listener.
     * @return False if already started or closed.
     */
    bool start();

    /**
     * @brief Send a command and wait for its reply.
     * @param command Command to send; any id it carries is replaced.
     * @return The device's successful reply.
     * @throws ProtocolError if the device answered success=false.
     * @throws TimeoutError if no reply arrived before the deadline.
     * @throws TransportError if the datagram could not be sent.
     * @throws ClosedError if the correlator is or becomes closed.
     * @throws BackpressureError if max_in_flight commands are outstanding.
     */
    Response send(Command command);

    /**
     * @brief Fail every in-flight command with ClosedError, stop the
     * listener and release the socket. Idempotent.
     *
     * All waiting senders are released before this returns.
     */
    void close();

    bool isClosed() const { return closed_.load(); }

    /**
     * @brief Number of commands awaiting a reply.
     */
    std::size_t inFlight() const;

    /**
     * @brief Local UDP port replies are received on.
     */
    uint16_t getLocalPort() const;

    const CorrelatorConfig& config() const { return config_; }

    const net::SocketAddress& destination() const { return destination_; }

private:
    struct PendingRequest {
        std::promise<Response> promise;
        std::chrono::steady_clock::time_point deadline;
    };

    CorrelatorConfig config_;
    net::SocketAddress destination_;
    net::UdpSocket socket_;
    StatusHook statusHook_;

    std::atomic<bool> running_{false};
    std::atomic<bool> closed_{false};
    std::thread listenerThread_;

    // token -> waiting caller
    mutable std::mutex pendingMutex_;
    std::unordered_map<std::string, std::shared_ptr<PendingRequest>> pending_;

    // Shared by senders, exclusive while close() releases the socket
    mutable std::shared_mutex socketMutex_;

    // Serializes close() callers
    std::mutex closeMutex_;

    void listenerLoop();

    // Decode one inbound datagram and resolve its pending request, if any
    void handleDatagram(const char* data, std::size_t length,
                        const net::SocketAddress& sender);

    // Remove and return the pending entry for a token, or nullptr
    std::shared_ptr<PendingRequest> takePending(const std::string& id);

    // Pick a token not currently in flight. Caller holds pendingMutex_.
    std::string nextToken() const;
};

}  // namespace core
}  // namespace lumen

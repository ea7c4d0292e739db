/**
 * @file udp_socket.hpp
 * @brief Cross-platform UDP socket with broadcast support.
 *
 * RAII wrapper around a connectionless IPv4 datagram socket: bind,
 * broadcast enable, send to arbitrary endpoints and timeout-based
 * receive.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/net/export.hpp"
#include "lumen/net/platform.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace lumen {
namespace net {

/**
 * @struct SocketAddress
 * @brief IPv4 address and port pair.
 */
struct LUMEN_NET_API SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : ip("0.0.0.0"), port(0) {}
    SocketAddress(const std::string& ip_, uint16_t port_) : ip(ip_), port(port_) {}

    std::string toString() const { return ip + ":" + std::to_string(port); }

    bool operator==(const SocketAddress& other) const {
        return ip == other.ip && port == other.port;
    }
    bool operator!=(const SocketAddress& other) const { return !(*this == other); }

    /**
     * @brief Resolve a host name or dotted quad to an IPv4 address.
     * @return The resolved address, or std::nullopt if resolution fails.
     */
    static std::optional<SocketAddress> resolve(const std::string& host, uint16_t port);
};

/**
 * @class UdpSocket
 * @brief RAII UDP socket wrapper.
 *
 * Sending and receiving may happen concurrently from different threads;
 * close() must not race with an in-progress receiveFrom().
 *
 * Usage:
 * @code
 * UdpSocket sock;
 * sock.bind(0);                       // ephemeral port
 * sock.setBroadcast(true);
 * sock.sendTo(SocketAddress("255.255.255.255", 4000), data.data(), data.size());
 *
 * std::vector<uint8_t> buffer(65535);
 * SocketAddress sender;
 * int received = sock.receiveFrom(buffer.data(), buffer.size(), 100, sender);
 * @endcode
 */
class LUMEN_NET_API UdpSocket {
public:
    /**
     * @brief Create an unbound UDP socket.
     */
    UdpSocket();

    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }

    SocketHandle handle() const { return socket_; }

    /**
     * @brief Bind the socket to a local port.
     * @param port The port to bind to (0 for auto-assign).
     * @param address The local address to bind to (default: any).
     * @return True on success.
     */
    bool bind(uint16_t port, const std::string& address = "0.0.0.0");

    /**
     * @brief Get the local port the socket is bound to (0 if unbound).
     */
    uint16_t getLocalPort() const;

    /**
     * @brief Allow sending to broadcast addresses (SO_BROADCAST).
     */
    bool setBroadcast(bool enable);

    /**
     * @brief Send one datagram.
     * @param dest Destination address (dotted quad).
     * @param data Pointer to data buffer.
     * @param length Number of bytes to send.
     * @return Number of bytes sent, or -1 on error.
     */
    int sendTo(const SocketAddress& dest, const void* data, size_t length);

    /**
     * @brief Receive one datagram with timeout.
     * @param buffer Buffer to receive into.
     * @param bufferSize Size of the buffer.
     * @param timeoutMs Timeout in milliseconds (0 = poll, -1 = infinite).
     * @param sender Output: address of the sender.
     * @return Number of bytes received, 0 on timeout, -1 on error.
     */
    int receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                    SocketAddress& sender);

    void close();

    /**
     * @brief Last socket error code recorded by a failed call.
     */
    int getLastError() const { return lastError_.load(std::memory_order_relaxed); }

    /**
     * @brief Human-readable form of getLastError().
     */
    std::string getLastErrorString() const { return socketErrorString(getLastError()); }

private:
    SocketHandle socket_;
    std::atomic<int> lastError_;

    void setLastError();
};

}  // namespace net
}  // namespace lumen

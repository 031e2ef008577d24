/**
 * @file udp_socket.hpp
 * @brief Cross-platform UDP socket with broadcast support.
 *
 * Provides a RAII wrapper around UDP sockets with broadcast enablement
 * and select()-based timed receive, which is what the SNMP status
 * queries are built on.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#pragma once

#include "qlnet/net/export.hpp"
#include "qlnet/net/platform.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace qlnet {
namespace net {

/**
 * @struct SocketAddress
 * @brief IPv4 address and port pair.
 */
struct QLNET_NET_API SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : ip("0.0.0.0"), port(0) {}
    SocketAddress(const std::string& ip_, uint16_t port_) : ip(ip_), port(port_) {}

    std::string toString() const { return ip + ":" + std::to_string(port); }

    bool operator==(const SocketAddress& other) const {
        return ip == other.ip && port == other.port;
    }
    bool operator!=(const SocketAddress& other) const { return !(*this == other); }
};

/**
 * @class UdpSocket
 * @brief RAII UDP socket wrapper.
 *
 * Usage:
 * @code
 * UdpSocket sock;
 * sock.setBroadcast(true);
 * sock.sendTo(SocketAddress("255.255.255.255", 161), req.data(), req.size());
 *
 * std::vector<uint8_t> buffer(65535);
 * SocketAddress sender;
 * int received = sock.receiveFrom(buffer.data(), buffer.size(), 100, sender);
 * @endcode
 */
class QLNET_NET_API UdpSocket {
public:
    /**
     * @brief Create an unbound UDP socket.
     *
     * Check isValid() afterwards; creation failure is logged and the
     * error code kept in getLastError().
     */
    UdpSocket();

    /**
     * @brief Destructor - closes the socket.
     */
    ~UdpSocket();

    // Non-copyable, but movable
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
     * @brief Enable broadcast sending (SO_BROADCAST).
     */
    bool setBroadcast(bool enable);

    /**
     * @brief Send a datagram.
     * @param dest Destination address (dotted IPv4).
     * @return Number of bytes sent, or -1 on error.
     */
    int sendTo(const SocketAddress& dest, const void* data, size_t length);

    /**
     * @brief Receive a datagram with timeout.
     * @param timeoutMs Timeout in milliseconds (0 = poll readiness and return
     *                  immediately, -1 = block indefinitely).
     * @param sender Output: address of the sender.
     * @return Number of bytes received, 0 on timeout, -1 on error.
     */
    int receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                    SocketAddress& sender);

    /**
     * @brief Close the socket. Safe to call repeatedly.
     */
    void close();

    int getLastError() const { return lastError_; }

private:
    SocketHandle socket_;
    int lastError_;

    void setLastError();
};

}  // namespace net
}  // namespace qlnet

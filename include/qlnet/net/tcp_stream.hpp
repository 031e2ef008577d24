/**
 * @file tcp_stream.hpp
 * @brief RAII TCP client stream with switchable blocking modes.
 *
 * The stream can be put into blocking mode with a send/receive timeout,
 * or into non-blocking mode, and flipped between the two at any time.
 * This is what lets a printer connection use a generous timeout while
 * writing and drop back to a short (or zero) timeout afterwards.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#pragma once

#include "qlnet/net/export.hpp"
#include "qlnet/net/platform.hpp"
#include "qlnet/net/udp_socket.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace qlnet {
namespace net {

/**
 * @class TcpStream
 * @brief Connected TCP socket, non-copyable but movable.
 *
 * Usage:
 * @code
 * TcpStream stream;
 * if (!stream.connect(SocketAddress("192.168.1.5", 9100))) {
 *     // stream.getLastError() holds the cause
 * }
 * stream.setNoDelay(true);
 * stream.setTimeout(std::chrono::seconds(10));
 * stream.sendAll(data.data(), data.size());
 * stream.shutdown();
 * stream.close();
 * @endcode
 */
class QLNET_NET_API TcpStream {
public:
    TcpStream();
    ~TcpStream();

    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;
    TcpStream(TcpStream&& other) noexcept;
    TcpStream& operator=(TcpStream&& other) noexcept;

    /**
     * @brief Open a socket and connect it to a remote IPv4 endpoint.
     *
     * Blocks until the connection is established or refused.
     * @return True on success; on failure the socket is closed.
     */
    bool connect(const SocketAddress& remote);

    bool isOpen() const { return socket_ != INVALID_SOCKET_HANDLE; }

    SocketHandle handle() const { return socket_; }

    /**
     * @brief Disable (true) or enable (false) Nagle's algorithm.
     */
    bool setNoDelay(bool enable);

    /**
     * @brief Switch to blocking mode with the given send/receive timeout.
     */
    bool setTimeout(std::chrono::milliseconds timeout);

    /**
     * @brief Switch to non-blocking mode.
     */
    bool setNonBlocking();

    /**
     * @brief Send every byte, looping over partial sends.
     *
     * In non-blocking mode a full send buffer fails immediately. With a
     * @p deadline, the send timeout is narrowed before each partial send
     * so the whole call ends by the deadline.
     * @return True when all bytes were handed to the kernel. On failure
     *         getLastError() holds the cause and lastSendTimedOut()
     *         tells a timeout apart from a hard error.
     */
    bool sendAll(const void* data, size_t length,
                 std::chrono::steady_clock::time_point deadline =
                     std::chrono::steady_clock::time_point::max());

    bool lastSendTimedOut() const { return lastSendTimedOut_; }

    /**
     * @brief Shut down both directions of the connection.
     */
    bool shutdown();

    /**
     * @brief Close the socket. Safe to call repeatedly.
     */
    void close();

    int getLastError() const { return lastError_; }

private:
    SocketHandle socket_;
    int lastError_;
    bool lastSendTimedOut_;

    void setLastError();
};

}  // namespace net
}  // namespace qlnet

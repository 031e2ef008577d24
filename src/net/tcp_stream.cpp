/**
 * @file tcp_stream.cpp
 * @brief TcpStream implementation.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#include "qlnet/net/tcp_stream.hpp"
#include "qlnet/utils/logger.hpp"

#include <cerrno>

namespace qlnet {
namespace net {

TcpStream::TcpStream()
    : socket_(INVALID_SOCKET_HANDLE)
    , lastError_(0)
    , lastSendTimedOut_(false)
{}

TcpStream::~TcpStream() {
    close();
}

TcpStream::TcpStream(TcpStream&& other) noexcept
    : socket_(other.socket_)
    , lastError_(other.lastError_)
    , lastSendTimedOut_(other.lastSendTimedOut_)
{
    other.socket_ = INVALID_SOCKET_HANDLE;
}

TcpStream& TcpStream::operator=(TcpStream&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        lastError_ = other.lastError_;
        lastSendTimedOut_ = other.lastSendTimedOut_;
        other.socket_ = INVALID_SOCKET_HANDLE;
    }
    return *this;
}

bool TcpStream::connect(const SocketAddress& remote) {
    close();

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(remote.port);
    if (inet_pton(AF_INET, remote.ip.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("TcpStream", "Invalid remote address: {}", remote.ip);
        lastError_ = EINVAL;
        return false;
    }

    socket_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socket_ == INVALID_SOCKET_HANDLE) {
        setLastError();
        LOG_ERROR("TcpStream", "Failed to create socket: {}", socketErrorString(lastError_));
        return false;
    }

    if (::connect(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        setLastError();
        LOG_DEBUG("TcpStream", "Connect to {} failed: {}",
                  remote.toString(), socketErrorString(lastError_));
        closeSocket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
        return false;
    }

    LOG_DEBUG("TcpStream", "Connected to {}", remote.toString());
    return true;
}

bool TcpStream::setNoDelay(bool enable) {
    if (!isOpen()) {
        return false;
    }

    int optval = enable ? 1 : 0;
    if (setsockopt(socket_, IPPROTO_TCP, TCP_NODELAY,
                   reinterpret_cast<const char*>(&optval), sizeof(optval)) != 0) {
        setLastError();
        return false;
    }
    return true;
}

bool TcpStream::setTimeout(std::chrono::milliseconds timeout) {
    if (!isOpen()) {
        return false;
    }

    if (!net::setNonBlocking(socket_, false) || !setSocketTimeouts(socket_, timeout)) {
        setLastError();
        return false;
    }
    return true;
}

bool TcpStream::setNonBlocking() {
    if (!isOpen()) {
        return false;
    }

    if (!net::setNonBlocking(socket_, true)) {
        setLastError();
        return false;
    }
    return true;
}

bool TcpStream::sendAll(const void* data, size_t length,
                        std::chrono::steady_clock::time_point deadline) {
    lastSendTimedOut_ = false;
    if (!isOpen()) {
        lastError_ = EBADF;
        return false;
    }

    const char* cursor = static_cast<const char*>(data);
    size_t remaining = length;

    bool bounded = deadline != std::chrono::steady_clock::time_point::max();

    while (remaining > 0) {
        if (bounded) {
            auto left = std::chrono::ceil<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                lastError_ = TIMED_OUT_ERROR;
                lastSendTimedOut_ = true;
                return false;
            }
            if (!setSocketTimeouts(socket_, left)) {
                setLastError();
                return false;
            }
        }

#ifdef _WIN32
        int sent = ::send(socket_, cursor, static_cast<int>(remaining), SEND_FLAGS);
#else
        ssize_t sent = ::send(socket_, cursor, remaining, SEND_FLAGS);
#endif
        if (sent < 0) {
            setLastError();
#ifndef _WIN32
            if (lastError_ == EINTR) {
                continue;
            }
#endif
            lastSendTimedOut_ = isWouldBlock(lastError_);
            return false;
        }
        cursor += sent;
        remaining -= static_cast<size_t>(sent);
    }

    return true;
}

bool TcpStream::shutdown() {
    if (!isOpen()) {
        return false;
    }

    if (::shutdown(socket_, SHUTDOWN_BOTH) != 0) {
        setLastError();
        return false;
    }
    return true;
}

void TcpStream::close() {
    if (isOpen()) {
        closeSocket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
}

void TcpStream::setLastError() {
    lastError_ = getLastSocketError();
}

}  // namespace net
}  // namespace qlnet

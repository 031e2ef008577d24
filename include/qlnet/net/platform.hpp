/**
 * @file platform.hpp
 * @brief Cross-platform socket type definitions and helpers.
 *
 * Abstracts Windows Winsock2 and POSIX socket APIs into a common interface.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#pragma once

#include <chrono>
#include <cstring>
#include <string>

#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <WinSock2.h>
    #include <WS2tcpip.h>

    #pragma comment(lib, "Ws2_32.lib")

    namespace qlnet {
    namespace net {
        using SocketHandle = SOCKET;
        constexpr SocketHandle INVALID_SOCKET_HANDLE = INVALID_SOCKET;
        constexpr int SHUTDOWN_BOTH = SD_BOTH;
        constexpr int SEND_FLAGS = 0;
        constexpr int TIMED_OUT_ERROR = WSAETIMEDOUT;

        inline int getLastSocketError() { return WSAGetLastError(); }
        inline void closeSocket(SocketHandle s) { ::closesocket(s); }

        inline bool isWouldBlock(int error) {
            return error == WSAEWOULDBLOCK || error == WSAETIMEDOUT;
        }

        inline bool isUnreachable(int error) {
            return error == WSAENETUNREACH || error == WSAEHOSTUNREACH;
        }

        inline bool setNonBlocking(SocketHandle s, bool enable) {
            u_long mode = enable ? 1 : 0;
            return ::ioctlsocket(s, FIONBIO, &mode) == 0;
        }

        inline bool setSocketTimeouts(SocketHandle s, std::chrono::milliseconds timeout) {
            DWORD ms = static_cast<DWORD>(timeout.count());
            return setsockopt(s, SOL_SOCKET, SO_RCVTIMEO,
                              reinterpret_cast<const char*>(&ms), sizeof(ms)) == 0 &&
                   setsockopt(s, SOL_SOCKET, SO_SNDTIMEO,
                              reinterpret_cast<const char*>(&ms), sizeof(ms)) == 0;
        }

        inline std::string socketErrorString(int error) {
            return "winsock error " + std::to_string(error);
        }

        // Initialize Winsock (call once at startup)
        inline bool initializeSockets() {
            WSADATA wsaData;
            return WSAStartup(MAKEWORD(2, 2), &wsaData) == 0;
        }

        inline void cleanupSockets() {
            WSACleanup();
        }
    }  // namespace net
    }  // namespace qlnet

#else
    // POSIX (Linux, macOS, etc.)
    #include <arpa/inet.h>
    #include <errno.h>
    #include <fcntl.h>
    #include <netdb.h>
    #include <netinet/in.h>
    #include <netinet/tcp.h>
    #include <sys/select.h>
    #include <sys/socket.h>
    #include <sys/time.h>
    #include <sys/types.h>
    #include <unistd.h>

    namespace qlnet {
    namespace net {
        using SocketHandle = int;
        constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;
        constexpr int SHUTDOWN_BOTH = SHUT_RDWR;
    #ifdef MSG_NOSIGNAL
        constexpr int SEND_FLAGS = MSG_NOSIGNAL;
    #else
        constexpr int SEND_FLAGS = 0;
    #endif
        constexpr int TIMED_OUT_ERROR = ETIMEDOUT;

        inline int getLastSocketError() { return errno; }
        inline void closeSocket(SocketHandle s) { ::close(s); }

        inline bool isWouldBlock(int error) {
            return error == EAGAIN || error == EWOULDBLOCK || error == ETIMEDOUT;
        }

        inline bool isUnreachable(int error) {
            return error == ENETUNREACH || error == EHOSTUNREACH;
        }

        inline bool setNonBlocking(SocketHandle s, bool enable) {
            int flags = ::fcntl(s, F_GETFL, 0);
            if (flags < 0) {
                return false;
            }
            flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
            return ::fcntl(s, F_SETFL, flags) == 0;
        }

        inline bool setSocketTimeouts(SocketHandle s, std::chrono::milliseconds timeout) {
            struct timeval tv;
            tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
            tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
            return setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
                   setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
        }

        inline std::string socketErrorString(int error) {
            return std::strerror(error);
        }

        // No initialization needed on POSIX
        inline bool initializeSockets() { return true; }
        inline void cleanupSockets() {}
    }  // namespace net
    }  // namespace qlnet

#endif

namespace qlnet {
namespace net {

/**
 * @brief RAII helper for socket initialization.
 *
 * Create one instance at program startup to ensure
 * proper Winsock initialization on Windows.
 */
class SocketInitializer {
public:
    SocketInitializer() : initialized_(initializeSockets()) {}
    ~SocketInitializer() { if (initialized_) cleanupSockets(); }

    bool isInitialized() const { return initialized_; }

    SocketInitializer(const SocketInitializer&) = delete;
    SocketInitializer& operator=(const SocketInitializer&) = delete;

private:
    bool initialized_;
};

}  // namespace net
}  // namespace qlnet

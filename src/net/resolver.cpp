/**
 * @file resolver.cpp
 * @brief getaddrinfo()-based IPv4 resolution.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#include "qlnet/net/resolver.hpp"
#include "qlnet/net/platform.hpp"
#include "qlnet/utils/logger.hpp"

namespace qlnet {
namespace net {

std::optional<std::string> resolveIPv4(const std::string& host, std::string* error) {
    if (host.empty()) {
        if (error) {
            *error = "empty host name";
        }
        return std::nullopt;
    }

    struct in_addr literal{};
    if (inet_pton(AF_INET, host.c_str(), &literal) == 1) {
        return host;
    }

    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* results = nullptr;
    int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &results);
    if (rc != 0 || results == nullptr) {
        std::string message = rc != 0 ? gai_strerror(rc) : "no IPv4 address";
        LOG_DEBUG("Resolver", "Failed to resolve '{}': {}", host, message);
        if (error) {
            *error = message;
        }
        if (results) {
            ::freeaddrinfo(results);
        }
        return std::nullopt;
    }

    auto* addr = reinterpret_cast<struct sockaddr_in*>(results->ai_addr);
    char ipStr[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &addr->sin_addr, ipStr, sizeof(ipStr));
    ::freeaddrinfo(results);

    LOG_TRACE("Resolver", "Resolved '{}' to {}", host, ipStr);
    return std::string(ipStr);
}

}  // namespace net
}  // namespace qlnet

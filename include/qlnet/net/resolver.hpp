/**
 * @file resolver.hpp
 * @brief Host name to IPv4 address resolution.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#pragma once

#include "qlnet/net/export.hpp"

#include <optional>
#include <string>

namespace qlnet {
namespace net {

/**
 * @brief Resolve a host name or dotted address to a dotted IPv4 string.
 *
 * Literal addresses are returned unchanged without a resolver round trip.
 *
 * @param host Host name or IPv4 literal.
 * @param error Optional output for the resolver's failure message.
 * @return The first IPv4 address, or std::nullopt on failure.
 */
QLNET_NET_API std::optional<std::string> resolveIPv4(const std::string& host,
                                                     std::string* error = nullptr);

}  // namespace net
}  // namespace qlnet

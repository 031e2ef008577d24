/**
 * @file connection_strategy.hpp
 * @brief Read strategies for a device connection.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#pragma once

#include "qlnet/core/export.hpp"

#include <optional>
#include <string>

namespace qlnet {
namespace core {

/**
 * @enum ConnectionStrategy
 * @brief How DeviceConnection::read() waits for printer status.
 */
enum class ConnectionStrategy {
    SINGLE_TIMEOUT,     ///< One status query bounded by the read timeout
    TRY_TWICE,          ///< Up to two status queries in sequence
    NON_BLOCKING_POLL   ///< Never block; poll an outstanding query
};

/**
 * @brief Short name used on the command line ("socket_timeout", "try_twice", "select").
 */
QLNET_CORE_API const char* connectionStrategyToString(ConnectionStrategy strategy);

/**
 * @brief Parse a strategy name.
 *
 * Accepts the short names and the enumerator spellings, ignoring case.
 */
QLNET_CORE_API std::optional<ConnectionStrategy> parseConnectionStrategy(const std::string& name);

/**
 * @brief Number of blocking status queries one read() may issue.
 */
QLNET_CORE_API int attemptsFor(ConnectionStrategy strategy);

}  // namespace core
}  // namespace qlnet

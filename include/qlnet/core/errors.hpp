/**
 * @file errors.hpp
 * @brief Exception types raised by the qlnet core.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#pragma once

#include <stdexcept>
#include <string>

namespace qlnet {
namespace core {

/**
 * @class Error
 * @brief Base of every exception thrown by qlnet_core.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/// Connecting to a device failed (refused, unreachable, name lookup).
class ConnectionError : public Error {
public:
    explicit ConnectionError(const std::string& message) : Error(message) {}
};

/// A read or write on an established connection failed.
class IOError : public Error {
public:
    explicit IOError(const std::string& message) : Error(message) {}
};

/// The identifier names a transport this backend does not provide.
class UnsupportedOperation : public Error {
public:
    explicit UnsupportedOperation(const std::string& message) : Error(message) {}
};

}  // namespace core
}  // namespace qlnet

/**
 * @file device_identifier.hpp
 * @brief Parsed "tcp://host[:port]" printer identifier.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#pragma once

#include "qlnet/core/export.hpp"

#include <cstdint>
#include <string>

namespace qlnet {
namespace core {

/// Raw printing port used when an identifier has no port.
constexpr uint16_t DEFAULT_PRINTER_PORT = 9100;

/**
 * @class DeviceIdentifier
 * @brief Immutable host/port pair of a network printer.
 */
class QLNET_CORE_API DeviceIdentifier {
public:
    DeviceIdentifier(std::string host, uint16_t port);

    /**
     * @brief Parse "tcp://host[:port]" (the scheme prefix is optional).
     *
     * Host and port are split on the last ':'.
     * @throws UnsupportedOperation for a scheme other than tcp.
     * @throws std::invalid_argument for an empty host or a bad port.
     */
    static DeviceIdentifier parse(const std::string& text);

    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }

    /// "tcp://host:port"
    std::string toString() const;

    bool operator==(const DeviceIdentifier& other) const {
        return host_ == other.host_ && port_ == other.port_;
    }

private:
    std::string host_;
    uint16_t port_;
};

}  // namespace core
}  // namespace qlnet

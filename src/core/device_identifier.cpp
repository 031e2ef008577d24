/**
 * @file device_identifier.cpp
 * @brief DeviceIdentifier parsing.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#include "qlnet/core/device_identifier.hpp"
#include "qlnet/core/errors.hpp"

#include <stdexcept>

namespace qlnet {
namespace core {

namespace {

const std::string SCHEME_SEPARATOR = "://";
const std::string TCP_SCHEME = "tcp";

uint16_t parsePort(const std::string& text, const std::string& identifier) {
    if (text.empty() || text.size() > 5 ||
        text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("invalid port in device identifier '" + identifier + "'");
    }
    unsigned long port = std::stoul(text);
    if (port == 0 || port > 65535) {
        throw std::invalid_argument("port out of range in device identifier '" + identifier + "'");
    }
    return static_cast<uint16_t>(port);
}

}  // namespace

DeviceIdentifier::DeviceIdentifier(std::string host, uint16_t port)
    : host_(std::move(host))
    , port_(port)
{
    if (host_.empty()) {
        throw std::invalid_argument("device identifier needs a host");
    }
}

DeviceIdentifier DeviceIdentifier::parse(const std::string& text) {
    std::string rest = text;

    auto schemeEnd = text.find(SCHEME_SEPARATOR);
    if (schemeEnd != std::string::npos) {
        std::string scheme = text.substr(0, schemeEnd);
        if (scheme != TCP_SCHEME) {
            throw UnsupportedOperation("unsupported transport '" + scheme +
                                       "' in device identifier '" + text + "'");
        }
        rest = text.substr(schemeEnd + SCHEME_SEPARATOR.size());
    }

    auto colon = rest.rfind(':');
    if (colon == std::string::npos) {
        if (rest.empty()) {
            throw std::invalid_argument("device identifier needs a host: '" + text + "'");
        }
        return DeviceIdentifier(rest, DEFAULT_PRINTER_PORT);
    }

    std::string host = rest.substr(0, colon);
    if (host.empty()) {
        throw std::invalid_argument("device identifier needs a host: '" + text + "'");
    }
    std::string port = rest.substr(colon + 1);
    if (port.empty()) {
        return DeviceIdentifier(host, DEFAULT_PRINTER_PORT);
    }
    return DeviceIdentifier(host, parsePort(port, text));
}

std::string DeviceIdentifier::toString() const {
    return TCP_SCHEME + SCHEME_SEPARATOR + host_ + ":" + std::to_string(port_);
}

}  // namespace core
}  // namespace qlnet

/**
 * @file backend.hpp
 * @brief Byte-stream capability a printer driver talks to.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#pragma once

#include "qlnet/core/export.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace qlnet {
namespace core {

/**
 * @class Backend
 * @brief Open connection to one printer.
 *
 * Implementations are opened by their factory (see openDevice()) and
 * stay usable until dispose().
 */
class QLNET_CORE_API Backend {
public:
    virtual ~Backend() = default;

    /**
     * @brief Send raw command bytes to the printer.
     * @throws IOError on failure or after dispose().
     */
    virtual void write(const std::vector<uint8_t>& data) = 0;

    /**
     * @brief Read printer status.
     * @return Up to @p maxLength bytes; empty when no status is available yet.
     * @throws IOError on failure or after dispose().
     */
    virtual std::vector<uint8_t> read(size_t maxLength = 32) = 0;

    /**
     * @brief Release the connection. Further calls are no-ops.
     */
    virtual void dispose() = 0;
};

}  // namespace core
}  // namespace qlnet

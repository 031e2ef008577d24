/**
 * @file device_connection.hpp
 * @brief TCP connection to a network printer with status polling.
 *
 * Command bytes go out over the printer's raw TCP port. Status is not
 * read back from that stream: each read() issues a fresh unicast status
 * query, so a write in progress never has to share the socket with a
 * status poll.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#pragma once

#include "qlnet/core/backend.hpp"
#include "qlnet/core/connection_strategy.hpp"
#include "qlnet/core/device_identifier.hpp"
#include "qlnet/core/export.hpp"
#include "qlnet/net/tcp_stream.hpp"
#include "qlnet/snmp/snmp_status_query.hpp"
#include "qlnet/snmp/status_query.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace qlnet {
namespace core {

/**
 * @struct ConnectionOptions
 * @brief Timeouts and read strategy of a DeviceConnection.
 */
struct QLNET_CORE_API ConnectionOptions {
    ConnectionStrategy strategy;
    std::chrono::milliseconds read_timeout;            ///< Per status query
    std::chrono::milliseconds write_timeout;           ///< Applied only while writing
    std::chrono::milliseconds pending_query_lifetime;  ///< NON_BLOCKING_POLL re-issue interval

    ConnectionOptions()
        : strategy(ConnectionStrategy::SINGLE_TIMEOUT)
        , read_timeout(10)
        , write_timeout(10000)
        , pending_query_lifetime(1000)
    {}
};

/**
 * @class DeviceConnection
 * @brief Backend over a TCP stream plus status queries.
 *
 * States: connected after construction, closed after dispose(). There
 * is no way back from closed; write() and read() then throw IOError.
 * Concurrent calls of the same operation on one instance are not
 * supported.
 *
 * Usage:
 * @code
 * ConnectionOptions options;
 * options.strategy = ConnectionStrategy::TRY_TWICE;
 * DeviceConnection printer("tcp://192.168.1.5", options,
 *                          std::make_shared<snmp::SnmpStatusQuery>());
 * printer.write(commands);
 * auto status = printer.read();
 * printer.dispose();
 * @endcode
 */
class QLNET_CORE_API DeviceConnection : public Backend {
public:
    /**
     * @brief Resolve the host and connect.
     * @throws ConnectionError if the host cannot be resolved or connected.
     * @throws UnsupportedOperation for a non-tcp identifier.
     * @throws std::invalid_argument for a malformed identifier, or for a
     *         write timeout (or blocking read timeout) under 1ms.
     */
    DeviceConnection(const std::string& identifier,
                     const ConnectionOptions& options,
                     std::shared_ptr<snmp::StatusQuery> query);

    ~DeviceConnection() override;

    DeviceConnection(const DeviceConnection&) = delete;
    DeviceConnection& operator=(const DeviceConnection&) = delete;

    /**
     * @brief Send all bytes using the write timeout.
     *
     * The strategy's read mode is restored afterwards, also on failure.
     * @throws IOError on timeout, broken pipe or a closed connection.
     */
    void write(const std::vector<uint8_t>& data) override;

    /**
     * @brief Poll printer status according to the configured strategy.
     * @return Status bytes truncated to @p maxLength, or empty when none
     *         arrived in time.
     * @throws IOError on a local socket failure or a closed connection.
     */
    std::vector<uint8_t> read(size_t maxLength = 32) override;

    void dispose() override;

    bool isConnected() const { return stream_.isOpen(); }

    const DeviceIdentifier& identifier() const { return identifier_; }
    const std::string& resolvedHost() const { return host_; }
    const ConnectionOptions& options() const { return options_; }
    net::SocketHandle socketHandle() const { return stream_.handle(); }

private:
    DeviceIdentifier identifier_;
    std::string host_;
    ConnectionOptions options_;
    std::shared_ptr<snmp::StatusQuery> query_;
    net::TcpStream stream_;
    std::unique_ptr<snmp::PendingQuery> pending_;

    bool applyReadMode();
    void ensureConnected() const;
    std::vector<uint8_t> readBlocking(size_t maxLength);
    std::vector<uint8_t> readNonBlocking(size_t maxLength);
};

/**
 * @brief Open a printer connection backed by SNMP status queries.
 */
QLNET_CORE_API std::unique_ptr<Backend> openDevice(
    const std::string& identifier,
    const ConnectionOptions& options = ConnectionOptions(),
    const snmp::SnmpConfig& snmpConfig = snmp::SnmpConfig());

}  // namespace core
}  // namespace qlnet

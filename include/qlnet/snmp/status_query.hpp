/**
 * @file status_query.hpp
 * @brief Narrow status-query interface used by discovery and polling.
 *
 * DiscoveryScanner and DeviceConnection only talk to this interface, so
 * the wire protocol behind it can be replaced (or mocked in tests)
 * without touching either of them.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#pragma once

#include "qlnet/net/udp_socket.hpp"
#include "qlnet/snmp/ber.hpp"
#include "qlnet/snmp/export.hpp"
#include "qlnet/snmp/status_oids.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace qlnet {
namespace snmp {

/**
 * @enum QueryStatus
 * @brief Outcome of one status query.
 */
enum class QueryStatus {
    OK,           ///< A matching response arrived
    PENDING,      ///< Non-blocking query: no response yet
    TIMEOUT,      ///< No response before the deadline
    UNREACHABLE,  ///< The request could not be routed to the host
    ERROR         ///< Local socket failure
};

inline const char* queryStatusToString(QueryStatus status) {
    switch (status) {
        case QueryStatus::OK: return "ok";
        case QueryStatus::PENDING: return "pending";
        case QueryStatus::TIMEOUT: return "timeout";
        case QueryStatus::UNREACHABLE: return "unreachable";
        case QueryStatus::ERROR: return "error";
        default: return "unknown";
    }
}

using FieldValues = std::map<StatusField, Bytes>;

/**
 * @struct QueryResult
 * @brief Status plus whichever requested fields the device answered.
 */
struct QLNET_SNMP_API QueryResult {
    QueryStatus status = QueryStatus::TIMEOUT;
    FieldValues values;
    std::string error;  ///< Set for UNREACHABLE and ERROR

    bool ok() const { return status == QueryStatus::OK; }
};

/**
 * @enum DispatchAction
 * @brief Returned by the broadcast tick callback to continue or end a dispatch loop.
 */
enum class DispatchAction {
    CONTINUE,
    STOP
};

/// Invoked for every valid broadcast response with its source and raw datagram.
using ResponseCallback = std::function<void(const net::SocketAddress& source,
                                            const Bytes& message)>;

/// Invoked once per dispatch-loop iteration.
using TickCallback = std::function<DispatchAction(std::chrono::steady_clock::time_point now)>;

/**
 * @class PendingQuery
 * @brief A unicast request in flight, polled without blocking.
 */
class QLNET_SNMP_API PendingQuery {
public:
    virtual ~PendingQuery() = default;

    /**
     * @brief Check for a response without blocking.
     * @return OK with values, PENDING, TIMEOUT once the lifetime has
     *         elapsed, or ERROR.
     */
    virtual QueryResult poll() = 0;
};

/**
 * @class StatusQuery
 * @brief Unicast and broadcast status queries against the fixed field table.
 */
class QLNET_SNMP_API StatusQuery {
public:
    virtual ~StatusQuery() = default;

    /**
     * @brief One request/response exchange with a single host.
     * @param host Dotted IPv4 address of the device.
     * @param fields Fields to request.
     * @param timeout Maximum time to wait for the response.
     */
    virtual QueryResult queryUnicast(const std::string& host,
                                     const std::vector<StatusField>& fields,
                                     std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Send a unicast request and return immediately.
     * @param lifetime How long the request stays answerable before poll()
     *                 reports TIMEOUT.
     */
    virtual std::unique_ptr<PendingQuery> startUnicast(const std::string& host,
                                                       const std::vector<StatusField>& fields,
                                                       std::chrono::milliseconds lifetime) = 0;

    /**
     * @brief Broadcast one request and dispatch responses until stopped.
     *
     * Stops when @p maxResponses distinct source endpoints have answered
     * or when @p onTick returns DispatchAction::STOP.
     * @return OK, or ERROR if the request could not be sent.
     */
    virtual QueryStatus queryBroadcast(const std::vector<StatusField>& fields,
                                       const ResponseCallback& onResponse,
                                       const TickCallback& onTick,
                                       size_t maxResponses) = 0;
};

}  // namespace snmp
}  // namespace qlnet

/**
 * @file snmp_status_query.hpp
 * @brief SNMP-backed implementation of StatusQuery.
 *
 * Unicast queries go out as SNMPv2c GetRequests, broadcasts as SNMPv1.
 * Every query opens its own short-lived UDP socket, so concurrent
 * queries on one instance never share socket state.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#pragma once

#include "qlnet/snmp/export.hpp"
#include "qlnet/snmp/message.hpp"
#include "qlnet/snmp/status_query.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace qlnet {
namespace snmp {

/**
 * @struct SnmpConfig
 * @brief Agent addressing and dispatch-loop settings.
 */
struct QLNET_SNMP_API SnmpConfig {
    std::string community = "public";
    uint16_t agent_port = 161;
    std::string broadcast_addr = "255.255.255.255";
    std::chrono::milliseconds tick_interval{100};  ///< Max wait per dispatch iteration
    size_t max_datagram = 65535;
};

/**
 * @class SnmpStatusQuery
 * @brief Queries printer status fields over SNMP.
 *
 * Usage:
 * @code
 * SnmpStatusQuery query;
 * auto result = query.queryUnicast("192.168.1.5", {StatusField::STATUS},
 *                                  std::chrono::milliseconds(100));
 * if (result.ok() && result.values.count(StatusField::STATUS)) {
 *     // result.values[StatusField::STATUS] holds the raw octets
 * }
 * @endcode
 */
class QLNET_SNMP_API SnmpStatusQuery : public StatusQuery {
public:
    explicit SnmpStatusQuery(SnmpConfig config = SnmpConfig());
    ~SnmpStatusQuery() override = default;

    SnmpStatusQuery(const SnmpStatusQuery&) = delete;
    SnmpStatusQuery& operator=(const SnmpStatusQuery&) = delete;

    QueryResult queryUnicast(const std::string& host,
                             const std::vector<StatusField>& fields,
                             std::chrono::milliseconds timeout) override;

    std::unique_ptr<PendingQuery> startUnicast(const std::string& host,
                                               const std::vector<StatusField>& fields,
                                               std::chrono::milliseconds lifetime) override;

    /**
     * @copydoc StatusQuery::queryBroadcast
     *
     * A @p maxResponses of 0 disables the response cap.
     */
    QueryStatus queryBroadcast(const std::vector<StatusField>& fields,
                               const ResponseCallback& onResponse,
                               const TickCallback& onTick,
                               size_t maxResponses) override;

    const SnmpConfig& config() const { return config_; }

private:
    SnmpConfig config_;
    std::atomic<uint32_t> requestCounter_;

    int32_t nextRequestId();
    Bytes buildRequest(Version version, const std::vector<StatusField>& fields,
                       int32_t requestId) const;
};

/**
 * @brief Map the varbinds of a response onto the requested fields.
 *
 * Varbinds are matched by position first, then by OID, so fields sharing
 * an OID each receive their own value. Unanswered varbinds (NULL and the
 * v2c exception values) are left out.
 */
QLNET_SNMP_API FieldValues extractFieldValues(const Message& response,
                                              const std::vector<StatusField>& fields);

/**
 * @brief True for a GetResponse carrying the given request id.
 */
QLNET_SNMP_API bool isResponseTo(const Message& message, int32_t requestId);

}  // namespace snmp
}  // namespace qlnet

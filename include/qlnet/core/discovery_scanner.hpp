/**
 * @file discovery_scanner.hpp
 * @brief Broadcast discovery of network printers.
 *
 * A scan broadcasts one status request and collects every distinct
 * endpoint that answers, until either the wait time elapses or the
 * response cap is reached, whichever comes first.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#pragma once

#include "qlnet/core/backend.hpp"
#include "qlnet/core/export.hpp"
#include "qlnet/snmp/snmp_status_query.hpp"
#include "qlnet/snmp/status_query.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace qlnet {
namespace core {

/**
 * @struct DiscoveryConfig
 * @brief Bounds of one discovery scan.
 */
struct QLNET_CORE_API DiscoveryConfig {
    std::chrono::milliseconds max_wait;     ///< Wall-clock limit of a scan
    size_t max_responses;                   ///< Stop after this many distinct responders
    std::vector<snmp::StatusField> fields;  ///< Fields requested in the broadcast

    DiscoveryConfig()
        : max_wait(5000)
        , max_responses(10)
        , fields{snmp::StatusField::IP, snmp::StatusField::STATUS}
    {}
};

/**
 * @struct DiscoveredDevice
 * @brief A reachable printer. Discovery never opens it, so instance is null.
 */
struct QLNET_CORE_API DiscoveredDevice {
    std::string identifier;             ///< "tcp://host:port"
    std::shared_ptr<Backend> instance;
};

/**
 * @class DiscoveryScanner
 * @brief Runs broadcast scans through a StatusQuery.
 *
 * Each call to listAvailableDevices() keeps its state in its own scan
 * context, so one scanner may be used from several threads.
 *
 * Usage:
 * @code
 * auto query = std::make_shared<snmp::SnmpStatusQuery>();
 * DiscoveryScanner scanner(query);
 * for (const auto& device : scanner.listAvailableDevices()) {
 *     std::cout << device.identifier << "\n";
 * }
 * @endcode
 */
class QLNET_CORE_API DiscoveryScanner {
public:
    explicit DiscoveryScanner(std::shared_ptr<snmp::StatusQuery> query,
                              DiscoveryConfig config = DiscoveryConfig());

    /**
     * @brief Scan the segment.
     * @return Responders sorted by identifier; empty if none answered.
     * @throws IOError if the broadcast could not be sent.
     */
    std::vector<DiscoveredDevice> listAvailableDevices() const;

    const DiscoveryConfig& config() const { return config_; }

private:
    std::shared_ptr<snmp::StatusQuery> query_;
    DiscoveryConfig config_;
};

/**
 * @brief Run one scan with an SNMP status query built from @p snmpConfig.
 */
QLNET_CORE_API std::vector<DiscoveredDevice> listAvailableDevices(
    const DiscoveryConfig& config = DiscoveryConfig(),
    const snmp::SnmpConfig& snmpConfig = snmp::SnmpConfig());

}  // namespace core
}  // namespace qlnet

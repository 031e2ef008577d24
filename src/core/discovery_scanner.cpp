/**
 * @file discovery_scanner.cpp
 * @brief DiscoveryScanner implementation.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#include "qlnet/core/discovery_scanner.hpp"
#include "qlnet/core/errors.hpp"
#include "qlnet/utils/logger.hpp"

#include <stdexcept>

namespace qlnet {
namespace core {

namespace {

/**
 * @struct ScanContext
 * @brief State of one scan, shared by its callbacks.
 */
struct ScanContext {
    std::set<std::string> found;
    std::chrono::steady_clock::time_point startedAt;
};

}  // namespace

DiscoveryScanner::DiscoveryScanner(std::shared_ptr<snmp::StatusQuery> query,
                                   DiscoveryConfig config)
    : query_(std::move(query))
    , config_(std::move(config))
{
    if (!query_) {
        throw std::invalid_argument("DiscoveryScanner requires a status query");
    }
}

std::vector<DiscoveredDevice> DiscoveryScanner::listAvailableDevices() const {
    ScanContext context;
    context.startedAt = std::chrono::steady_clock::now();

    LOG_DEBUG("Discovery", "Scanning for up to {}ms, at most {} responder(s)",
              config_.max_wait.count(), config_.max_responses);

    auto onResponse = [&context](const net::SocketAddress& source, const snmp::Bytes&) {
        if (context.found.insert(source.toString()).second) {
            LOG_DEBUG("Discovery", "Found printer at {}", source.toString());
        }
    };

    auto onTick = [&context, this](std::chrono::steady_clock::time_point now) {
        if (now - context.startedAt > config_.max_wait) {
            return snmp::DispatchAction::STOP;
        }
        return snmp::DispatchAction::CONTINUE;
    };

    snmp::QueryStatus status = query_->queryBroadcast(config_.fields, onResponse, onTick,
                                                      config_.max_responses);
    if (status == snmp::QueryStatus::ERROR) {
        throw IOError("discovery broadcast could not be sent");
    }

    std::vector<DiscoveredDevice> devices;
    devices.reserve(context.found.size());
    for (const auto& endpoint : context.found) {
        DiscoveredDevice device;
        device.identifier = "tcp://" + endpoint;
        devices.push_back(std::move(device));
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - context.startedAt);
    LOG_INFO("Discovery", "Scan found {} printer(s) in {}ms", devices.size(), elapsed.count());
    return devices;
}

std::vector<DiscoveredDevice> listAvailableDevices(const DiscoveryConfig& config,
                                                   const snmp::SnmpConfig& snmpConfig) {
    DiscoveryScanner scanner(std::make_shared<snmp::SnmpStatusQuery>(snmpConfig), config);
    return scanner.listAvailableDevices();
}

}  // namespace core
}  // namespace qlnet

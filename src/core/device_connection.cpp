/**
 * @file device_connection.cpp
 * @brief DeviceConnection implementation.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#include "qlnet/core/device_connection.hpp"
#include "qlnet/core/errors.hpp"
#include "qlnet/net/resolver.hpp"
#include "qlnet/utils/logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace qlnet {
namespace core {

namespace {

const std::vector<snmp::StatusField> STATUS_ONLY = {snmp::StatusField::STATUS};

const std::vector<uint8_t>* statusValue(const snmp::QueryResult& result) {
    auto it = result.values.find(snmp::StatusField::STATUS);
    if (it == result.values.end() || it->second.empty()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<uint8_t> truncated(const std::vector<uint8_t>& value, size_t maxLength) {
    size_t length = std::min(value.size(), maxLength);
    return std::vector<uint8_t>(value.begin(), value.begin() + length);
}

void requireTimeout(std::chrono::milliseconds timeout, const char* name) {
    if (timeout.count() < 1) {
        throw std::invalid_argument(std::string(name) + " must be at least 1ms, got " +
                                    std::to_string(timeout.count()) + "ms");
    }
}

}  // namespace

DeviceConnection::DeviceConnection(const std::string& identifier,
                                   const ConnectionOptions& options,
                                   std::shared_ptr<snmp::StatusQuery> query)
    : identifier_(DeviceIdentifier::parse(identifier))
    , options_(options)
    , query_(std::move(query))
{
    if (!query_) {
        throw std::invalid_argument("DeviceConnection requires a status query");
    }
    requireTimeout(options_.write_timeout, "write_timeout");
    if (options_.strategy != ConnectionStrategy::NON_BLOCKING_POLL) {
        requireTimeout(options_.read_timeout, "read_timeout");
    }

    std::string resolveError;
    auto resolved = net::resolveIPv4(identifier_.host(), &resolveError);
    if (!resolved) {
        throw ConnectionError("cannot resolve '" + identifier_.host() + "': " + resolveError);
    }
    host_ = *resolved;

    net::SocketAddress remote(host_, identifier_.port());
    if (!stream_.connect(remote)) {
        throw ConnectionError("cannot connect to " + remote.toString() + ": " +
                              net::socketErrorString(stream_.getLastError()));
    }

    if (!stream_.setNoDelay(true)) {
        LOG_WARN("Connection", "Failed to set TCP_NODELAY on {}: {}",
                 remote.toString(), net::socketErrorString(stream_.getLastError()));
    }

    if (!applyReadMode()) {
        std::string cause = net::socketErrorString(stream_.getLastError());
        stream_.close();
        throw ConnectionError("cannot configure socket for " + remote.toString() + ": " + cause);
    }

    LOG_INFO("Connection", "Connected to {} ({}, read timeout {}ms)",
             identifier_.toString(), connectionStrategyToString(options_.strategy),
             options_.read_timeout.count());
}

DeviceConnection::~DeviceConnection() {
    if (isConnected()) {
        dispose();
    }
}

bool DeviceConnection::applyReadMode() {
    if (options_.strategy == ConnectionStrategy::NON_BLOCKING_POLL) {
        return stream_.setNonBlocking();
    }
    return stream_.setTimeout(options_.read_timeout);
}

void DeviceConnection::ensureConnected() const {
    if (!isConnected()) {
        throw IOError("connection is closed");
    }
}

void DeviceConnection::write(const std::vector<uint8_t>& data) {
    ensureConnected();

    if (!stream_.setTimeout(options_.write_timeout)) {
        throw IOError("cannot set write timeout: " +
                      net::socketErrorString(stream_.getLastError()));
    }

    auto deadline = std::chrono::steady_clock::now() + options_.write_timeout;
    bool sent = stream_.sendAll(data.data(), data.size(), deadline);
    int sendError = stream_.getLastError();
    bool timedOut = stream_.lastSendTimedOut();

    if (!applyReadMode()) {
        LOG_WARN("Connection", "Failed to restore read mode on {}: {}",
                 identifier_.toString(), net::socketErrorString(stream_.getLastError()));
    }

    if (!sent) {
        if (timedOut) {
            throw IOError("write to " + identifier_.toString() + " timed out after " +
                          std::to_string(options_.write_timeout.count()) + "ms");
        }
        throw IOError("write to " + identifier_.toString() + " failed: " +
                      net::socketErrorString(sendError));
    }

    LOG_TRACE("Connection", "Wrote {} byte(s) to {}", data.size(), identifier_.toString());
}

std::vector<uint8_t> DeviceConnection::read(size_t maxLength) {
    ensureConnected();

    if (options_.strategy == ConnectionStrategy::NON_BLOCKING_POLL) {
        return readNonBlocking(maxLength);
    }
    return readBlocking(maxLength);
}

std::vector<uint8_t> DeviceConnection::readBlocking(size_t maxLength) {
    int attempts = attemptsFor(options_.strategy);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        snmp::QueryResult result = query_->queryUnicast(host_, STATUS_ONLY, options_.read_timeout);

        if (result.status == snmp::QueryStatus::ERROR) {
            throw IOError("status query failed: " + result.error);
        }
        if (result.ok()) {
            if (const auto* value = statusValue(result)) {
                return truncated(*value, maxLength);
            }
        }

        LOG_TRACE("Connection", "No status from {} (attempt {}/{}, {})",
                  host_, attempt, attempts, snmp::queryStatusToString(result.status));
    }

    return {};
}

std::vector<uint8_t> DeviceConnection::readNonBlocking(size_t maxLength) {
    if (!pending_) {
        pending_ = query_->startUnicast(host_, STATUS_ONLY, options_.pending_query_lifetime);
        if (!pending_) {
            throw IOError("status query could not be started");
        }
    }

    snmp::QueryResult result = pending_->poll();
    switch (result.status) {
        case snmp::QueryStatus::OK: {
            pending_.reset();
            const auto* value = statusValue(result);
            return value ? truncated(*value, maxLength) : std::vector<uint8_t>();
        }

        case snmp::QueryStatus::PENDING:
            return {};

        case snmp::QueryStatus::ERROR:
            pending_.reset();
            throw IOError("status query failed: " + result.error);

        default:
            LOG_TRACE("Connection", "Pending status query to {} ended: {}",
                      host_, snmp::queryStatusToString(result.status));
            pending_.reset();
            return {};
    }
}

void DeviceConnection::dispose() {
    if (!isConnected()) {
        LOG_DEBUG("Connection", "{} already disposed", identifier_.toString());
        return;
    }

    pending_.reset();
    if (!stream_.shutdown()) {
        LOG_DEBUG("Connection", "Shutdown of {} reported: {}",
                  identifier_.toString(), net::socketErrorString(stream_.getLastError()));
    }
    stream_.close();

    LOG_INFO("Connection", "Disconnected from {}", identifier_.toString());
}

std::unique_ptr<Backend> openDevice(const std::string& identifier,
                                    const ConnectionOptions& options,
                                    const snmp::SnmpConfig& snmpConfig) {
    return std::make_unique<DeviceConnection>(
        identifier, options, std::make_shared<snmp::SnmpStatusQuery>(snmpConfig));
}

}  // namespace core
}  // namespace qlnet

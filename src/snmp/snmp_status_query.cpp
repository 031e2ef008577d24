/**
 * @file snmp_status_query.cpp
 * @brief SNMP unicast, pending and broadcast status queries.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#include "qlnet/snmp/snmp_status_query.hpp"
#include "qlnet/net/udp_socket.hpp"
#include "qlnet/utils/logger.hpp"

#include <random>
#include <set>

namespace qlnet {
namespace snmp {

namespace {

using Clock = std::chrono::steady_clock;

// Remaining time rounded up, so a sub-millisecond remainder still waits.
int remainingMs(Clock::time_point deadline) {
    auto remaining = deadline - Clock::now();
    if (remaining <= Clock::duration::zero()) {
        return 0;
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(remaining).count();
    return static_cast<int>(ms > 0 ? ms : 1);
}

QueryResult failure(QueryStatus status, std::string error) {
    QueryResult result;
    result.status = status;
    result.error = std::move(error);
    return result;
}

QueryResult sendFailure(const net::UdpSocket& socket, const net::SocketAddress& agent) {
    int error = socket.getLastError();
    std::string text = "send to " + agent.toString() + " failed: " +
                       net::socketErrorString(error);
    if (net::isUnreachable(error)) {
        LOG_DEBUG("Snmp", "{}", text);
        return failure(QueryStatus::UNREACHABLE, text);
    }
    LOG_WARN("Snmp", "{}", text);
    return failure(QueryStatus::ERROR, text);
}

/**
 * @class CompletedQuery
 * @brief Pending query that failed before it was sent.
 */
class CompletedQuery : public PendingQuery {
public:
    explicit CompletedQuery(QueryResult result) : result_(std::move(result)) {}

    QueryResult poll() override { return result_; }

private:
    QueryResult result_;
};

/**
 * @class SnmpPendingQuery
 * @brief Unicast request whose response is collected by polling.
 */
class SnmpPendingQuery : public PendingQuery {
public:
    SnmpPendingQuery(net::UdpSocket socket,
                     int32_t requestId,
                     std::vector<StatusField> fields,
                     Clock::time_point deadline,
                     size_t maxDatagram)
        : socket_(std::move(socket))
        , requestId_(requestId)
        , fields_(std::move(fields))
        , deadline_(deadline)
        , buffer_(maxDatagram)
    {}

    QueryResult poll() override {
        if (finished_) {
            return result_;
        }

        net::SocketAddress sender;
        while (true) {
            int received = socket_.receiveFrom(buffer_.data(), buffer_.size(), 0, sender);
            if (received < 0) {
                return finish(failure(QueryStatus::ERROR,
                    "receive failed: " + net::socketErrorString(socket_.getLastError())));
            }
            if (received == 0) {
                break;
            }

            auto message = decodeMessage(buffer_.data(), static_cast<size_t>(received));
            if (!message || !isResponseTo(*message, requestId_)) {
                LOG_TRACE("Snmp", "Discarding unrelated datagram from {}", sender.toString());
                continue;
            }

            QueryResult result;
            result.status = QueryStatus::OK;
            result.values = extractFieldValues(*message, fields_);
            return finish(std::move(result));
        }

        if (Clock::now() >= deadline_) {
            return finish(failure(QueryStatus::TIMEOUT, ""));
        }

        QueryResult pending;
        pending.status = QueryStatus::PENDING;
        return pending;
    }

private:
    net::UdpSocket socket_;
    int32_t requestId_;
    std::vector<StatusField> fields_;
    Clock::time_point deadline_;
    std::vector<uint8_t> buffer_;
    bool finished_ = false;
    QueryResult result_;

    QueryResult finish(QueryResult result) {
        finished_ = true;
        result_ = result;
        socket_.close();
        return result;
    }
};

}  // namespace

FieldValues extractFieldValues(const Message& response,
                               const std::vector<StatusField>& fields) {
    FieldValues values;

    for (size_t i = 0; i < response.varbinds.size(); ++i) {
        const VarBind& vb = response.varbinds[i];
        if (!vb.hasValue()) {
            continue;
        }

        if (i < fields.size() && oidFor(fields[i]) == vb.oid && !values.count(fields[i])) {
            values[fields[i]] = vb.value;
            continue;
        }

        for (StatusField field : fields) {
            if (oidFor(field) == vb.oid && !values.count(field)) {
                values[field] = vb.value;
                break;
            }
        }
    }

    return values;
}

bool isResponseTo(const Message& message, int32_t requestId) {
    return message.pdu_type == PduType::GET_RESPONSE && message.request_id == requestId;
}

SnmpStatusQuery::SnmpStatusQuery(SnmpConfig config)
    : config_(std::move(config))
    , requestCounter_(0)
{
    std::random_device rd;
    std::uniform_int_distribution<uint32_t> dist(1, 0x3FFFFFFF);
    requestCounter_ = dist(rd);
}

int32_t SnmpStatusQuery::nextRequestId() {
    uint32_t id = requestCounter_.fetch_add(1) & 0x7FFFFFFF;
    return static_cast<int32_t>(id == 0 ? 1 : id);
}

Bytes SnmpStatusQuery::buildRequest(Version version,
                                    const std::vector<StatusField>& fields,
                                    int32_t requestId) const {
    std::vector<std::string> oids;
    oids.reserve(fields.size());
    for (StatusField field : fields) {
        oids.push_back(oidFor(field));
    }
    return encodeMessage(makeGetRequest(version, config_.community, requestId, oids));
}

QueryResult SnmpStatusQuery::queryUnicast(const std::string& host,
                                          const std::vector<StatusField>& fields,
                                          std::chrono::milliseconds timeout) {
    net::UdpSocket socket;
    if (!socket.isValid()) {
        return failure(QueryStatus::ERROR,
                       "socket creation failed: " + net::socketErrorString(socket.getLastError()));
    }

    int32_t requestId = nextRequestId();
    Bytes request = buildRequest(Version::V2C, fields, requestId);
    net::SocketAddress agent(host, config_.agent_port);

    if (socket.sendTo(agent, request.data(), request.size()) < 0) {
        return sendFailure(socket, agent);
    }
    LOG_TRACE("Snmp", "Sent GetRequest {} to {}", requestId, agent.toString());

    auto deadline = Clock::now() + timeout;
    std::vector<uint8_t> buffer(config_.max_datagram);
    net::SocketAddress sender;

    int waitMs = 0;
    while ((waitMs = remainingMs(deadline)) > 0) {
        int received = socket.receiveFrom(buffer.data(), buffer.size(), waitMs, sender);
        if (received < 0) {
            return failure(QueryStatus::ERROR,
                           "receive failed: " + net::socketErrorString(socket.getLastError()));
        }
        if (received == 0) {
            continue;
        }

        auto message = decodeMessage(buffer.data(), static_cast<size_t>(received));
        if (!message || !isResponseTo(*message, requestId)) {
            LOG_TRACE("Snmp", "Discarding unrelated datagram from {}", sender.toString());
            continue;
        }

        QueryResult result;
        result.status = QueryStatus::OK;
        result.values = extractFieldValues(*message, fields);
        LOG_TRACE("Snmp", "Response {} from {} with {} value(s)",
                  requestId, sender.toString(), result.values.size());
        return result;
    }

    LOG_DEBUG("Snmp", "No response from {} within {}ms", agent.toString(), timeout.count());
    return failure(QueryStatus::TIMEOUT, "");
}

std::unique_ptr<PendingQuery> SnmpStatusQuery::startUnicast(const std::string& host,
                                                            const std::vector<StatusField>& fields,
                                                            std::chrono::milliseconds lifetime) {
    net::UdpSocket socket;
    if (!socket.isValid()) {
        return std::make_unique<CompletedQuery>(failure(QueryStatus::ERROR,
            "socket creation failed: " + net::socketErrorString(socket.getLastError())));
    }

    int32_t requestId = nextRequestId();
    Bytes request = buildRequest(Version::V2C, fields, requestId);
    net::SocketAddress agent(host, config_.agent_port);

    if (socket.sendTo(agent, request.data(), request.size()) < 0) {
        return std::make_unique<CompletedQuery>(sendFailure(socket, agent));
    }
    LOG_TRACE("Snmp", "Started pending GetRequest {} to {}", requestId, agent.toString());

    return std::make_unique<SnmpPendingQuery>(std::move(socket), requestId, fields,
                                              Clock::now() + lifetime, config_.max_datagram);
}

QueryStatus SnmpStatusQuery::queryBroadcast(const std::vector<StatusField>& fields,
                                            const ResponseCallback& onResponse,
                                            const TickCallback& onTick,
                                            size_t maxResponses) {
    net::UdpSocket socket;
    if (!socket.isValid()) {
        return QueryStatus::ERROR;
    }
    if (!socket.setBroadcast(true)) {
        LOG_ERROR("Snmp", "Cannot enable broadcast: {}",
                  net::socketErrorString(socket.getLastError()));
        return QueryStatus::ERROR;
    }

    int32_t requestId = nextRequestId();
    Bytes request = buildRequest(Version::V1, fields, requestId);
    net::SocketAddress target(config_.broadcast_addr, config_.agent_port);

    if (socket.sendTo(target, request.data(), request.size()) < 0) {
        LOG_ERROR("Snmp", "Broadcast to {} failed: {}",
                  target.toString(), net::socketErrorString(socket.getLastError()));
        return QueryStatus::ERROR;
    }
    LOG_DEBUG("Snmp", "Broadcast GetRequest {} to {}", requestId, target.toString());

    std::vector<uint8_t> buffer(config_.max_datagram);
    std::set<std::string> responders;
    int tickMs = static_cast<int>(config_.tick_interval.count());

    while (true) {
        net::SocketAddress sender;
        int received = socket.receiveFrom(buffer.data(), buffer.size(), tickMs, sender);
        if (received < 0) {
            LOG_ERROR("Snmp", "Receive failed during broadcast: {}",
                      net::socketErrorString(socket.getLastError()));
            return QueryStatus::ERROR;
        }

        if (received > 0) {
            auto message = decodeMessage(buffer.data(), static_cast<size_t>(received));
            if (message && isResponseTo(*message, requestId)) {
                if (onResponse) {
                    onResponse(sender, Bytes(buffer.begin(), buffer.begin() + received));
                }
                responders.insert(sender.toString());
                if (maxResponses > 0 && responders.size() >= maxResponses) {
                    LOG_DEBUG("Snmp", "Response cap of {} reached", maxResponses);
                    break;
                }
            } else {
                LOG_TRACE("Snmp", "Discarding unrelated datagram from {}", sender.toString());
            }
        }

        if (onTick && onTick(Clock::now()) == DispatchAction::STOP) {
            break;
        }
    }

    LOG_DEBUG("Snmp", "Broadcast {} finished with {} responder(s)", requestId, responders.size());
    return QueryStatus::OK;
}

}  // namespace snmp
}  // namespace qlnet

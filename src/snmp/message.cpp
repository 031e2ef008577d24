/**
 * @file message.cpp
 * @brief SNMP message encoding and decoding.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#include "qlnet/snmp/message.hpp"
#include "qlnet/utils/logger.hpp"

namespace qlnet {
namespace snmp {

Message makeGetRequest(Version version,
                       const std::string& community,
                       int32_t requestId,
                       const std::vector<std::string>& oids) {
    Message message;
    message.version = version;
    message.community = community;
    message.pdu_type = PduType::GET_REQUEST;
    message.request_id = requestId;

    message.varbinds.reserve(oids.size());
    for (const auto& oid : oids) {
        VarBind vb;
        vb.oid = oid;
        vb.tag = ber::TAG_NULL;
        message.varbinds.push_back(std::move(vb));
    }
    return message;
}

Bytes encodeMessage(const Message& message) {
    Bytes varbindList;
    for (const auto& vb : message.varbinds) {
        Bytes entry;
        ber::appendOid(entry, vb.oid);
        ber::appendTlv(entry, vb.tag, vb.value);
        ber::appendTlv(varbindList, ber::TAG_SEQUENCE, entry);
    }

    Bytes pduContent;
    ber::appendInteger(pduContent, message.request_id);
    ber::appendInteger(pduContent, message.error_status);
    ber::appendInteger(pduContent, message.error_index);
    ber::appendTlv(pduContent, ber::TAG_SEQUENCE, varbindList);

    Bytes msgContent;
    ber::appendInteger(msgContent, static_cast<int32_t>(message.version));
    ber::appendOctetString(msgContent, message.community);
    ber::appendTlv(msgContent, static_cast<uint8_t>(message.pdu_type), pduContent);

    Bytes packet;
    ber::appendTlv(packet, ber::TAG_SEQUENCE, msgContent);
    return packet;
}

std::optional<Message> decodeMessage(const uint8_t* data, size_t length) {
    Message message;

    try {
        ber::Reader outer(data, length);
        ber::Reader msg = outer.sub(outer.expect(ber::TAG_SEQUENCE));

        int32_t version = msg.readInteger();
        if (version != static_cast<int32_t>(Version::V1) &&
            version != static_cast<int32_t>(Version::V2C)) {
            LOG_TRACE("Snmp", "Ignoring message with version {}", version);
            return std::nullopt;
        }
        message.version = static_cast<Version>(version);
        message.community = msg.readOctetString();

        uint8_t pduTag = 0;
        size_t pduLength = msg.readHeader(pduTag);
        if (pduTag < static_cast<uint8_t>(PduType::GET_REQUEST) ||
            pduTag > static_cast<uint8_t>(PduType::SET_REQUEST)) {
            LOG_TRACE("Snmp", "Ignoring unsupported PDU type {}", static_cast<int>(pduTag));
            return std::nullopt;
        }
        message.pdu_type = static_cast<PduType>(pduTag);

        ber::Reader pdu = msg.sub(pduLength);
        message.request_id = pdu.readInteger();
        message.error_status = pdu.readInteger();
        message.error_index = pdu.readInteger();

        ber::Reader list = pdu.sub(pdu.expect(ber::TAG_SEQUENCE));
        while (!list.atEnd()) {
            ber::Reader entry = list.sub(list.expect(ber::TAG_SEQUENCE));

            VarBind vb;
            vb.oid = entry.readOid();
            size_t valueLength = entry.readHeader(vb.tag);
            vb.value.assign(entry.current(), entry.current() + valueLength);
            entry.skip(valueLength);

            message.varbinds.push_back(std::move(vb));
        }
    } catch (const ber::BerError& e) {
        LOG_TRACE("Snmp", "Discarding malformed message ({} bytes): {}", length, e.what());
        return std::nullopt;
    }

    return message;
}

}  // namespace snmp
}  // namespace qlnet

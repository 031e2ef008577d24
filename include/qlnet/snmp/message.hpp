/**
 * @file message.hpp
 * @brief SNMP v1/v2c message model and codec.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#pragma once

#include "qlnet/snmp/ber.hpp"
#include "qlnet/snmp/export.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace qlnet {
namespace snmp {

/**
 * @enum Version
 * @brief Wire value of the message version field.
 */
enum class Version : int32_t {
    V1 = 0,
    V2C = 1
};

/**
 * @enum PduType
 * @brief Context-specific PDU tags understood by the codec.
 */
enum class PduType : uint8_t {
    GET_REQUEST = 0xA0,
    GET_NEXT_REQUEST = 0xA1,
    GET_RESPONSE = 0xA2,
    SET_REQUEST = 0xA3
};

/**
 * @struct VarBind
 * @brief One OID/value pair. The value is kept as raw content octets.
 */
struct QLNET_SNMP_API VarBind {
    std::string oid;
    uint8_t tag = ber::TAG_NULL;
    Bytes value;

    /**
     * @brief False for NULL and the v2c exception values
     *        (noSuchObject, noSuchInstance, endOfMibView).
     */
    bool hasValue() const {
        return tag != ber::TAG_NULL &&
               tag != ber::TAG_NO_SUCH_OBJECT &&
               tag != ber::TAG_NO_SUCH_INSTANCE &&
               tag != ber::TAG_END_OF_MIB_VIEW;
    }
};

/**
 * @struct Message
 * @brief A community-based SNMP message with a single PDU.
 */
struct QLNET_SNMP_API Message {
    Version version = Version::V2C;
    std::string community = "public";
    PduType pdu_type = PduType::GET_REQUEST;
    int32_t request_id = 0;
    int32_t error_status = 0;
    int32_t error_index = 0;
    std::vector<VarBind> varbinds;
};

/**
 * @brief Build a GetRequest whose varbinds carry NULL values.
 */
QLNET_SNMP_API Message makeGetRequest(Version version,
                                      const std::string& community,
                                      int32_t requestId,
                                      const std::vector<std::string>& oids);

/**
 * @brief Serialize a message.
 * @throws ber::BerError if an OID in the message is malformed.
 */
QLNET_SNMP_API Bytes encodeMessage(const Message& message);

/**
 * @brief Parse a datagram.
 * @return The message, or std::nullopt for anything that is not a
 *         well-formed v1/v2c message (logged at TRACE).
 */
QLNET_SNMP_API std::optional<Message> decodeMessage(const uint8_t* data, size_t length);

inline std::optional<Message> decodeMessage(const Bytes& data) {
    return decodeMessage(data.data(), data.size());
}

}  // namespace snmp
}  // namespace qlnet

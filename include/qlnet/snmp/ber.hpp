/**
 * @file ber.hpp
 * @brief Minimal ASN.1 BER primitives for SNMP v1/v2c messages.
 *
 * Only the types that appear in GetRequest/GetResponse PDUs are covered:
 * INTEGER, OCTET STRING, NULL, OBJECT IDENTIFIER and SEQUENCE, plus the
 * application/context tags a response may carry as opaque values.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#pragma once

#include "qlnet/snmp/export.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace qlnet {
namespace snmp {

using Bytes = std::vector<uint8_t>;

namespace ber {

constexpr uint8_t TAG_INTEGER = 0x02;
constexpr uint8_t TAG_OCTET_STRING = 0x04;
constexpr uint8_t TAG_NULL = 0x05;
constexpr uint8_t TAG_OID = 0x06;
constexpr uint8_t TAG_SEQUENCE = 0x30;
constexpr uint8_t TAG_IP_ADDRESS = 0x40;
constexpr uint8_t TAG_COUNTER32 = 0x41;
constexpr uint8_t TAG_GAUGE32 = 0x42;
constexpr uint8_t TAG_TIMETICKS = 0x43;
constexpr uint8_t TAG_NO_SUCH_OBJECT = 0x80;
constexpr uint8_t TAG_NO_SUCH_INSTANCE = 0x81;
constexpr uint8_t TAG_END_OF_MIB_VIEW = 0x82;

/**
 * @brief Raised on malformed or truncated BER input, or an unencodable value.
 */
class QLNET_SNMP_API BerError : public std::runtime_error {
public:
    explicit BerError(const std::string& what) : std::runtime_error(what) {}
};

QLNET_SNMP_API void appendLength(Bytes& out, size_t length);

/**
 * @brief Append a complete tag-length-value element.
 */
QLNET_SNMP_API void appendTlv(Bytes& out, uint8_t tag, const uint8_t* value, size_t length);

inline void appendTlv(Bytes& out, uint8_t tag, const Bytes& value) {
    appendTlv(out, tag, value.data(), value.size());
}

QLNET_SNMP_API void appendInteger(Bytes& out, int32_t value);
QLNET_SNMP_API void appendOctetString(Bytes& out, const std::string& value);
QLNET_SNMP_API void appendNull(Bytes& out);

/**
 * @brief Append a dotted OID ("1.3.6.1...") as an OBJECT IDENTIFIER.
 * @throws BerError if the OID has fewer than two arcs or a bad arc.
 */
QLNET_SNMP_API void appendOid(Bytes& out, const std::string& dotted);

/**
 * @brief Decode OBJECT IDENTIFIER content octets to dotted form.
 * @throws BerError on a truncated arc.
 */
QLNET_SNMP_API std::string decodeOid(const uint8_t* data, size_t length);

/**
 * @brief Decode INTEGER content octets (two's complement, 1-4 bytes).
 * @throws BerError if the length is 0 or larger than 4.
 */
QLNET_SNMP_API int32_t decodeInteger(const uint8_t* data, size_t length);

/**
 * @class Reader
 * @brief Bounds-checked cursor over a BER buffer.
 *
 * Every read verifies the remaining length and throws BerError rather
 * than running off the end of the buffer.
 */
class QLNET_SNMP_API Reader {
public:
    Reader(const uint8_t* data, size_t length)
        : data_(data), length_(length), offset_(0) {}

    bool atEnd() const { return offset_ >= length_; }
    size_t offset() const { return offset_; }
    size_t remaining() const { return length_ - offset_; }

    uint8_t peekTag() const;

    /**
     * @brief Read a tag and length header, checking the tag.
     * @return The content length, guaranteed to fit in the buffer.
     */
    size_t expect(uint8_t tag);

    /**
     * @brief Read any tag and its length header.
     */
    size_t readHeader(uint8_t& tag);

    /**
     * @brief Return a sub-reader over the next @p length bytes and skip them.
     */
    Reader sub(size_t length);

    const uint8_t* current() const { return data_ + offset_; }
    void skip(size_t length);

    int32_t readInteger();
    std::string readOctetString();
    std::string readOid();

private:
    const uint8_t* data_;
    size_t length_;
    size_t offset_;

    uint8_t readByte();
    size_t readLength();
};

}  // namespace ber
}  // namespace snmp
}  // namespace qlnet

/**
 * @file ber.cpp
 * @brief BER encoding and bounds-checked decoding.
 *
 * @copyright Copyright (c) 2024 qlnet Contributors
 * @license MIT License
 */

#include "qlnet/snmp/ber.hpp"

#include <limits>
#include <sstream>

namespace qlnet {
namespace snmp {
namespace ber {

namespace {

void appendBase128(Bytes& out, uint32_t value) {
    uint8_t groups[5];
    int count = 0;
    do {
        groups[count++] = static_cast<uint8_t>(value & 0x7F);
        value >>= 7;
    } while (value > 0);

    while (count > 1) {
        out.push_back(static_cast<uint8_t>(groups[--count] | 0x80));
    }
    out.push_back(groups[0]);
}

std::vector<uint32_t> parseOidString(const std::string& dotted) {
    std::vector<uint32_t> arcs;
    std::istringstream stream(dotted);
    std::string part;

    while (std::getline(stream, part, '.')) {
        if (part.empty() || part.find_first_not_of("0123456789") != std::string::npos) {
            throw BerError("invalid OID arc '" + part + "' in " + dotted);
        }
        unsigned long arc = 0;
        try {
            arc = std::stoul(part);
        } catch (const std::out_of_range&) {
            throw BerError("OID arc out of range in " + dotted);
        }
        if (arc > std::numeric_limits<uint32_t>::max()) {
            throw BerError("OID arc out of range in " + dotted);
        }
        arcs.push_back(static_cast<uint32_t>(arc));
    }

    if (arcs.size() < 2) {
        throw BerError("OID needs at least two arcs: " + dotted);
    }
    if (arcs[0] > 2 || (arcs[0] < 2 && arcs[1] >= 40)) {
        throw BerError("invalid leading OID arcs in " + dotted);
    }
    return arcs;
}

}  // namespace

void appendLength(Bytes& out, size_t length) {
    if (length < 0x80) {
        out.push_back(static_cast<uint8_t>(length));
        return;
    }

    uint8_t octets[sizeof(size_t)];
    int count = 0;
    while (length > 0) {
        octets[count++] = static_cast<uint8_t>(length & 0xFF);
        length >>= 8;
    }
    out.push_back(static_cast<uint8_t>(0x80 | count));
    while (count > 0) {
        out.push_back(octets[--count]);
    }
}

void appendTlv(Bytes& out, uint8_t tag, const uint8_t* value, size_t length) {
    out.push_back(tag);
    appendLength(out, length);
    out.insert(out.end(), value, value + length);
}

void appendInteger(Bytes& out, int32_t value) {
    uint32_t raw = static_cast<uint32_t>(value);
    Bytes octets = {
        static_cast<uint8_t>(raw >> 24),
        static_cast<uint8_t>(raw >> 16),
        static_cast<uint8_t>(raw >> 8),
        static_cast<uint8_t>(raw)
    };

    // Drop redundant sign octets; the first kept octet carries the sign bit.
    size_t start = 0;
    while (start < 3) {
        bool redundantZero = octets[start] == 0x00 && !(octets[start + 1] & 0x80);
        bool redundantOnes = octets[start] == 0xFF && (octets[start + 1] & 0x80);
        if (!redundantZero && !redundantOnes) {
            break;
        }
        ++start;
    }

    appendTlv(out, TAG_INTEGER, octets.data() + start, octets.size() - start);
}

void appendOctetString(Bytes& out, const std::string& value) {
    appendTlv(out, TAG_OCTET_STRING,
              reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

void appendNull(Bytes& out) {
    out.push_back(TAG_NULL);
    out.push_back(0x00);
}

void appendOid(Bytes& out, const std::string& dotted) {
    auto arcs = parseOidString(dotted);

    Bytes content;
    appendBase128(content, arcs[0] * 40 + arcs[1]);
    for (size_t i = 2; i < arcs.size(); ++i) {
        appendBase128(content, arcs[i]);
    }

    appendTlv(out, TAG_OID, content);
}

std::string decodeOid(const uint8_t* data, size_t length) {
    if (length == 0) {
        throw BerError("empty OID");
    }

    std::ostringstream oss;
    bool first = true;
    uint32_t value = 0;
    bool inArc = false;

    for (size_t i = 0; i < length; ++i) {
        if (value > (std::numeric_limits<uint32_t>::max() >> 7)) {
            throw BerError("OID arc overflow");
        }
        value = (value << 7) | (data[i] & 0x7F);
        inArc = true;

        if (data[i] & 0x80) {
            continue;
        }

        if (first) {
            if (value < 40) {
                oss << "0." << value;
            } else if (value < 80) {
                oss << "1." << (value - 40);
            } else {
                oss << "2." << (value - 80);
            }
            first = false;
        } else {
            oss << "." << value;
        }
        value = 0;
        inArc = false;
    }

    if (inArc) {
        throw BerError("truncated OID arc");
    }
    return oss.str();
}

int32_t decodeInteger(const uint8_t* data, size_t length) {
    if (length == 0 || length > 4) {
        throw BerError("unsupported INTEGER length " + std::to_string(length));
    }

    // Sign-extend from the first octet.
    uint32_t raw = (data[0] & 0x80) ? 0xFFFFFFFFu : 0u;
    for (size_t i = 0; i < length; ++i) {
        raw = (raw << 8) | data[i];
    }
    return static_cast<int32_t>(raw);
}

uint8_t Reader::readByte() {
    if (offset_ >= length_) {
        throw BerError("unexpected end of data at offset " + std::to_string(offset_));
    }
    return data_[offset_++];
}

size_t Reader::readLength() {
    uint8_t first = readByte();
    if (first < 0x80) {
        return first;
    }

    size_t count = first & 0x7F;
    if (count == 0) {
        throw BerError("indefinite length is not supported");
    }
    if (count > 4) {
        throw BerError("length field too long");
    }

    size_t length = 0;
    for (size_t i = 0; i < count; ++i) {
        length = (length << 8) | readByte();
    }
    return length;
}

uint8_t Reader::peekTag() const {
    if (offset_ >= length_) {
        throw BerError("unexpected end of data at offset " + std::to_string(offset_));
    }
    return data_[offset_];
}

size_t Reader::readHeader(uint8_t& tag) {
    tag = readByte();
    size_t length = readLength();
    if (length > remaining()) {
        throw BerError("element length " + std::to_string(length) +
                       " exceeds remaining " + std::to_string(remaining()));
    }
    return length;
}

size_t Reader::expect(uint8_t tag) {
    uint8_t actual = 0;
    size_t length = readHeader(actual);
    if (actual != tag) {
        std::ostringstream oss;
        oss << "expected tag 0x" << std::hex << static_cast<int>(tag)
            << ", got 0x" << static_cast<int>(actual);
        throw BerError(oss.str());
    }
    return length;
}

Reader Reader::sub(size_t length) {
    if (length > remaining()) {
        throw BerError("sub-element exceeds buffer");
    }
    Reader child(data_ + offset_, length);
    offset_ += length;
    return child;
}

void Reader::skip(size_t length) {
    if (length > remaining()) {
        throw BerError("skip exceeds buffer");
    }
    offset_ += length;
}

int32_t Reader::readInteger() {
    size_t length = expect(TAG_INTEGER);
    int32_t value = decodeInteger(current(), length);
    offset_ += length;
    return value;
}

std::string Reader::readOctetString() {
    size_t length = expect(TAG_OCTET_STRING);
    std::string value(reinterpret_cast<const char*>(current()), length);
    offset_ += length;
    return value;
}

std::string Reader::readOid() {
    size_t length = expect(TAG_OID);
    std::string value = decodeOid(current(), length);
    offset_ += length;
    return value;
}

}  // namespace ber
}  // namespace snmp
}  // namespace qlnet

/**
 * @file test_ber.cpp
 * @brief Unit tests for BER encoding and the bounded reader
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <qlnet/snmp/ber.hpp>

using namespace qlnet::snmp;
using ::testing::ElementsAre;

class BerTest : public ::testing::Test {
protected:
    Bytes out_;
};

// =============================================================================
// Lengths
// =============================================================================

TEST_F(BerTest, ShortFormLength) {
    ber::appendLength(out_, 0x7F);
    EXPECT_THAT(out_, ElementsAre(0x7F));
}

TEST_F(BerTest, LongFormLength) {
    ber::appendLength(out_, 0x80);
    ber::appendLength(out_, 0x0102);
    EXPECT_THAT(out_, ElementsAre(0x81, 0x80, 0x82, 0x01, 0x02));
}

TEST_F(BerTest, ReaderAcceptsLongFormLength) {
    Bytes content(200, 0xAA);
    ber::appendTlv(out_, ber::TAG_OCTET_STRING, content);

    ber::Reader reader(out_.data(), out_.size());
    std::string value = reader.readOctetString();
    EXPECT_EQ(value.size(), 200u);
    EXPECT_TRUE(reader.atEnd());
}

TEST_F(BerTest, ReaderRejectsIndefiniteLength) {
    Bytes data = {0x30, 0x80, 0x00, 0x00};
    ber::Reader reader(data.data(), data.size());
    EXPECT_THROW(reader.expect(ber::TAG_SEQUENCE), ber::BerError);
}

// =============================================================================
// INTEGER
// =============================================================================

TEST_F(BerTest, IntegerMinimalEncoding) {
    ber::appendInteger(out_, 0);
    ber::appendInteger(out_, 127);
    ber::appendInteger(out_, 128);
    ber::appendInteger(out_, 256);
    EXPECT_THAT(out_, ElementsAre(0x02, 0x01, 0x00,
                                  0x02, 0x01, 0x7F,
                                  0x02, 0x02, 0x00, 0x80,
                                  0x02, 0x02, 0x01, 0x00));
}

TEST_F(BerTest, NegativeIntegerEncoding) {
    ber::appendInteger(out_, -1);
    ber::appendInteger(out_, -129);
    EXPECT_THAT(out_, ElementsAre(0x02, 0x01, 0xFF,
                                  0x02, 0x02, 0xFF, 0x7F));
}

TEST_F(BerTest, IntegerExtremesDecode) {
    ber::appendInteger(out_, INT32_MAX);
    ber::appendInteger(out_, INT32_MIN);

    ber::Reader reader(out_.data(), out_.size());
    EXPECT_EQ(reader.readInteger(), INT32_MAX);
    EXPECT_EQ(reader.readInteger(), INT32_MIN);
}

TEST_F(BerTest, DecodeIntegerRejectsOversizedContent) {
    uint8_t five[] = {0x01, 0x02, 0x03, 0x04, 0x05};
    EXPECT_THROW(ber::decodeInteger(five, sizeof(five)), ber::BerError);
    EXPECT_THROW(ber::decodeInteger(five, 0), ber::BerError);
}

// =============================================================================
// OBJECT IDENTIFIER
// =============================================================================

TEST_F(BerTest, OidEncoding) {
    ber::appendOid(out_, "1.3.6.1.2.1.1.6.0");
    EXPECT_THAT(out_, ElementsAre(0x06, 0x08, 0x2B, 0x06, 0x01, 0x02, 0x01, 0x01, 0x06, 0x00));
}

TEST_F(BerTest, OidMultiByteArc) {
    // 2435 = 0x983 -> 0x93 0x03
    ber::appendOid(out_, "1.3.6.1.4.1.2435");
    EXPECT_THAT(out_, ElementsAre(0x06, 0x07, 0x2B, 0x06, 0x01, 0x04, 0x01, 0x93, 0x03));
}

TEST_F(BerTest, OidDecodeMatchesEncode) {
    const std::string oid = "1.3.6.1.4.1.2435.3.3.9.1.6.1.0";
    ber::appendOid(out_, oid);

    ber::Reader reader(out_.data(), out_.size());
    EXPECT_EQ(reader.readOid(), oid);
}

TEST_F(BerTest, OidRejectsMalformedText) {
    EXPECT_THROW(ber::appendOid(out_, ""), ber::BerError);
    EXPECT_THROW(ber::appendOid(out_, "1"), ber::BerError);
    EXPECT_THROW(ber::appendOid(out_, "1..3"), ber::BerError);
    EXPECT_THROW(ber::appendOid(out_, "1.3.x"), ber::BerError);
    EXPECT_THROW(ber::appendOid(out_, "3.1"), ber::BerError);
    EXPECT_THROW(ber::appendOid(out_, "1.40"), ber::BerError);
}

TEST_F(BerTest, DecodeOidRejectsTruncatedArc) {
    uint8_t data[] = {0x2B, 0x93};
    EXPECT_THROW(ber::decodeOid(data, sizeof(data)), ber::BerError);
}

// =============================================================================
// Reader bounds
// =============================================================================

TEST_F(BerTest, NullEncoding) {
    ber::appendNull(out_);
    EXPECT_THAT(out_, ElementsAre(0x05, 0x00));
}

TEST_F(BerTest, ReaderRejectsLengthBeyondBuffer) {
    Bytes data = {0x04, 0x05, 'a', 'b'};
    ber::Reader reader(data.data(), data.size());
    EXPECT_THROW(reader.readOctetString(), ber::BerError);
}

TEST_F(BerTest, ReaderRejectsUnexpectedTag) {
    ber::appendNull(out_);
    ber::Reader reader(out_.data(), out_.size());
    EXPECT_THROW(reader.readInteger(), ber::BerError);
}

TEST_F(BerTest, ReaderRejectsEmptyInput) {
    ber::Reader reader(nullptr, 0);
    EXPECT_TRUE(reader.atEnd());
    EXPECT_THROW(reader.peekTag(), ber::BerError);
}

TEST_F(BerTest, SubReaderIsConfinedToItsElement) {
    Bytes inner;
    ber::appendInteger(inner, 7);
    ber::appendTlv(out_, ber::TAG_SEQUENCE, inner);
    ber::appendInteger(out_, 9);

    ber::Reader reader(out_.data(), out_.size());
    ber::Reader seq = reader.sub(reader.expect(ber::TAG_SEQUENCE));
    EXPECT_EQ(seq.readInteger(), 7);
    EXPECT_TRUE(seq.atEnd());
    EXPECT_THROW(seq.readInteger(), ber::BerError);
    EXPECT_EQ(reader.readInteger(), 9);
}

/**
 * @file test_device_identifier.cpp
 * @brief Unit tests for printer identifier parsing
 */

#include <gtest/gtest.h>
#include <qlnet/core/device_identifier.hpp>
#include <qlnet/core/errors.hpp>

#include <stdexcept>

using namespace qlnet::core;

TEST(DeviceIdentifierTest, ParsesHostAndPort) {
    auto id = DeviceIdentifier::parse("tcp://192.168.1.5:9101");
    EXPECT_EQ(id.host(), "192.168.1.5");
    EXPECT_EQ(id.port(), 9101);
}

TEST(DeviceIdentifierTest, DefaultsToPrinterPort) {
    auto id = DeviceIdentifier::parse("tcp://192.168.1.5");
    EXPECT_EQ(id.host(), "192.168.1.5");
    EXPECT_EQ(id.port(), DEFAULT_PRINTER_PORT);
    EXPECT_EQ(id.port(), 9100);
}

TEST(DeviceIdentifierTest, SchemeIsOptional) {
    auto id = DeviceIdentifier::parse("printer.local:631");
    EXPECT_EQ(id.host(), "printer.local");
    EXPECT_EQ(id.port(), 631);

    EXPECT_EQ(DeviceIdentifier::parse("10.0.0.2").port(), 9100);
}

TEST(DeviceIdentifierTest, EmptyPortMeansDefault) {
    auto id = DeviceIdentifier::parse("tcp://192.168.1.5:");
    EXPECT_EQ(id.host(), "192.168.1.5");
    EXPECT_EQ(id.port(), 9100);
    EXPECT_EQ(id.toString(), "tcp://192.168.1.5:9100");
}

TEST(DeviceIdentifierTest, SplitsOnLastColon) {
    auto id = DeviceIdentifier::parse("tcp://fe80::1:9100");
    EXPECT_EQ(id.host(), "fe80::1");
    EXPECT_EQ(id.port(), 9100);
}

TEST(DeviceIdentifierTest, ToStringIsCanonical) {
    EXPECT_EQ(DeviceIdentifier::parse("192.168.1.5").toString(), "tcp://192.168.1.5:9100");
    EXPECT_EQ(DeviceIdentifier::parse("tcp://host:1").toString(), "tcp://host:1");
}

TEST(DeviceIdentifierTest, Equality) {
    EXPECT_EQ(DeviceIdentifier::parse("tcp://a"), DeviceIdentifier("a", 9100));
    EXPECT_FALSE(DeviceIdentifier::parse("tcp://a:1") == DeviceIdentifier("a", 2));
}

TEST(DeviceIdentifierTest, RejectsEmptyHost) {
    EXPECT_THROW(DeviceIdentifier::parse(""), std::invalid_argument);
    EXPECT_THROW(DeviceIdentifier::parse("tcp://"), std::invalid_argument);
    EXPECT_THROW(DeviceIdentifier::parse("tcp://:9100"), std::invalid_argument);
    EXPECT_THROW(DeviceIdentifier("", 9100), std::invalid_argument);
}

TEST(DeviceIdentifierTest, RejectsBadPort) {
    EXPECT_THROW(DeviceIdentifier::parse("tcp://host:abc"), std::invalid_argument);
    EXPECT_THROW(DeviceIdentifier::parse("tcp://host:0"), std::invalid_argument);
    EXPECT_THROW(DeviceIdentifier::parse("tcp://host:65536"), std::invalid_argument);
    EXPECT_THROW(DeviceIdentifier::parse("tcp://host:-1"), std::invalid_argument);
    EXPECT_THROW(DeviceIdentifier::parse("tcp://host:123456"), std::invalid_argument);
}

TEST(DeviceIdentifierTest, RejectsOtherTransports) {
    EXPECT_THROW(DeviceIdentifier::parse("usb://0x04f9:0x209b"), UnsupportedOperation);
    EXPECT_THROW(DeviceIdentifier::parse("file:///dev/usb/lp0"), UnsupportedOperation);
}

TEST(DeviceIdentifierTest, UnsupportedOperationIsACoreError) {
    try {
        DeviceIdentifier::parse("udp://host");
        FAIL() << "expected UnsupportedOperation";
    } catch (const Error& e) {
        EXPECT_NE(std::string(e.what()).find("udp"), std::string::npos);
    }
}

/**
 * @file test_loopback_device.cpp
 * @brief Discovery and printer connections end to end over loopback
 *
 * A FakeSnmpAgent stands in for the printers' SNMP agents and a
 * TcpListener for their raw print port.
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <qlnet/core/device_connection.hpp>
#include <qlnet/core/discovery_scanner.hpp>
#include <qlnet/core/errors.hpp>
#include <qlnet/utils/logger.hpp>

#include "support/fake_snmp_agent.hpp"
#include "support/tcp_listener.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>

using namespace qlnet;
using namespace qlnet::core;
using ::testing::ElementsAre;

namespace {

using Clock = std::chrono::steady_clock;

snmp::SnmpConfig loopbackSnmp(const test::FakeSnmpAgent& agent) {
    snmp::SnmpConfig config;
    config.agent_port = agent.port();
    config.broadcast_addr = "127.0.0.1";
    config.tick_interval = std::chrono::milliseconds(20);
    return config;
}

}  // namespace

// =============================================================================
// Discovery
// =============================================================================

class LoopbackDiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().setLevel(utils::LogLevel::WARN);
        config_.max_wait = std::chrono::milliseconds(300);
    }

    DiscoveryConfig config_;
};

TEST_F(LoopbackDiscoveryTest, NoRespondersYieldsEmptyList) {
    test::FakeSnmpAgent::Options options;
    options.answer = false;
    test::FakeSnmpAgent agent(options);
    ASSERT_TRUE(agent.start());

    auto start = Clock::now();
    auto devices = listAvailableDevices(config_, loopbackSnmp(agent));
    auto elapsed = Clock::now() - start;

    EXPECT_TRUE(devices.empty());
    EXPECT_GE(elapsed, std::chrono::milliseconds(300));
    EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
}

TEST_F(LoopbackDiscoveryTest, ListsEveryResponder) {
    test::FakeSnmpAgent::Options options;
    options.responders = 3;
    test::FakeSnmpAgent agent(options);
    ASSERT_TRUE(agent.start());

    auto devices = listAvailableDevices(config_, loopbackSnmp(agent));

    ASSERT_EQ(devices.size(), 3u);
    std::vector<std::string> expected;
    for (uint16_t port : agent.responderPorts()) {
        expected.push_back("tcp://127.0.0.1:" + std::to_string(port));
    }
    std::sort(expected.begin(), expected.end());

    for (size_t i = 0; i < devices.size(); ++i) {
        EXPECT_EQ(devices[i].identifier, expected[i]);
        EXPECT_EQ(devices[i].instance, nullptr);
    }
}

TEST_F(LoopbackDiscoveryTest, DuplicateAnswersAreCoalesced) {
    test::FakeSnmpAgent::Options options;
    options.responders = 2;
    options.replies_per_responder = 4;
    test::FakeSnmpAgent agent(options);
    ASSERT_TRUE(agent.start());

    auto devices = listAvailableDevices(config_, loopbackSnmp(agent));

    EXPECT_EQ(devices.size(), 2u);
}

TEST_F(LoopbackDiscoveryTest, StopsAtResponseCap) {
    test::FakeSnmpAgent::Options options;
    options.responders = 12;
    test::FakeSnmpAgent agent(options);
    ASSERT_TRUE(agent.start());

    config_.max_wait = std::chrono::milliseconds(3000);
    auto start = Clock::now();
    auto devices = listAvailableDevices(config_, loopbackSnmp(agent));
    auto elapsed = Clock::now() - start;

    EXPECT_EQ(devices.size(), 10u);
    EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
}

TEST_F(LoopbackDiscoveryTest, BroadcastFailureRaisesIOError) {
    snmp::SnmpConfig snmpConfig;
    snmpConfig.broadcast_addr = "not-an-address";

    EXPECT_THROW(listAvailableDevices(config_, snmpConfig), IOError);
}

// =============================================================================
// Connections
// =============================================================================

class LoopbackDeviceTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().setLevel(utils::LogLevel::WARN);
        ASSERT_TRUE(listener_.start());
        options_.read_timeout = std::chrono::milliseconds(100);
    }

    std::string identifier() const {
        return "tcp://127.0.0.1:" + std::to_string(listener_.port());
    }

    test::TcpListener listener_;
    ConnectionOptions options_;
};

TEST_F(LoopbackDeviceTest, ReadsStatus) {
    test::FakeSnmpAgent agent;
    ASSERT_TRUE(agent.start());

    auto device = openDevice(identifier(), options_, loopbackSnmp(agent));
    EXPECT_THAT(device->read(), ElementsAre(0x80, 0x20, 0x42, 0x34));
}

TEST_F(LoopbackDeviceTest, ReadTruncatesToMaxLength) {
    test::FakeSnmpAgent agent;
    ASSERT_TRUE(agent.start());

    auto device = openDevice(identifier(), options_, loopbackSnmp(agent));
    EXPECT_THAT(device->read(2), ElementsAre(0x80, 0x20));
}

TEST_F(LoopbackDeviceTest, SingleTimeoutReturnsEmptyAfterReadTimeout) {
    test::FakeSnmpAgent::Options agentOptions;
    agentOptions.answer = false;
    test::FakeSnmpAgent agent(agentOptions);
    ASSERT_TRUE(agent.start());

    auto device = openDevice(identifier(), options_, loopbackSnmp(agent));

    auto start = Clock::now();
    EXPECT_TRUE(device->read().empty());
    auto elapsed = Clock::now() - start;

    EXPECT_GE(elapsed, std::chrono::milliseconds(90));
    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
    EXPECT_EQ(agent.requestsSeen(), 1);
}

TEST_F(LoopbackDeviceTest, SingleTimeoutDoesNotRetry) {
    test::FakeSnmpAgent::Options agentOptions;
    agentOptions.drop_first = 1;
    test::FakeSnmpAgent agent(agentOptions);
    ASSERT_TRUE(agent.start());

    auto device = openDevice(identifier(), options_, loopbackSnmp(agent));
    EXPECT_TRUE(device->read().empty());
    EXPECT_THAT(device->read(), ElementsAre(0x80, 0x20, 0x42, 0x34));
}

TEST_F(LoopbackDeviceTest, TryTwiceRecoversFromOneLostAnswer) {
    test::FakeSnmpAgent::Options agentOptions;
    agentOptions.drop_first = 1;
    test::FakeSnmpAgent agent(agentOptions);
    ASSERT_TRUE(agent.start());

    options_.strategy = ConnectionStrategy::TRY_TWICE;
    auto device = openDevice(identifier(), options_, loopbackSnmp(agent));

    EXPECT_THAT(device->read(), ElementsAre(0x80, 0x20, 0x42, 0x34));
    EXPECT_EQ(agent.requestsSeen(), 2);
}

TEST_F(LoopbackDeviceTest, TryTwiceGivesUpAfterTwoAttempts) {
    test::FakeSnmpAgent::Options agentOptions;
    agentOptions.answer = false;
    test::FakeSnmpAgent agent(agentOptions);
    ASSERT_TRUE(agent.start());

    options_.strategy = ConnectionStrategy::TRY_TWICE;
    auto device = openDevice(identifier(), options_, loopbackSnmp(agent));

    auto start = Clock::now();
    EXPECT_TRUE(device->read().empty());
    auto elapsed = Clock::now() - start;

    EXPECT_GE(elapsed, std::chrono::milliseconds(180));
    EXPECT_EQ(agent.requestsSeen(), 2);
}

TEST_F(LoopbackDeviceTest, NonBlockingPollEventuallyReturnsStatus) {
    test::FakeSnmpAgent::Options agentOptions;
    agentOptions.delay = std::chrono::milliseconds(50);
    test::FakeSnmpAgent agent(agentOptions);
    ASSERT_TRUE(agent.start());

    options_.strategy = ConnectionStrategy::NON_BLOCKING_POLL;
    auto device = openDevice(identifier(), options_, loopbackSnmp(agent));

    EXPECT_TRUE(device->read().empty());

    std::vector<uint8_t> status;
    auto deadline = Clock::now() + std::chrono::seconds(2);
    while (status.empty() && Clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        status = device->read();
    }

    EXPECT_THAT(status, ElementsAre(0x80, 0x20, 0x42, 0x34));
    EXPECT_EQ(agent.requestsSeen(), 1);
}

TEST_F(LoopbackDeviceTest, WriteDeliversBytesThenReadsStatus) {
    test::FakeSnmpAgent agent;
    ASSERT_TRUE(agent.start());

    auto device = openDevice(identifier(), options_, loopbackSnmp(agent));
    std::vector<uint8_t> invalidate(200, 0x00);
    std::vector<uint8_t> initialize = {0x1B, 0x40};

    device->write(invalidate);
    device->write(initialize);

    ASSERT_TRUE(listener_.waitForBytes(202, std::chrono::seconds(2)));
    auto received = listener_.received();
    EXPECT_EQ(received.size(), 202u);
    EXPECT_EQ(received[200], 0x1B);
    EXPECT_EQ(received[201], 0x40);

    EXPECT_THAT(device->read(), ElementsAre(0x80, 0x20, 0x42, 0x34));
}

TEST_F(LoopbackDeviceTest, DisposeClosesConnection) {
    test::FakeSnmpAgent agent;
    ASSERT_TRUE(agent.start());

    auto device = openDevice(identifier(), options_, loopbackSnmp(agent));
    device->dispose();

    EXPECT_TRUE(listener_.waitForPeerClose(std::chrono::seconds(2)));
    EXPECT_THROW(device->write({0x00}), IOError);
    EXPECT_THROW(device->read(), IOError);
    EXPECT_NO_THROW(device->dispose());
}

TEST_F(LoopbackDeviceTest, RefusedConnectionRaisesConnectionError) {
    uint16_t port = listener_.port();
    listener_.stop();

    EXPECT_THROW(openDevice("tcp://127.0.0.1:" + std::to_string(port), options_),
                 ConnectionError);
}

TEST_F(LoopbackDeviceTest, UnresolvableHostRaisesConnectionError) {
    EXPECT_THROW(openDevice("tcp://host.invalid:9100", options_), ConnectionError);
}

TEST_F(LoopbackDeviceTest, OtherTransportsAreUnsupported) {
    EXPECT_THROW(openDevice("usb://0x04f9:0x209b", options_), UnsupportedOperation);
}

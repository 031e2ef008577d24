/**
 * @file test_udp_socket.cpp
 * @brief Unit tests for UDP socket abstraction
 */

#include <gtest/gtest.h>
#include <qlnet/net/udp_socket.hpp>

#include <chrono>
#include <cstring>
#include <thread>

using namespace qlnet::net;

class UdpSocketTest : public ::testing::Test {
protected:
    SocketInitializer sockets_;
};

TEST_F(UdpSocketTest, CreateAndClose) {
    UdpSocket socket;
    EXPECT_TRUE(socket.isValid());

    socket.close();
    EXPECT_FALSE(socket.isValid());

    // Second close is harmless
    socket.close();
    EXPECT_FALSE(socket.isValid());
}

TEST_F(UdpSocketTest, BindToEphemeralPort) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0, "127.0.0.1"));
    EXPECT_NE(socket.getLocalPort(), 0);
}

TEST_F(UdpSocketTest, BindRejectsInvalidAddress) {
    UdpSocket socket;
    EXPECT_FALSE(socket.bind(0, "not-an-address"));
}

TEST_F(UdpSocketTest, SendReceiveLoopback) {
    UdpSocket sender;
    UdpSocket receiver;
    ASSERT_TRUE(receiver.bind(0, "127.0.0.1"));
    ASSERT_TRUE(sender.bind(0, "127.0.0.1"));

    const char* message = "Hello, UDP!";
    int sent = sender.sendTo(SocketAddress("127.0.0.1", receiver.getLocalPort()),
                             message, std::strlen(message));
    EXPECT_EQ(sent, static_cast<int>(std::strlen(message)));

    char buffer[256];
    SocketAddress from;
    int received = receiver.receiveFrom(buffer, sizeof(buffer) - 1, 1000, from);

    ASSERT_GT(received, 0);
    buffer[received] = '\0';
    EXPECT_STREQ(buffer, message);
    EXPECT_EQ(from.ip, "127.0.0.1");
    EXPECT_EQ(from.port, sender.getLocalPort());
}

TEST_F(UdpSocketTest, ReceiveTimeout) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0, "127.0.0.1"));

    char buffer[256];
    SocketAddress from;

    auto start = std::chrono::steady_clock::now();
    int received = socket.receiveFrom(buffer, sizeof(buffer), 100, from);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    EXPECT_EQ(received, 0);
    EXPECT_GE(elapsed.count(), 90);  // Allow some tolerance
}

TEST_F(UdpSocketTest, ZeroTimeoutPollsWithoutBlocking) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0, "127.0.0.1"));

    char buffer[16];
    SocketAddress from;

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(socket.receiveFrom(buffer, sizeof(buffer), 0, from), 0);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::milliseconds(50));
}

TEST_F(UdpSocketTest, SendToInvalidAddressFails) {
    UdpSocket socket;
    const char data[] = {1, 2, 3};

    EXPECT_EQ(socket.sendTo(SocketAddress("999.1.1.1", 161), data, sizeof(data)), -1);
    EXPECT_NE(socket.getLastError(), 0);
}

TEST_F(UdpSocketTest, EnableBroadcast) {
    UdpSocket socket;
    EXPECT_TRUE(socket.setBroadcast(true));
    EXPECT_TRUE(socket.setBroadcast(false));
}

TEST_F(UdpSocketTest, OperationsOnClosedSocketFail) {
    UdpSocket socket;
    socket.close();

    char buffer[16];
    SocketAddress from;
    EXPECT_FALSE(socket.bind(0));
    EXPECT_FALSE(socket.setBroadcast(true));
    EXPECT_EQ(socket.sendTo(SocketAddress("127.0.0.1", 9), buffer, 1), -1);
    EXPECT_EQ(socket.receiveFrom(buffer, sizeof(buffer), 0, from), -1);
}

TEST_F(UdpSocketTest, MoveTransfersOwnership) {
    UdpSocket original;
    ASSERT_TRUE(original.bind(0, "127.0.0.1"));
    uint16_t port = original.getLocalPort();

    UdpSocket moved(std::move(original));
    EXPECT_FALSE(original.isValid());
    EXPECT_TRUE(moved.isValid());
    EXPECT_EQ(moved.getLocalPort(), port);
}

TEST(SocketAddressTest, ToStringAndEquality) {
    SocketAddress a("192.168.1.5", 161);
    SocketAddress b("192.168.1.5", 161);
    SocketAddress c("192.168.1.5", 162);

    EXPECT_EQ(a.toString(), "192.168.1.5:161");
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

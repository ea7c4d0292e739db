/**
 * @file test_udp_socket.cpp
 * @brief Unit tests for UDP socket abstraction
 */

#include <gtest/gtest.h>
#include <lumen/net/udp_socket.hpp>

#include <chrono>
#include <cstring>
#include <string>

using namespace lumen::net;

class UdpSocketTest : public ::testing::Test {
protected:
    SocketInitializer sockets_;

    void SetUp() override {
        ASSERT_TRUE(sockets_.isInitialized());
    }
};

TEST_F(UdpSocketTest, CreateAndClose) {
    UdpSocket socket;
    EXPECT_TRUE(socket.isValid());

    socket.close();
    EXPECT_FALSE(socket.isValid());

    // Idempotent
    socket.close();
    EXPECT_FALSE(socket.isValid());
}

TEST_F(UdpSocketTest, BindEphemeralPort) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0, "127.0.0.1"));
    EXPECT_NE(socket.getLocalPort(), 0);
}

TEST_F(UdpSocketTest, BindRejectsBadAddress) {
    UdpSocket socket;
    EXPECT_FALSE(socket.bind(0, "not-an-ip"));
}

TEST_F(UdpSocketTest, SendReceiveLoopback) {
    UdpSocket sender;
    UdpSocket receiver;
    ASSERT_TRUE(sender.bind(0, "127.0.0.1"));
    ASSERT_TRUE(receiver.bind(0, "127.0.0.1"));

    const char* message = "Hello, UDP!";
    int sent = sender.sendTo(SocketAddress("127.0.0.1", receiver.getLocalPort()),
                             message, std::strlen(message));
    EXPECT_EQ(sent, static_cast<int>(std::strlen(message)));

    char buffer[256];
    SocketAddress from;
    int received = receiver.receiveFrom(buffer, sizeof(buffer), 1000, from);

    ASSERT_GT(received, 0);
    EXPECT_EQ(std::string(buffer, static_cast<size_t>(received)), message);
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

TEST_F(UdpSocketTest, PollReturnsImmediately) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0, "127.0.0.1"));

    char buffer[16];
    SocketAddress from;
    EXPECT_EQ(socket.receiveFrom(buffer, sizeof(buffer), 0, from), 0);
}

TEST_F(UdpSocketTest, SendToInvalidAddressFails) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0));

    const char data[] = "x";
    EXPECT_EQ(socket.sendTo(SocketAddress("999.1.1.1", 4000), data, 1), -1);
    EXPECT_NE(socket.getLastError(), 0);
    EXPECT_FALSE(socket.getLastErrorString().empty());
}

TEST_F(UdpSocketTest, OperationsOnClosedSocketFail) {
    UdpSocket socket;
    socket.close();

    char buffer[16];
    SocketAddress from;
    EXPECT_FALSE(socket.bind(0));
    EXPECT_EQ(socket.sendTo(SocketAddress("127.0.0.1", 4000), "x", 1), -1);
    EXPECT_EQ(socket.receiveFrom(buffer, sizeof(buffer), 0, from), -1);
    EXPECT_EQ(socket.getLocalPort(), 0);
}

TEST_F(UdpSocketTest, EnableBroadcast) {
    UdpSocket socket;
    EXPECT_TRUE(socket.setBroadcast(true));
}

TEST_F(UdpSocketTest, MoveTransfersOwnership) {
    UdpSocket first;
    ASSERT_TRUE(first.bind(0, "127.0.0.1"));
    uint16_t port = first.getLocalPort();

    UdpSocket second(std::move(first));
    EXPECT_FALSE(first.isValid());
    EXPECT_TRUE(second.isValid());
    EXPECT_EQ(second.getLocalPort(), port);
}

TEST_F(UdpSocketTest, ResolveDottedQuad) {
    auto address = SocketAddress::resolve("10.1.2.3", 4000);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->ip, "10.1.2.3");
    EXPECT_EQ(address->port, 4000);
    EXPECT_EQ(address->toString(), "10.1.2.3:4000");
}

TEST_F(UdpSocketTest, ResolveLocalhost) {
    auto address = SocketAddress::resolve("localhost", 4000);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->ip.rfind("127.", 0), 0u);
}

TEST_F(UdpSocketTest, ResolveUnknownHostFails) {
    EXPECT_FALSE(SocketAddress::resolve("no-such-host.invalid", 4000).has_value());
}

/**
 * @file stftp_socket_test.cpp
 * @brief UDP socket wrapper and packet socket tests over loopback
 */

#include <gtest/gtest.h>
#include <stftp/stftp_socket.h>
#include <stftp/stftp_packet_socket.h>
#include <chrono>
#include <cstring>
#include <string>
#include <utility>

using namespace stftp;
using namespace stftp::net;

namespace {

constexpr const char* kLoopback = "127.0.0.1";

// Socket bound to an ephemeral loopback port
bool OpenLoopback(UdpSocket& socket, SocketAddress& bound) {
    return socket.Create() &&
           socket.Bind(SocketAddress(kLoopback, 0)) &&
           socket.GetLocalAddress(bound);
}

} // namespace

TEST(SocketAddressTest, DefaultIsAny) {
    SocketAddress addr;
    EXPECT_EQ(addr.GetIP(), "0.0.0.0");
    EXPECT_EQ(addr.GetPort(), 0);
}

TEST(SocketAddressTest, IpAndPort) {
    SocketAddress addr("192.168.1.20", 6969);
    EXPECT_EQ(addr.GetIP(), "192.168.1.20");
    EXPECT_EQ(addr.GetPort(), 6969);
    EXPECT_EQ(addr.ToString(), "192.168.1.20:6969");
}

TEST(SocketAddressTest, UnparsableIpMeansAny) {
    SocketAddress addr("not-an-ip", 69);
    EXPECT_EQ(addr.GetIP(), "0.0.0.0");
    EXPECT_EQ(addr.GetPort(), 69);
}

TEST(SocketAddressTest, EqualityAndWithPort) {
    SocketAddress a(kLoopback, 1000);
    SocketAddress b(kLoopback, 1000);
    EXPECT_EQ(a, b);

    SocketAddress c = a.WithPort(2000);
    EXPECT_NE(a, c);
    EXPECT_EQ(c.GetIP(), kLoopback);
    EXPECT_EQ(c.GetPort(), 2000);

    a.Set("10.0.0.1", 1000);
    EXPECT_NE(a, b);
}

TEST(SocketAddressTest, FromSockAddr) {
    SocketAddress original(kLoopback, 4242);
    SocketAddress copy(original.GetSockAddr());
    EXPECT_EQ(copy, original);
}

class UdpSocketTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(OpenLoopback(server_, server_addr_)) << server_.GetLastError();
        ASSERT_TRUE(OpenLoopback(client_, client_addr_)) << client_.GetLastError();
        ASSERT_TRUE(server_.SetReadTimeout(2000));
        ASSERT_TRUE(client_.SetReadTimeout(2000));
    }

    UdpSocket server_;
    UdpSocket client_;
    SocketAddress server_addr_;
    SocketAddress client_addr_;
};

TEST_F(UdpSocketTest, InvalidUntilCreated) {
    UdpSocket socket;
    EXPECT_FALSE(socket.IsValid());
    EXPECT_EQ(socket.GetNativeHandle(), kInvalidSocket);
    EXPECT_TRUE(socket.Create());
    EXPECT_TRUE(socket.IsValid());
    socket.Close();
    EXPECT_FALSE(socket.IsValid());
}

TEST_F(UdpSocketTest, EphemeralPortIsAssigned) {
    EXPECT_NE(server_addr_.GetPort(), 0);
    EXPECT_EQ(server_addr_.GetIP(), kLoopback);
}

TEST_F(UdpSocketTest, SendToAndReceiveFrom) {
    const char message[] = "ping";
    ASSERT_EQ(client_.SendTo(message, sizeof(message), server_addr_), static_cast<int>(sizeof(message)));

    char buffer[64] = {0};
    SocketAddress sender;
    int received = server_.ReceiveFrom(buffer, sizeof(buffer), sender);
    ASSERT_EQ(received, static_cast<int>(sizeof(message)));
    EXPECT_STREQ(buffer, "ping");
    EXPECT_EQ(sender, client_addr_);
}

TEST_F(UdpSocketTest, ConnectedSendAndReceive) {
    ASSERT_TRUE(client_.Connect(server_addr_));
    ASSERT_TRUE(server_.Connect(client_addr_));

    const char message[] = "pong";
    ASSERT_EQ(client_.Send(message, sizeof(message)), static_cast<int>(sizeof(message)));

    char buffer[64] = {0};
    ASSERT_EQ(server_.Receive(buffer, sizeof(buffer)), static_cast<int>(sizeof(message)));
    EXPECT_STREQ(buffer, "pong");
}

TEST_F(UdpSocketTest, ReceiveTimesOut) {
    ASSERT_TRUE(server_.SetReadTimeout(100));

    char buffer[16];
    SocketAddress sender;
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(server_.ReceiveFrom(buffer, sizeof(buffer), sender), -1);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(server_.TimedOut());
    EXPECT_FALSE(server_.GetLastError().empty());
    EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 50);
}

TEST_F(UdpSocketTest, MoveTransfersOwnership) {
    socket_t handle = server_.GetNativeHandle();
    UdpSocket moved(std::move(server_));
    EXPECT_TRUE(moved.IsValid());
    EXPECT_EQ(moved.GetNativeHandle(), handle);
    EXPECT_FALSE(server_.IsValid());

    UdpSocket assigned;
    assigned = std::move(moved);
    EXPECT_EQ(assigned.GetNativeHandle(), handle);
    EXPECT_FALSE(moved.IsValid());
}

TEST_F(UdpSocketTest, OperationsOnClosedSocketFail) {
    UdpSocket socket;
    char buffer[4] = {0};
    EXPECT_EQ(socket.SendTo(buffer, sizeof(buffer), server_addr_), -1);
    EXPECT_FALSE(socket.GetLastError().empty());
    EXPECT_FALSE(socket.Bind(SocketAddress(kLoopback, 0)));
}

class TftpSocketTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(server_.Open(SocketAddress(kLoopback, 0))) << server_.GetLastError();
        ASSERT_TRUE(client_.Open(SocketAddress(kLoopback, 0))) << client_.GetLastError();
        ASSERT_TRUE(server_.GetLocalAddress(server_addr_));
        ASSERT_TRUE(client_.GetLocalAddress(client_addr_));
        ASSERT_TRUE(server_.SetReadTimeout(2000));
        ASSERT_TRUE(client_.SetReadTimeout(2000));
    }

    TftpSocket server_;
    TftpSocket client_;
    SocketAddress server_addr_;
    SocketAddress client_addr_;
};

TEST_F(TftpSocketTest, UnconnectedSocketReportsSender) {
    ASSERT_TRUE(client_.SendPacketTo(Packet::CreateReadRequest("file.bin"), server_addr_));

    Packet packet;
    SocketAddress sender;
    ASSERT_EQ(server_.ReceivePacket(packet, &sender), ReceiveStatus::kOk);
    EXPECT_TRUE(packet.IsReadRequest());
    EXPECT_EQ(packet.GetFilename(), "file.bin");
    EXPECT_EQ(sender, client_addr_);
}

TEST_F(TftpSocketTest, ConnectedExchange) {
    ASSERT_TRUE(server_.Connect(client_addr_));
    ASSERT_TRUE(client_.Connect(server_addr_));

    const uint8_t payload[] = {'d', 'a', 't', 'a'};
    ASSERT_TRUE(server_.SendPacket(Packet::CreateData(1, payload, sizeof(payload))));

    Packet packet;
    SocketAddress sender;
    ASSERT_EQ(client_.ReceivePacket(packet, &sender), ReceiveStatus::kOk);
    EXPECT_EQ(packet.GetOpCode(), OpCode::kData);
    EXPECT_EQ(packet.GetBlockNumber(), 1);
    ASSERT_EQ(packet.GetDataSize(), sizeof(payload));
    EXPECT_EQ(std::memcmp(packet.GetData(), payload, sizeof(payload)), 0);
    EXPECT_EQ(sender, server_addr_);

    ASSERT_TRUE(client_.SendPacket(Packet::CreateAck(1)));
    ASSERT_EQ(server_.ReceivePacket(packet, nullptr), ReceiveStatus::kOk);
    EXPECT_EQ(packet.GetOpCode(), OpCode::kAcknowledge);
    EXPECT_EQ(packet.GetBlockNumber(), 1);
}

TEST_F(TftpSocketTest, SendDatagramPassesBytesThrough) {
    ASSERT_TRUE(client_.Connect(server_addr_));
    const uint8_t frame[] = {0, 4, 0, 9};
    ASSERT_TRUE(client_.SendDatagram(frame, sizeof(frame)));

    Packet packet;
    ASSERT_EQ(server_.ReceivePacket(packet, nullptr), ReceiveStatus::kOk);
    EXPECT_EQ(packet.GetOpCode(), OpCode::kAcknowledge);
    EXPECT_EQ(packet.GetBlockNumber(), 9);
}

TEST_F(TftpSocketTest, UnconnectedSendFails) {
    EXPECT_FALSE(client_.SendPacket(Packet::CreateAck(1)));
    EXPECT_EQ(client_.GetLastError(), "Socket is not connected");
}

TEST_F(TftpSocketTest, MalformedDatagram) {
    const uint8_t garbage[] = {0x00, 0x09, 0x41};
    ASSERT_TRUE(client_.Connect(server_addr_));
    ASSERT_TRUE(client_.SendDatagram(garbage, sizeof(garbage)));

    Packet packet;
    SocketAddress sender;
    EXPECT_EQ(server_.ReceivePacket(packet, &sender), ReceiveStatus::kMalformed);
    EXPECT_EQ(server_.GetLastError(), "Malformed datagram: InvalidOpcode");
    EXPECT_EQ(sender, client_addr_);
}

TEST_F(TftpSocketTest, ReceiveTimeout) {
    ASSERT_TRUE(server_.SetReadTimeout(100));
    Packet packet;
    EXPECT_EQ(server_.ReceivePacket(packet, nullptr), ReceiveStatus::kTimeout);
}

TEST_F(TftpSocketTest, CloseInvalidatesSocket) {
    EXPECT_TRUE(server_.IsOpen());
    server_.Close();
    EXPECT_FALSE(server_.IsOpen());

    Packet packet;
    EXPECT_EQ(server_.ReceivePacket(packet, nullptr), ReceiveStatus::kIoError);
}

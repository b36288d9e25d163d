/**
 * @file stftp_transfer_test.cpp
 * @brief Transfer state machine tests against a mocked packet socket
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <stftp/stftp_transfer.h>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using namespace stftp;
using ::testing::_;
using ::testing::DoAll;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SetArgReferee;

namespace {

class MockPacketSocket : public PacketSocket {
public:
    MOCK_METHOD(bool, SendPacket, (const Packet& packet), (override));
    MOCK_METHOD(bool, SendDatagram, (const uint8_t* data, size_t size), (override));
    MOCK_METHOD(ReceiveStatus, ReceivePacket, (Packet& packet, net::SocketAddress* sender), (override));
    MOCK_METHOD(std::string, GetLastError, (), (const, override));
};

// Matches a DATA frame by block number and payload
MATCHER_P2(IsDataFrame, block, payload, "") {
    const uint8_t* data = std::get<0>(arg);
    size_t size = std::get<1>(arg);
    if (size < kHeaderSize || data[0] != 0 || data[1] != 3) {
        return false;
    }
    uint16_t number = static_cast<uint16_t>((data[2] << 8) | data[3]);
    std::string body(reinterpret_cast<const char*>(data + kHeaderSize), size - kHeaderSize);
    return number == block && body == std::string(payload);
}

MATCHER_P(IsOptionAck, transfer_size, "") {
    return arg.GetOpCode() == OpCode::kOptionAck &&
           arg.GetAckOptions().transfer_size == static_cast<uint64_t>(transfer_size);
}

MATCHER_P(IsErrorPacket, code, "") {
    return arg.GetOpCode() == OpCode::kError && arg.GetErrorCode() == code;
}

// Source that fails after handing out `good_bytes`
class FailingByteSource : public ByteSource {
public:
    explicit FailingByteSource(size_t good_bytes) : remaining_(good_bytes) {}

    SourceRead Read(uint8_t* buffer, size_t size) override {
        SourceRead read;
        if (remaining_ == 0) {
            read.status = ReadStatus::kError;
            read.error = "media removed";
            return read;
        }
        read.bytes = std::min(size, remaining_);
        std::fill(buffer, buffer + read.bytes, 'f');
        remaining_ -= read.bytes;
        return read;
    }

private:
    size_t remaining_;
};

} // namespace

class TransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        socket_ = std::make_unique<NiceMock<MockPacketSocket>>();
        mock_ = socket_.get();
        ON_CALL(*mock_, SendPacket(_)).WillByDefault(Return(true));
        ON_CALL(*mock_, SendDatagram(_, _)).WillByDefault(Return(true));
        ON_CALL(*mock_, GetLastError()).WillByDefault(Return(std::string("mock socket error")));
    }

    std::unique_ptr<Transfer> MakeTransfer(const std::string& content,
                                           const AckOptions& options = AckOptions()) {
        return std::make_unique<Transfer>(std::move(socket_),
                                          std::make_unique<MemoryByteSource>(content),
                                          options);
    }

    void ExpectReply(const Packet& reply) {
        EXPECT_CALL(*mock_, ReceivePacket(_, _))
            .WillOnce(DoAll(SetArgReferee<0>(reply), Return(ReceiveStatus::kOk)))
            .RetiresOnSaturation();
    }

    std::unique_ptr<NiceMock<MockPacketSocket>> socket_;
    NiceMock<MockPacketSocket>* mock_ = nullptr;
};

TEST_F(TransferTest, SingleBlock) {
    {
        InSequence seq;
        EXPECT_CALL(*mock_, SendDatagram(_, _))
            .With(IsDataFrame(1, "hello"))
            .WillOnce(Return(true));
        EXPECT_CALL(*mock_, ReceivePacket(_, _))
            .WillOnce(DoAll(SetArgReferee<0>(Packet::CreateAck(1)), Return(ReceiveStatus::kOk)));
    }
    EXPECT_CALL(*mock_, SendPacket(_)).Times(0);

    auto transfer = MakeTransfer("hello");
    EXPECT_EQ(transfer->GetState(), TransferState::kStart);
    EXPECT_EQ(transfer->GetBlockSize(), kDefaultBlockSize);

    TransferResult result = transfer->Finish();
    EXPECT_TRUE(result.Ok()) << result.message;
    EXPECT_EQ(result.state, TransferState::kDone);
    EXPECT_EQ(result.bytes_sent, 5u);
    EXPECT_EQ(result.block, 1);
    EXPECT_EQ(transfer->GetState(), TransferState::kDone);
}

TEST_F(TransferTest, MultipleBlocksWithEmptyTerminalBlock) {
    AckOptions options;
    options.blocksize = 8;
    std::string content = "abcdefgh12345678";
    {
        InSequence seq;
        EXPECT_CALL(*mock_, SendPacket(_)).WillOnce(Return(true));
        EXPECT_CALL(*mock_, ReceivePacket(_, _))
            .WillOnce(DoAll(SetArgReferee<0>(Packet::CreateAck(0)), Return(ReceiveStatus::kOk)));
        EXPECT_CALL(*mock_, SendDatagram(_, _)).With(IsDataFrame(1, "abcdefgh")).WillOnce(Return(true));
        EXPECT_CALL(*mock_, ReceivePacket(_, _))
            .WillOnce(DoAll(SetArgReferee<0>(Packet::CreateAck(1)), Return(ReceiveStatus::kOk)));
        EXPECT_CALL(*mock_, SendDatagram(_, _)).With(IsDataFrame(2, "12345678")).WillOnce(Return(true));
        EXPECT_CALL(*mock_, ReceivePacket(_, _))
            .WillOnce(DoAll(SetArgReferee<0>(Packet::CreateAck(2)), Return(ReceiveStatus::kOk)));
        EXPECT_CALL(*mock_, SendDatagram(_, _)).With(IsDataFrame(3, "")).WillOnce(Return(true));
        EXPECT_CALL(*mock_, ReceivePacket(_, _))
            .WillOnce(DoAll(SetArgReferee<0>(Packet::CreateAck(3)), Return(ReceiveStatus::kOk)));
    }

    auto transfer = MakeTransfer(content, options);
    EXPECT_EQ(transfer->GetBlockSize(), 8);
    TransferResult result = transfer->Finish();
    EXPECT_TRUE(result.Ok()) << result.message;
    EXPECT_EQ(result.bytes_sent, content.size());
    EXPECT_EQ(result.block, 3);
}

TEST_F(TransferTest, TransferSizeOptionWaitsForAckZero) {
    AckOptions options;
    options.transfer_size = 5;
    {
        InSequence seq;
        EXPECT_CALL(*mock_, SendPacket(IsOptionAck(5))).WillOnce(Return(true));
        EXPECT_CALL(*mock_, ReceivePacket(_, _))
            .WillOnce(DoAll(SetArgReferee<0>(Packet::CreateAck(0)), Return(ReceiveStatus::kOk)));
        EXPECT_CALL(*mock_, SendDatagram(_, _)).With(IsDataFrame(1, "hello")).WillOnce(Return(true));
        EXPECT_CALL(*mock_, ReceivePacket(_, _))
            .WillOnce(DoAll(SetArgReferee<0>(Packet::CreateAck(1)), Return(ReceiveStatus::kOk)));
    }

    TransferResult result = MakeTransfer("hello", options)->Finish();
    EXPECT_TRUE(result.Ok()) << result.message;
    EXPECT_EQ(result.bytes_sent, 5u);
}

TEST_F(TransferTest, OptionAckAnsweredWithWrongBlock) {
    AckOptions options;
    options.transfer_size = 5;
    EXPECT_CALL(*mock_, SendPacket(IsOptionAck(5))).WillOnce(Return(true));
    ExpectReply(Packet::CreateAck(1));
    EXPECT_CALL(*mock_, SendDatagram(_, _)).Times(0);

    TransferResult result = MakeTransfer("hello", options)->Finish();
    EXPECT_EQ(result.status, TransferStatus::kAckMismatch);
    EXPECT_EQ(result.state, TransferState::kOptionNegotiation);
    EXPECT_EQ(result.block, 0);
    EXPECT_EQ(result.message, "Received Ack(1) while waiting on Ack(0)");
}

TEST_F(TransferTest, AckMismatchDuringStreaming) {
    ExpectReply(Packet::CreateAck(7));

    auto transfer = MakeTransfer("hello");
    TransferResult result = transfer->Finish();
    EXPECT_EQ(result.status, TransferStatus::kAckMismatch);
    EXPECT_EQ(result.state, TransferState::kStreaming);
    EXPECT_EQ(result.message, "Received Ack(7) while waiting on Ack(1)");
    EXPECT_EQ(result.bytes_sent, 0u);
    EXPECT_EQ(transfer->GetState(), TransferState::kError);
}

TEST_F(TransferTest, PeerErrorIsReportedVerbatim) {
    ExpectReply(Packet::CreateError(ErrorCode::kDiskFull, "no room left"));

    TransferResult result = MakeTransfer("hello")->Finish();
    EXPECT_EQ(result.status, TransferStatus::kPeerError);
    EXPECT_EQ(result.peer_error_code, ErrorCode::kDiskFull);
    EXPECT_EQ(result.message, "no room left");
}

TEST_F(TransferTest, UnnamedPeerErrorCodeIsKept) {
    ExpectReply(Packet::CreateError(static_cast<ErrorCode>(42), "custom"));

    TransferResult result = MakeTransfer("hello")->Finish();
    EXPECT_EQ(result.status, TransferStatus::kPeerError);
    EXPECT_EQ(static_cast<uint16_t>(result.peer_error_code), 42);
    EXPECT_EQ(result.message, "custom");
}

TEST_F(TransferTest, UnexpectedPacket) {
    const uint8_t payload[] = {1, 2, 3};
    ExpectReply(Packet::CreateData(1, payload, sizeof(payload)));

    TransferResult result = MakeTransfer("hello")->Finish();
    EXPECT_EQ(result.status, TransferStatus::kUnexpectedPacket);
    EXPECT_EQ(result.block, 1);
    EXPECT_NE(result.message.find("Data"), std::string::npos);
}

TEST_F(TransferTest, MalformedReply) {
    EXPECT_CALL(*mock_, ReceivePacket(_, _)).WillOnce(Return(ReceiveStatus::kMalformed));
    EXPECT_CALL(*mock_, GetLastError())
        .WillRepeatedly(Return(std::string("Malformed datagram: InvalidOpcode")));

    TransferResult result = MakeTransfer("hello")->Finish();
    EXPECT_EQ(result.status, TransferStatus::kMalformedReply);
    EXPECT_EQ(result.message, "Malformed datagram: InvalidOpcode");
}

TEST_F(TransferTest, ReceiveTimeoutIsTransportError) {
    EXPECT_CALL(*mock_, ReceivePacket(_, _)).WillOnce(Return(ReceiveStatus::kTimeout));

    TransferResult result = MakeTransfer("hello")->Finish();
    EXPECT_EQ(result.status, TransferStatus::kTransportIoError);
    EXPECT_EQ(result.message, "mock socket error");
}

TEST_F(TransferTest, ReceiveFailureIsTransportError) {
    EXPECT_CALL(*mock_, ReceivePacket(_, _)).WillOnce(Return(ReceiveStatus::kIoError));

    TransferResult result = MakeTransfer("hello")->Finish();
    EXPECT_EQ(result.status, TransferStatus::kTransportIoError);
}

TEST_F(TransferTest, SendFailureIsTransportError) {
    EXPECT_CALL(*mock_, SendDatagram(_, _)).WillOnce(Return(false));
    EXPECT_CALL(*mock_, ReceivePacket(_, _)).Times(0);

    TransferResult result = MakeTransfer("hello")->Finish();
    EXPECT_EQ(result.status, TransferStatus::kTransportIoError);
    EXPECT_EQ(result.state, TransferState::kStreaming);
    EXPECT_EQ(result.block, 1);
}

TEST_F(TransferTest, OptionAckSendFailure) {
    AckOptions options;
    options.blocksize = 1024;
    EXPECT_CALL(*mock_, SendPacket(_)).WillOnce(Return(false));
    EXPECT_CALL(*mock_, ReceivePacket(_, _)).Times(0);

    TransferResult result = MakeTransfer("hello", options)->Finish();
    EXPECT_EQ(result.status, TransferStatus::kTransportIoError);
    EXPECT_EQ(result.state, TransferState::kOptionNegotiation);
}

TEST_F(TransferTest, SourceErrorNotifiesPeer) {
    AckOptions options;
    options.blocksize = 8;
    {
        InSequence seq;
        EXPECT_CALL(*mock_, SendPacket(_)).WillOnce(Return(true));   // OACK
        EXPECT_CALL(*mock_, ReceivePacket(_, _))
            .WillOnce(DoAll(SetArgReferee<0>(Packet::CreateAck(0)), Return(ReceiveStatus::kOk)));
        EXPECT_CALL(*mock_, SendDatagram(_, _)).With(IsDataFrame(1, "ffffffff")).WillOnce(Return(true));
        EXPECT_CALL(*mock_, ReceivePacket(_, _))
            .WillOnce(DoAll(SetArgReferee<0>(Packet::CreateAck(1)), Return(ReceiveStatus::kOk)));
        EXPECT_CALL(*mock_, SendPacket(IsErrorPacket(ErrorCode::kNotDefined)))
            .WillOnce(Return(true));
    }

    Transfer transfer(std::move(socket_), std::make_unique<FailingByteSource>(8), options);
    TransferResult result = transfer.Finish();
    EXPECT_EQ(result.status, TransferStatus::kSourceIoError);
    EXPECT_EQ(result.state, TransferState::kStreaming);
    EXPECT_EQ(result.block, 2);
    EXPECT_EQ(result.message, "media removed");
    EXPECT_EQ(result.bytes_sent, 8u);
}

TEST_F(TransferTest, SourceErrorReportedEvenIfNotificationFails) {
    EXPECT_CALL(*mock_, SendPacket(IsErrorPacket(ErrorCode::kNotDefined))).WillOnce(Return(false));
    EXPECT_CALL(*mock_, SendDatagram(_, _)).Times(0);

    Transfer transfer(std::move(socket_), std::make_unique<FailingByteSource>(0), AckOptions());
    TransferResult result = transfer.Finish();
    EXPECT_EQ(result.status, TransferStatus::kSourceIoError);
    EXPECT_EQ(result.block, 1);
}

TEST_F(TransferTest, FinishTwiceThrows) {
    ExpectReply(Packet::CreateAck(1));

    auto transfer = MakeTransfer("x");
    EXPECT_TRUE(transfer->Finish().Ok());
    EXPECT_THROW(transfer->Finish(), StftpException);
}

TEST_F(TransferTest, NullArgumentsThrow) {
    EXPECT_THROW(Transfer(nullptr, std::make_unique<MemoryByteSource>(std::string("x")), AckOptions()),
                 StftpException);
    EXPECT_THROW(Transfer(std::move(socket_), nullptr, AckOptions()), StftpException);
}

TEST(NegotiateOptionsTest, NothingRequested) {
    AckOptions ack = NegotiateOptions(RequestOptions(), 100);
    EXPECT_TRUE(ack.IsEmpty());
}

TEST(NegotiateOptionsTest, BlockSizeIsClamped) {
    RequestOptions request;
    request.blocksize = 4096;

    EXPECT_EQ(NegotiateOptions(request, std::nullopt).blocksize, 4096);
    EXPECT_EQ(NegotiateOptions(request, std::nullopt, 1428).blocksize, 1428);
    EXPECT_EQ(NegotiateOptions(request, std::nullopt, 2).blocksize, kMinBlockSize);
}

TEST(NegotiateOptionsTest, TransferSizeNeedsKnownSize) {
    RequestOptions request;
    request.include_transfer_size = true;

    EXPECT_EQ(NegotiateOptions(request, 1234).transfer_size, 1234u);
    EXPECT_FALSE(NegotiateOptions(request, std::nullopt).transfer_size.has_value());
    EXPECT_TRUE(NegotiateOptions(request, std::nullopt).IsEmpty());

    RequestOptions no_probe;
    EXPECT_FALSE(NegotiateOptions(no_probe, 1234).transfer_size.has_value());
}

TEST(NegotiateOptionsTest, TimeoutIsEchoed) {
    RequestOptions request;
    request.timeout_seconds = 3;
    EXPECT_EQ(NegotiateOptions(request, std::nullopt).timeout_seconds, 3);
}

TEST(TransferNamesTest, StatusAndStateNames) {
    EXPECT_STREQ(TransferStatusToString(TransferStatus::kAckMismatch), "AckMismatch");
    EXPECT_STREQ(TransferStateToString(TransferState::kOptionNegotiation), "OptionNegotiation");
}

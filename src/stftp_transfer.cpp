#include "stftp/stftp_transfer.h"
#include "stftp/stftp_logger.h"
#include <algorithm>
#include <sstream>

namespace stftp {

namespace {
    constexpr const char* kSourceErrorMessage = "Unexpected IO error";

    std::unique_ptr<ByteSource> RequireSource(std::unique_ptr<ByteSource> source) {
        if (!source) {
            throw StftpException("Transfer requires a byte source");
        }
        return source;
    }
}

const char* TransferStateToString(TransferState state) {
    switch (state) {
        case TransferState::kStart: return "Start";
        case TransferState::kOptionNegotiation: return "OptionNegotiation";
        case TransferState::kStreaming: return "Streaming";
        case TransferState::kDone: return "Done";
        case TransferState::kError: return "Error";
        default: return "Unknown";
    }
}

const char* TransferStatusToString(TransferStatus status) {
    switch (status) {
        case TransferStatus::kSuccess: return "Success";
        case TransferStatus::kSourceIoError: return "SourceIoError";
        case TransferStatus::kTransportIoError: return "TransportIoError";
        case TransferStatus::kMalformedReply: return "MalformedReply";
        case TransferStatus::kPeerError: return "PeerError";
        case TransferStatus::kUnexpectedPacket: return "UnexpectedPacket";
        case TransferStatus::kAckMismatch: return "AckMismatch";
        default: return "Unknown";
    }
}

AckOptions NegotiateOptions(const RequestOptions& request,
                            std::optional<uint64_t> source_size,
                            uint16_t max_blocksize) {
    AckOptions ack;
    if (request.blocksize) {
        uint16_t limit = std::max(max_blocksize, kMinBlockSize);
        ack.blocksize = std::min(*request.blocksize, limit);
    }
    if (request.include_transfer_size && source_size) {
        ack.transfer_size = *source_size;
    }
    if (request.timeout_seconds) {
        ack.timeout_seconds = request.timeout_seconds;
    }
    return ack;
}

Transfer::Transfer(std::unique_ptr<PacketSocket> socket,
                   std::unique_ptr<ByteSource> source,
                   const AckOptions& options)
    : socket_(std::move(socket)),
      stream_(RequireSource(std::move(source)), options.blocksize.value_or(kDefaultBlockSize)),
      options_(options),
      state_(TransferState::kStart),
      consumed_(false) {
    if (!socket_) {
        throw StftpException("Transfer requires a socket");
    }
}

TransferResult Transfer::Finish() {
    if (consumed_) {
        throw StftpException("Transfer already finished");
    }
    consumed_ = true;

    TransferResult result;

    if (!options_.IsEmpty()) {
        state_ = TransferState::kOptionNegotiation;
        STFTP_DEBUG("Sending OACK (blksize: %u)", stream_.BlockSize());
        if (!socket_->SendPacket(Packet::CreateOptionAck(options_))) {
            result.status = TransferStatus::kTransportIoError;
            result.message = socket_->GetLastError();
            return Fail(std::move(result));
        }
        if (!AwaitAck(0, result)) {
            return Fail(std::move(result));
        }
    }

    state_ = TransferState::kStreaming;
    while (true) {
        const uint8_t* frame = nullptr;
        size_t frame_size = 0;
        BlockStatus block_status = stream_.NextRaw(frame, frame_size);
        if (block_status == BlockStatus::kFinished) {
            break;
        }
        if (block_status == BlockStatus::kIoError) {
            NotifySourceError();
            result.status = TransferStatus::kSourceIoError;
            result.block = stream_.LastBlock();
            result.message = stream_.GetLastError();
            return Fail(std::move(result));
        }

        if (!socket_->SendDatagram(frame, frame_size)) {
            result.status = TransferStatus::kTransportIoError;
            result.block = stream_.LastBlock();
            result.message = socket_->GetLastError();
            return Fail(std::move(result));
        }
        if (!AwaitAck(stream_.LastBlock(), result)) {
            return Fail(std::move(result));
        }
        result.bytes_sent += frame_size - kHeaderSize;
    }

    state_ = TransferState::kDone;
    result.state = state_;
    result.block = stream_.LastBlock();
    socket_.reset();
    STFTP_DEBUG("Transfer done: %llu bytes in %u byte blocks",
                static_cast<unsigned long long>(result.bytes_sent), stream_.BlockSize());
    return result;
}

bool Transfer::AwaitAck(uint16_t expected, TransferResult& result) {
    result.block = expected;

    Packet reply;
    ReceiveStatus status = socket_->ReceivePacket(reply, nullptr);
    switch (status) {
        case ReceiveStatus::kOk:
            break;
        case ReceiveStatus::kTimeout:
        case ReceiveStatus::kIoError:
            result.status = TransferStatus::kTransportIoError;
            result.message = socket_->GetLastError();
            return false;
        case ReceiveStatus::kMalformed:
            result.status = TransferStatus::kMalformedReply;
            result.message = socket_->GetLastError();
            return false;
    }

    switch (reply.GetOpCode()) {
        case OpCode::kAcknowledge:
            if (reply.GetBlockNumber() == expected) {
                return true;
            }
            result.status = TransferStatus::kAckMismatch;
            result.message = "Received Ack(" + std::to_string(reply.GetBlockNumber()) +
                             ") while waiting on Ack(" + std::to_string(expected) + ")";
            return false;
        case OpCode::kError:
            result.status = TransferStatus::kPeerError;
            result.peer_error_code = reply.GetErrorCode();
            result.message = reply.GetErrorMessage();
            return false;
        default: {
            std::ostringstream oss;
            oss << "Received unexpected " << reply.GetOpCode()
                << " packet while waiting on Ack(" << expected << ")";
            result.status = TransferStatus::kUnexpectedPacket;
            result.message = oss.str();
            return false;
        }
    }
}

TransferResult Transfer::Fail(TransferResult result) {
    result.state = state_;
    state_ = TransferState::kError;
    socket_.reset();

    if (result.status == TransferStatus::kPeerError) {
        STFTP_WARN("Peer aborted transfer in state %s at block %u: %s (%s)",
                   TransferStateToString(result.state), result.block,
                   ErrorCodeToString(result.peer_error_code).c_str(), result.message.c_str());
    } else {
        STFTP_WARN("Transfer failed in state %s at block %u: %s: %s",
                   TransferStateToString(result.state), result.block,
                   TransferStatusToString(result.status), result.message.c_str());
    }
    return result;
}

void Transfer::NotifySourceError() {
    // Best effort: the source error is what gets reported either way
    if (!socket_->SendPacket(Packet::CreateError(ErrorCode::kNotDefined, kSourceErrorMessage))) {
        STFTP_DEBUG("Could not notify peer of source error: %s", socket_->GetLastError().c_str());
    }
}

} // namespace stftp

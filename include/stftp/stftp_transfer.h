/**
 * @file stftp_transfer.h
 * @brief One read transfer: option acknowledgment, then lock-step DATA/ACK
 */

#ifndef STFTP_TRANSFER_H_
#define STFTP_TRANSFER_H_

#include "stftp/stftp_common.h"
#include "stftp/stftp_byte_source.h"
#include "stftp/stftp_datastream.h"
#include "stftp/stftp_options.h"
#include "stftp/stftp_packet_socket.h"
#include <memory>
#include <optional>
#include <string>

namespace stftp {

enum class TransferState {
    kStart,
    kOptionNegotiation,
    kStreaming,
    kDone,
    kError
};

// Why a transfer ended
enum class TransferStatus {
    kSuccess,
    kSourceIoError,       // reading the byte source failed; the peer was notified
    kTransportIoError,    // send or receive failed, including socket timeouts
    kMalformedReply,      // the peer sent a datagram that does not decode
    kPeerError,           // the peer sent an ERROR packet
    kUnexpectedPacket,    // the peer sent something other than ACK
    kAckMismatch          // the peer acknowledged the wrong block
};

STFTP_EXPORT const char* TransferStateToString(TransferState state);
STFTP_EXPORT const char* TransferStatusToString(TransferStatus status);

/**
 * @brief Outcome of Transfer::Finish
 *
 * For kPeerError, `peer_error_code` and `message` are the peer's code and
 * message exactly as received. For every other failure `message` describes
 * the cause.
 */
struct STFTP_EXPORT TransferResult {
    TransferStatus status = TransferStatus::kSuccess;
    TransferState state = TransferState::kDone;   // kDone, or the state that failed
    ErrorCode peer_error_code = ErrorCode::kNotDefined;
    std::string message;
    uint16_t block = 0;           // block that was being acknowledged
    uint64_t bytes_sent = 0;      // payload bytes acknowledged by the peer

    bool Ok() const { return status == TransferStatus::kSuccess; }
};

/**
 * @brief Decide which of a request's options to acknowledge
 *
 * blksize is acknowledged, clamped down to `max_blocksize`. tsize is
 * acknowledged with the real size only when the request asked for it and
 * the size is known. timeout is echoed. Unknown options are never
 * acknowledged.
 *
 * @param request Options of the read request
 * @param source_size Size of the data to be served, if known
 * @param max_blocksize Largest block size the server accepts
 * @return Options for the OACK; empty when nothing is acknowledged
 */
STFTP_EXPORT AckOptions NegotiateOptions(const RequestOptions& request,
                                         std::optional<uint64_t> source_size,
                                         uint16_t max_blocksize = kMaxBlockSize);

/**
 * @class Transfer
 * @brief Serves one byte source to one peer
 *
 * Nothing happens until Finish is called. Finish runs the whole transfer on
 * the calling thread and can only be called once; the socket is released
 * when it returns.
 *
 * Every block is sent exactly once. There is no retransmission: a lost
 * datagram surfaces as a socket timeout (kTransportIoError).
 */
class STFTP_EXPORT Transfer {
public:
    /**
     * @param socket Channel connected to the peer
     * @param source Data to serve
     * @param options Acknowledged options; the block size defaults to 512
     * @throws StftpException if socket or source is null
     */
    Transfer(std::unique_ptr<PacketSocket> socket,
             std::unique_ptr<ByteSource> source,
             const AckOptions& options);

    Transfer(const Transfer&) = delete;
    Transfer& operator=(const Transfer&) = delete;

    /**
     * @brief Run the transfer to completion
     * @return Success, or the classified failure
     * @throws StftpException if called more than once
     */
    TransferResult Finish();

    TransferState GetState() const { return state_; }
    const AckOptions& GetOptions() const { return options_; }
    uint16_t GetBlockSize() const { return stream_.BlockSize(); }

private:
    bool AwaitAck(uint16_t expected, TransferResult& result);
    TransferResult Fail(TransferResult result);
    void NotifySourceError();

    std::unique_ptr<PacketSocket> socket_;
    DataStream stream_;
    AckOptions options_;
    TransferState state_;
    bool consumed_;
};

} // namespace stftp

#endif // STFTP_TRANSFER_H_

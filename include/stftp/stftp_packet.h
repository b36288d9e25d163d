/**
 * @file stftp_packet.h
 * @brief TFTP packet definition, decoding and encoding
 */

#ifndef STFTP_PACKET_H_
#define STFTP_PACKET_H_

#include "stftp/stftp_common.h"
#include "stftp/stftp_options.h"
#include <string>
#include <cstdint>

namespace stftp {

/**
 * @class Packet
 * @brief One TFTP packet of any of the six opcodes
 *
 * Request filenames, error messages and the unrecognized option region are
 * copied out of the datagram at decode time. The payload of a DATA packet is
 * NOT copied: it points into the buffer that was decoded (or the buffer
 * passed to CreateData), which must outlive the packet.
 */
class STFTP_EXPORT Packet {
public:
    Packet() = default;

    OpCode GetOpCode() const { return op_code_; }

    // RRQ / WRQ
    bool IsReadRequest() const { return op_code_ == OpCode::kReadRequest; }
    bool IsWriteRequest() const { return op_code_ == OpCode::kWriteRequest; }
    bool IsRequest() const { return IsReadRequest() || IsWriteRequest(); }
    const std::string& GetFilename() const { return filename_; }
    const RequestOptions& GetRequestOptions() const { return request_options_; }

    // OACK
    const AckOptions& GetAckOptions() const { return ack_options_; }

    // RRQ / WRQ / OACK
    bool HasUnknownOptions() const { return !unknown_options_.empty(); }

    /**
     * @brief Iterate the options this library does not understand
     * @return Fresh iterator over this packet's option region
     */
    OptionIterator UnknownOptions() const;

    // DATA / ACK
    uint16_t GetBlockNumber() const { return block_number_; }

    // DATA
    const uint8_t* GetData() const { return data_; }
    size_t GetDataSize() const { return data_size_; }

    // ERROR
    ErrorCode GetErrorCode() const { return error_code_; }
    const std::string& GetErrorMessage() const { return error_message_; }

    /**
     * @brief Encode the packet into a caller supplied buffer
     *
     * On kBufferTooSmall nothing past `capacity` is touched, but the buffer may
     * hold a partial packet.
     *
     * @param buffer Destination
     * @param capacity Size of the destination
     * @param written Out: number of bytes of the encoded packet
     * @return Ok or kBufferTooSmall
     */
    PacketStatus Encode(uint8_t* buffer, size_t capacity, size_t& written) const;

    /**
     * @brief Decode a datagram
     * @param data Datagram bytes; DATA packets keep pointing into this buffer
     * @param size Datagram length
     * @param packet Out: decoded packet, untouched on failure
     * @return Ok, or the reason the datagram was rejected
     */
    static PacketStatus Decode(const uint8_t* data, size_t size, Packet& packet);

    // Packet creation
    static Packet CreateReadRequest(const std::string& filename,
                                    const RequestOptions& options = RequestOptions());
    static Packet CreateWriteRequest(const std::string& filename,
                                     const RequestOptions& options = RequestOptions());
    static Packet CreateData(uint16_t block_number, const uint8_t* data, size_t size);
    static Packet CreateAck(uint16_t block_number);
    static Packet CreateError(ErrorCode code, const std::string& message);

    // Only recognized options can be acknowledged, so there is no way to
    // construct an OACK carrying unknown options.
    static Packet CreateOptionAck(const AckOptions& options);

private:
    PacketStatus DecodeRequest(const uint8_t* data, size_t size);
    PacketStatus DecodeData(const uint8_t* data, size_t size);
    PacketStatus DecodeAck(const uint8_t* data, size_t size);
    PacketStatus DecodeError(const uint8_t* data, size_t size);
    PacketStatus DecodeOptionAck(const uint8_t* data, size_t size);

    OpCode op_code_ = OpCode::kReadRequest;
    uint16_t block_number_ = 0;
    ErrorCode error_code_ = ErrorCode::kNotDefined;
    std::string filename_;
    std::string error_message_;
    RequestOptions request_options_;
    AckOptions ack_options_;
    std::string unknown_options_;   // raw option region, kept only if it has unknown options
    const uint8_t* data_ = nullptr;
    size_t data_size_ = 0;
};

} // namespace stftp

#endif // STFTP_PACKET_H_

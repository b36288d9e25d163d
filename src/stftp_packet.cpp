#include "stftp/stftp_packet.h"
#include "stftp/stftp_logger.h"
#include "internal/stftp_wire.h"
#include <string_view>
#include <string>
#include <utility>

namespace stftp {

namespace {
    constexpr std::string_view kOctetMode = "octet";

    // name | 0 | decimal value | 0
    void WriteOption(internal::BoundedWriter& writer, std::string_view name, uint64_t value) {
        writer.PutText(name);
        writer.PutText(std::to_string(value));
    }
}

std::string ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::kNotDefined: return "Not defined, see error message (if any)";
        case ErrorCode::kFileNotFound: return "File not found";
        case ErrorCode::kAccessViolation: return "Access violation";
        case ErrorCode::kDiskFull: return "Disk full or allocation exceeded";
        case ErrorCode::kIllegalOperation: return "Illegal TFTP operation";
        case ErrorCode::kUnknownTransferId: return "Unknown transfer ID";
        case ErrorCode::kFileExists: return "File already exists";
        case ErrorCode::kNoSuchUser: return "No such user";
        default:
            return "Undefined error code (" + std::to_string(static_cast<uint16_t>(code)) + ")";
    }
}

const char* ParseErrorToString(ParseError error) {
    switch (error) {
        case ParseError::kNone: return "None";
        case ParseError::kBufferTooSmall: return "BufferTooSmall";
        case ParseError::kInvalidOpcode: return "InvalidOpcode";
        case ParseError::kBadFormatting: return "BadFormatting";
        case ParseError::kOptionRepeated: return "OptionRepeated";
        case ParseError::kInvalidBlockSize: return "InvalidBlockSize";
        default: return "Unknown";
    }
}

// Packet creation
Packet Packet::CreateReadRequest(const std::string& filename, const RequestOptions& options) {
    Packet packet;
    packet.op_code_ = OpCode::kReadRequest;
    packet.filename_ = filename;
    packet.request_options_ = options;
    return packet;
}

Packet Packet::CreateWriteRequest(const std::string& filename, const RequestOptions& options) {
    Packet packet;
    packet.op_code_ = OpCode::kWriteRequest;
    packet.filename_ = filename;
    packet.request_options_ = options;
    return packet;
}

Packet Packet::CreateData(uint16_t block_number, const uint8_t* data, size_t size) {
    Packet packet;
    packet.op_code_ = OpCode::kData;
    packet.block_number_ = block_number;
    packet.data_ = data;
    packet.data_size_ = size;
    return packet;
}

Packet Packet::CreateAck(uint16_t block_number) {
    Packet packet;
    packet.op_code_ = OpCode::kAcknowledge;
    packet.block_number_ = block_number;
    return packet;
}

Packet Packet::CreateError(ErrorCode code, const std::string& message) {
    Packet packet;
    packet.op_code_ = OpCode::kError;
    packet.error_code_ = code;
    packet.error_message_ = message;
    return packet;
}

Packet Packet::CreateOptionAck(const AckOptions& options) {
    Packet packet;
    packet.op_code_ = OpCode::kOptionAck;
    packet.ack_options_ = options;
    return packet;
}

OptionIterator Packet::UnknownOptions() const {
    if (unknown_options_.empty()) {
        return OptionIterator();
    }
    return OptionIterator(reinterpret_cast<const uint8_t*>(unknown_options_.data()),
                          unknown_options_.size());
}

PacketStatus Packet::Encode(uint8_t* buffer, size_t capacity, size_t& written) const {
    internal::BoundedWriter writer(buffer, capacity);
    writer.PutU16(static_cast<uint16_t>(op_code_));

    switch (op_code_) {
        case OpCode::kReadRequest:
        case OpCode::kWriteRequest: {
            // opcode | filename | 0 | mode | 0 | (option | 0 | value | 0)*
            writer.PutText(filename_);
            writer.PutText(kOctetMode);
            if (request_options_.blocksize) {
                WriteOption(writer, kOptionBlockSize, *request_options_.blocksize);
            }
            if (request_options_.include_transfer_size) {
                WriteOption(writer, kOptionTransferSize, 0);
            }
            if (request_options_.timeout_seconds) {
                WriteOption(writer, kOptionTimeout, *request_options_.timeout_seconds);
            }
            // Unknown options of a decoded request go back out unmodified
            OptionIterator unknown = UnknownOptions();
            UnknownOption option;
            while (unknown.Next(option) && option.status.Ok()) {
                writer.PutText(option.name);
                writer.PutText(option.value);
            }
            break;
        }
        case OpCode::kData:
            writer.PutU16(block_number_);
            writer.PutBytes(data_, data_size_);
            break;
        case OpCode::kAcknowledge:
            writer.PutU16(block_number_);
            break;
        case OpCode::kError:
            writer.PutU16(static_cast<uint16_t>(error_code_));
            writer.PutText(error_message_);
            break;
        case OpCode::kOptionAck:
            if (ack_options_.blocksize) {
                WriteOption(writer, kOptionBlockSize, *ack_options_.blocksize);
            }
            if (ack_options_.transfer_size) {
                WriteOption(writer, kOptionTransferSize, *ack_options_.transfer_size);
            }
            if (ack_options_.timeout_seconds) {
                WriteOption(writer, kOptionTimeout, *ack_options_.timeout_seconds);
            }
            break;
    }

    if (writer.Overflowed()) {
        STFTP_DEBUG("Encoding opcode %u needs more than %zu bytes",
                    static_cast<unsigned>(op_code_), capacity);
        written = 0;
        return PacketStatus::Failure(ParseError::kBufferTooSmall);
    }
    written = writer.Position();
    return PacketStatus::Success();
}

PacketStatus Packet::Decode(const uint8_t* data, size_t size, Packet& packet) {
    if (data == nullptr || size < 2) {
        STFTP_DEBUG("Datagram too small for opcode: size=%zu", size);
        return PacketStatus::Failure(ParseError::kBufferTooSmall);
    }

    uint16_t opcode_value = internal::ReadU16(data);
    if (opcode_value < static_cast<uint16_t>(OpCode::kReadRequest) ||
        opcode_value > static_cast<uint16_t>(OpCode::kOptionAck)) {
        STFTP_DEBUG("Invalid opcode value: %u", opcode_value);
        return PacketStatus::Failure(ParseError::kInvalidOpcode, opcode_value);
    }

    // Decode into a temporary so a failure leaves the caller's packet alone
    Packet decoded;
    decoded.op_code_ = static_cast<OpCode>(opcode_value);

    PacketStatus status;
    switch (decoded.op_code_) {
        case OpCode::kReadRequest:
        case OpCode::kWriteRequest:
            status = decoded.DecodeRequest(data, size);
            break;
        case OpCode::kData:
            status = decoded.DecodeData(data, size);
            break;
        case OpCode::kAcknowledge:
            status = decoded.DecodeAck(data, size);
            break;
        case OpCode::kError:
            status = decoded.DecodeError(data, size);
            break;
        case OpCode::kOptionAck:
            status = decoded.DecodeOptionAck(data, size);
            break;
    }

    if (!status.Ok()) {
        STFTP_DEBUG("Rejected %zu byte datagram (opcode %u): %s",
                    size, opcode_value, ParseErrorToString(status.error));
        return status;
    }
    packet = std::move(decoded);
    return status;
}

PacketStatus Packet::DecodeRequest(const uint8_t* data, size_t size) {
    const uint8_t* cursor = data + 2;
    const uint8_t* end = data + size;

    std::string_view filename;
    std::string_view mode;
    if (!internal::ScanText(cursor, end, filename) || !internal::ScanText(cursor, end, mode)) {
        return PacketStatus::Failure(ParseError::kBadFormatting);
    }
    if (!OptionNameEquals(mode, kOctetMode)) {
        STFTP_DEBUG("Unsupported transfer mode: %.*s", static_cast<int>(mode.size()), mode.data());
        return PacketStatus::Failure(ParseError::kBadFormatting);
    }

    size_t remaining = static_cast<size_t>(end - cursor);
    bool has_unknown = false;
    PacketStatus status = ParseRequestOptions(cursor, remaining, request_options_, has_unknown);
    if (!status.Ok()) {
        return status;
    }

    filename_.assign(filename.data(), filename.size());
    if (has_unknown) {
        unknown_options_.assign(reinterpret_cast<const char*>(cursor), remaining);
    }
    return status;
}

PacketStatus Packet::DecodeData(const uint8_t* data, size_t size) {
    if (size < kHeaderSize) {
        return PacketStatus::Failure(ParseError::kBufferTooSmall);
    }
    block_number_ = internal::ReadU16(data + 2);
    data_ = data + kHeaderSize;
    data_size_ = size - kHeaderSize;
    return PacketStatus::Success();
}

PacketStatus Packet::DecodeAck(const uint8_t* data, size_t size) {
    if (size < kHeaderSize) {
        return PacketStatus::Failure(ParseError::kBufferTooSmall);
    }
    block_number_ = internal::ReadU16(data + 2);
    return PacketStatus::Success();
}

PacketStatus Packet::DecodeError(const uint8_t* data, size_t size) {
    if (size < kHeaderSize) {
        return PacketStatus::Failure(ParseError::kBufferTooSmall);
    }
    error_code_ = static_cast<ErrorCode>(internal::ReadU16(data + 2));

    const uint8_t* cursor = data + kHeaderSize;
    std::string_view message;
    if (!internal::ScanText(cursor, data + size, message)) {
        return PacketStatus::Failure(ParseError::kBadFormatting);
    }
    error_message_.assign(message.data(), message.size());
    return PacketStatus::Success();
}

PacketStatus Packet::DecodeOptionAck(const uint8_t* data, size_t size) {
    const uint8_t* cursor = data + 2;
    size_t remaining = size - 2;
    bool has_unknown = false;
    PacketStatus status = ParseAckOptions(cursor, remaining, ack_options_, has_unknown);
    if (!status.Ok()) {
        return status;
    }
    if (has_unknown) {
        unknown_options_.assign(reinterpret_cast<const char*>(cursor), remaining);
    }
    return status;
}

} // namespace stftp

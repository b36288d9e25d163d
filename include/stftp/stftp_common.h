/**
 * @file stftp_common.h
 * @brief Common definitions for the TFTP protocol
 */

#ifndef STFTP_COMMON_H_
#define STFTP_COMMON_H_

#include <string>
#include <stdexcept>
#include <ostream>
#include <cstdint>
#include <cstddef>

// Symbol visibility for shared builds
#if defined(STFTP_SHARED_LIBRARY) && defined(__GNUC__)
    #define STFTP_EXPORT __attribute__((visibility("default")))
#else
    #define STFTP_EXPORT
#endif

namespace stftp {

// TFTP protocol constants
constexpr uint16_t kDefaultTftpPort = 69;
constexpr uint16_t kDefaultBlockSize = 512;
constexpr uint16_t kMinBlockSize = 8;          // RFC 2348
constexpr uint16_t kMaxBlockSize = 65464;      // RFC 2348
constexpr uint8_t kMinOptionTimeout = 1;       // RFC 2349
constexpr uint8_t kMaxOptionTimeout = 255;     // RFC 2349
constexpr size_t kHeaderSize = 4;              // opcode + block number / error code
constexpr size_t kMaxPacketSize = kHeaderSize + kMaxBlockSize;
constexpr size_t kReceiveBufferSize = 65536;   // largest UDP payload we accept
constexpr int kDefaultTimeout = 5;             // seconds, socket level

// Operation codes
enum class OpCode : uint16_t {
    kReadRequest = 1,
    kWriteRequest = 2,
    kData = 3,
    kAcknowledge = 4,
    kError = 5,
    kOptionAck = 6
};

// Error codes. Values outside the named set are valid on the wire.
enum class ErrorCode : uint16_t {
    kNotDefined = 0,
    kFileNotFound = 1,
    kAccessViolation = 2,
    kDiskFull = 3,
    kIllegalOperation = 4,
    kUnknownTransferId = 5,
    kFileExists = 6,
    kNoSuchUser = 7
};

// Codec failures
enum class ParseError : uint8_t {
    kNone = 0,
    kBufferTooSmall,
    kInvalidOpcode,
    kBadFormatting,
    kOptionRepeated,
    kInvalidBlockSize
};

/**
 * @brief Outcome of a decode or encode call
 *
 * `value` carries the offending opcode for kInvalidOpcode and the rejected
 * size for kInvalidBlockSize; it is zero otherwise.
 */
struct PacketStatus {
    ParseError error = ParseError::kNone;
    uint64_t value = 0;

    bool Ok() const { return error == ParseError::kNone; }

    static PacketStatus Success() { return PacketStatus(); }
    static PacketStatus Failure(ParseError error, uint64_t value = 0) {
        PacketStatus status;
        status.error = error;
        status.value = value;
        return status;
    }
};

// Custom exception class, used for API misuse only
class STFTP_EXPORT StftpException : public std::runtime_error {
public:
    explicit StftpException(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Human readable description of an error code
 * @param code Error code, named or not
 * @return Description text
 */
STFTP_EXPORT std::string ErrorCodeToString(ErrorCode code);

/**
 * @brief Check if the error code belongs to the named RFC 1350 set
 */
inline bool IsNamedErrorCode(ErrorCode code) {
    return static_cast<uint16_t>(code) <= static_cast<uint16_t>(ErrorCode::kNoSuchUser);
}

/**
 * @brief Name of a parse error kind
 */
STFTP_EXPORT const char* ParseErrorToString(ParseError error);

// Stream output operators for Google Test
inline std::ostream& operator<<(std::ostream& os, OpCode op_code) {
    switch (op_code) {
        case OpCode::kReadRequest: return os << "ReadRequest";
        case OpCode::kWriteRequest: return os << "WriteRequest";
        case OpCode::kData: return os << "Data";
        case OpCode::kAcknowledge: return os << "Acknowledge";
        case OpCode::kError: return os << "Error";
        case OpCode::kOptionAck: return os << "OptionAck";
        default: return os << "Unknown(" << static_cast<int>(op_code) << ")";
    }
}

inline std::ostream& operator<<(std::ostream& os, ErrorCode error_code) {
    switch (error_code) {
        case ErrorCode::kNotDefined: return os << "NotDefined";
        case ErrorCode::kFileNotFound: return os << "FileNotFound";
        case ErrorCode::kAccessViolation: return os << "AccessViolation";
        case ErrorCode::kDiskFull: return os << "DiskFull";
        case ErrorCode::kIllegalOperation: return os << "IllegalOperation";
        case ErrorCode::kUnknownTransferId: return os << "UnknownTransferId";
        case ErrorCode::kFileExists: return os << "FileExists";
        case ErrorCode::kNoSuchUser: return os << "NoSuchUser";
        default: return os << "Unknown(" << static_cast<int>(error_code) << ")";
    }
}

inline std::ostream& operator<<(std::ostream& os, ParseError error) {
    return os << ParseErrorToString(error);
}

} // namespace stftp

#endif // STFTP_COMMON_H_

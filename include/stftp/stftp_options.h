/**
 * @file stftp_options.h
 * @brief TFTP option extension (RFC 2347, 2348, 2349)
 */

#ifndef STFTP_OPTIONS_H_
#define STFTP_OPTIONS_H_

#include "stftp/stftp_common.h"
#include <optional>
#include <string_view>
#include <cstdint>

namespace stftp {

// Recognized option names, matched case-insensitively
constexpr std::string_view kOptionBlockSize = "blksize";
constexpr std::string_view kOptionTransferSize = "tsize";
constexpr std::string_view kOptionTimeout = "timeout";

/**
 * @brief Options proposed by a read or write request
 *
 * A request never carries a real transfer size: `include_transfer_size`
 * corresponds to "tsize" "0" on the wire, asking the responder for the size.
 */
struct STFTP_EXPORT RequestOptions {
    std::optional<uint16_t> blocksize;
    bool include_transfer_size = false;
    std::optional<uint8_t> timeout_seconds;

    bool IsEmpty() const {
        return !blocksize && !include_transfer_size && !timeout_seconds;
    }
};

/**
 * @brief Options a responder acknowledges in an OACK packet
 */
struct STFTP_EXPORT AckOptions {
    std::optional<uint16_t> blocksize;
    std::optional<uint64_t> transfer_size;
    std::optional<uint8_t> timeout_seconds;

    // An empty OACK is never sent; the transfer starts with data instead.
    bool IsEmpty() const {
        return !blocksize && !transfer_size && !timeout_seconds;
    }
};

/**
 * @brief One unrecognized option, or the error that stopped iteration
 */
struct STFTP_EXPORT UnknownOption {
    std::string_view name;
    std::string_view value;
    PacketStatus status;
};

/**
 * @class OptionIterator
 * @brief Lazy, one-shot walk over the unrecognized options of a packet
 *
 * The iterator keeps a cursor into the raw option region and skips
 * blksize/tsize/timeout. A malformed name/value pair is produced as an item
 * whose status is not Ok; iteration ends after it. Get a fresh iterator from
 * the packet to scan again.
 */
class STFTP_EXPORT OptionIterator {
public:
    OptionIterator() : cursor_(nullptr), end_(nullptr) {}
    OptionIterator(const uint8_t* data, size_t size)
        : cursor_(data), end_(data + size) {}

    /**
     * @brief Produce the next unrecognized option
     * @param option Out: the option, or an error item
     * @return false once the region is exhausted
     */
    bool Next(UnknownOption& option);

private:
    const uint8_t* cursor_;
    const uint8_t* end_;
};

/**
 * @brief Case-insensitive comparison of option names
 */
STFTP_EXPORT bool OptionNameEquals(std::string_view lhs, std::string_view rhs);

/**
 * @brief Parse the option region of a read or write request
 * @param data First byte after the mode field
 * @param size Bytes remaining in the datagram
 * @param options Out: recognized options
 * @param has_unknown Out: set when at least one unrecognized option exists
 * @return Ok, kBadFormatting, kOptionRepeated or kInvalidBlockSize
 */
STFTP_EXPORT PacketStatus ParseRequestOptions(const uint8_t* data, size_t size,
                                              RequestOptions& options, bool& has_unknown);

/**
 * @brief Parse the option region of an OACK packet
 * @param data First byte after the opcode
 * @param size Bytes remaining in the datagram
 * @param options Out: recognized options
 * @param has_unknown Out: set when at least one unrecognized option exists
 * @return Ok, kBadFormatting, kOptionRepeated or kInvalidBlockSize
 */
STFTP_EXPORT PacketStatus ParseAckOptions(const uint8_t* data, size_t size,
                                          AckOptions& options, bool& has_unknown);

} // namespace stftp

#endif // STFTP_OPTIONS_H_

#include "stftp/stftp_options.h"
#include "stftp/stftp_logger.h"
#include "internal/stftp_wire.h"
#include <charconv>
#include <cctype>
#include <string>

namespace stftp {

namespace {
    enum class OptionKind {
        kBlockSize,
        kTransferSize,
        kTimeout,
        kUnknown
    };

    OptionKind ClassifyOption(std::string_view name) {
        if (OptionNameEquals(name, kOptionBlockSize)) return OptionKind::kBlockSize;
        if (OptionNameEquals(name, kOptionTransferSize)) return OptionKind::kTransferSize;
        if (OptionNameEquals(name, kOptionTimeout)) return OptionKind::kTimeout;
        return OptionKind::kUnknown;
    }

    // Strict unsigned decimal: digits only, no sign, no whitespace
    bool ParseDecimal(std::string_view text, uint64_t& value) {
        if (text.empty()) {
            return false;
        }
        const char* first = text.data();
        const char* last = text.data() + text.size();
        auto result = std::from_chars(first, last, value);
        return result.ec == std::errc() && result.ptr == last;
    }

    // Pull the next name/value pair off the region
    PacketStatus NextPair(const uint8_t*& cursor, const uint8_t* end,
                          std::string_view& name, std::string_view& value) {
        if (!internal::ScanText(cursor, end, name) || !internal::ScanText(cursor, end, value)) {
            return PacketStatus::Failure(ParseError::kBadFormatting);
        }
        return PacketStatus::Success();
    }

    PacketStatus ParseBlockSize(std::string_view text, std::optional<uint16_t>& blocksize) {
        if (blocksize) {
            STFTP_DEBUG("Option blksize repeated");
            return PacketStatus::Failure(ParseError::kOptionRepeated);
        }
        uint64_t value = 0;
        if (!ParseDecimal(text, value)) {
            STFTP_DEBUG("Option blksize is not a number: '%.*s'",
                        static_cast<int>(text.size()), text.data());
            return PacketStatus::Failure(ParseError::kBadFormatting);
        }
        if (value < kMinBlockSize || value > kMaxBlockSize) {
            STFTP_DEBUG("Option blksize %llu outside %u..%u",
                        static_cast<unsigned long long>(value), kMinBlockSize, kMaxBlockSize);
            return PacketStatus::Failure(ParseError::kInvalidBlockSize, value);
        }
        blocksize = static_cast<uint16_t>(value);
        return PacketStatus::Success();
    }

    PacketStatus ParseTimeout(std::string_view text, std::optional<uint8_t>& timeout) {
        if (timeout) {
            STFTP_DEBUG("Option timeout repeated");
            return PacketStatus::Failure(ParseError::kOptionRepeated);
        }
        uint64_t value = 0;
        if (!ParseDecimal(text, value) || value < kMinOptionTimeout || value > kMaxOptionTimeout) {
            STFTP_DEBUG("Option timeout invalid: '%.*s'",
                        static_cast<int>(text.size()), text.data());
            return PacketStatus::Failure(ParseError::kBadFormatting);
        }
        timeout = static_cast<uint8_t>(value);
        return PacketStatus::Success();
    }
}

bool OptionNameEquals(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
            std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

bool OptionIterator::Next(UnknownOption& option) {
    while (cursor_ != nullptr && cursor_ < end_) {
        std::string_view name;
        std::string_view value;
        PacketStatus status = NextPair(cursor_, end_, name, value);
        if (!status.Ok()) {
            // Error item ends the iteration
            cursor_ = end_;
            option.name = std::string_view();
            option.value = std::string_view();
            option.status = status;
            return true;
        }
        if (ClassifyOption(name) != OptionKind::kUnknown) {
            continue;
        }
        option.name = name;
        option.value = value;
        option.status = PacketStatus::Success();
        return true;
    }
    return false;
}

PacketStatus ParseRequestOptions(const uint8_t* data, size_t size,
                                 RequestOptions& options, bool& has_unknown) {
    const uint8_t* cursor = data;
    const uint8_t* end = data + size;
    options = RequestOptions();
    has_unknown = false;

    while (cursor < end) {
        std::string_view name;
        std::string_view value;
        PacketStatus status = NextPair(cursor, end, name, value);
        if (!status.Ok()) {
            STFTP_DEBUG("Malformed request option at offset %zu", static_cast<size_t>(cursor - data));
            return status;
        }

        switch (ClassifyOption(name)) {
            case OptionKind::kBlockSize:
                status = ParseBlockSize(value, options.blocksize);
                break;
            case OptionKind::kTransferSize:
                // A request only probes for the size
                if (options.include_transfer_size) {
                    status = PacketStatus::Failure(ParseError::kOptionRepeated);
                } else if (value != "0") {
                    STFTP_DEBUG("Request tsize must be \"0\", got '%.*s'",
                                static_cast<int>(value.size()), value.data());
                    status = PacketStatus::Failure(ParseError::kBadFormatting);
                } else {
                    options.include_transfer_size = true;
                }
                break;
            case OptionKind::kTimeout:
                status = ParseTimeout(value, options.timeout_seconds);
                break;
            case OptionKind::kUnknown:
                STFTP_TRACE("Unrecognized request option '%.*s'",
                            static_cast<int>(name.size()), name.data());
                has_unknown = true;
                break;
        }
        if (!status.Ok()) {
            return status;
        }
    }
    return PacketStatus::Success();
}

PacketStatus ParseAckOptions(const uint8_t* data, size_t size,
                             AckOptions& options, bool& has_unknown) {
    const uint8_t* cursor = data;
    const uint8_t* end = data + size;
    options = AckOptions();
    has_unknown = false;

    while (cursor < end) {
        std::string_view name;
        std::string_view value;
        PacketStatus status = NextPair(cursor, end, name, value);
        if (!status.Ok()) {
            STFTP_DEBUG("Malformed OACK option at offset %zu", static_cast<size_t>(cursor - data));
            return status;
        }

        switch (ClassifyOption(name)) {
            case OptionKind::kBlockSize:
                status = ParseBlockSize(value, options.blocksize);
                break;
            case OptionKind::kTransferSize: {
                uint64_t transfer_size = 0;
                if (options.transfer_size) {
                    status = PacketStatus::Failure(ParseError::kOptionRepeated);
                } else if (!ParseDecimal(value, transfer_size)) {
                    status = PacketStatus::Failure(ParseError::kBadFormatting);
                } else {
                    options.transfer_size = transfer_size;
                }
                break;
            }
            case OptionKind::kTimeout:
                status = ParseTimeout(value, options.timeout_seconds);
                break;
            case OptionKind::kUnknown:
                has_unknown = true;
                break;
        }
        if (!status.Ok()) {
            return status;
        }
    }
    return PacketStatus::Success();
}

} // namespace stftp

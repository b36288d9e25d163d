/**
 * @file stftp_wire.h
 * @brief Low level readers and writers for TFTP wire fields
 */

#ifndef STFTP_WIRE_H_
#define STFTP_WIRE_H_

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <string_view>

namespace stftp {
namespace internal {

inline uint16_t ReadU16(const uint8_t* data) {
    return static_cast<uint16_t>((static_cast<uint16_t>(data[0]) << 8) | data[1]);
}

inline void WriteU16(uint8_t* data, uint16_t value) {
    data[0] = static_cast<uint8_t>(value >> 8);
    data[1] = static_cast<uint8_t>(value & 0xFF);
}

/**
 * @brief Scan one null-terminated text field
 *
 * Wire text is nominally netascii, but peers send plain ASCII or UTF-8, so
 * any byte in 32..127 is accepted. The scan stops at the first byte outside
 * that range: a null terminator ends the field, anything else (or running
 * off the end of the buffer) is a formatting error.
 *
 * @param cursor In: start of the field. Out: first byte after the terminator.
 * @param end One past the last readable byte
 * @param text Out: the field without its terminator
 * @return true if a terminated field was read
 */
inline bool ScanText(const uint8_t*& cursor, const uint8_t* end, std::string_view& text) {
    for (const uint8_t* p = cursor; p < end; ++p) {
        if (*p >= 32 && *p <= 127) {
            continue;
        }
        if (*p != 0) {
            return false;
        }
        text = std::string_view(reinterpret_cast<const char*>(cursor),
                                static_cast<size_t>(p - cursor));
        cursor = p + 1;
        return true;
    }
    return false;
}

/**
 * @brief Buffer writer that never writes past its capacity
 *
 * Every write that does not fit is dropped and latches the overflow flag,
 * so a whole packet can be written unconditionally and checked once.
 */
class BoundedWriter {
public:
    BoundedWriter(uint8_t* buffer, size_t capacity)
        : buffer_(buffer), capacity_(capacity), position_(0), overflow_(false) {}

    void PutU16(uint16_t value) {
        if (!Reserve(2)) return;
        WriteU16(buffer_ + position_, value);
        position_ += 2;
    }

    void PutBytes(const uint8_t* data, size_t size) {
        if (!Reserve(size)) return;
        if (size > 0) {
            std::memcpy(buffer_ + position_, data, size);
        }
        position_ += size;
    }

    // Text field followed by its null terminator
    void PutText(std::string_view text) {
        if (!Reserve(text.size() + 1)) return;
        std::memcpy(buffer_ + position_, text.data(), text.size());
        position_ += text.size();
        buffer_[position_++] = 0;
    }

    bool Overflowed() const { return overflow_; }
    size_t Position() const { return position_; }

private:
    bool Reserve(size_t size) {
        if (overflow_ || size > capacity_ - position_) {
            overflow_ = true;
            return false;
        }
        return true;
    }

    uint8_t* buffer_;
    size_t capacity_;
    size_t position_;
    bool overflow_;
};

} // namespace internal
} // namespace stftp

#endif // STFTP_WIRE_H_

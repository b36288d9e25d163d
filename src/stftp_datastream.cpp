#include "stftp/stftp_datastream.h"
#include "stftp/stftp_logger.h"
#include "internal/stftp_wire.h"

namespace stftp {

// ChunkedReader implementation
ChunkedReader::ChunkedReader(std::unique_ptr<ByteSource> source)
    : source_(std::move(source)) {
    if (!source_) {
        throw StftpException("ChunkedReader requires a byte source");
    }
}

bool ChunkedReader::TryReadExact(uint8_t* buffer, size_t size, size_t& filled, std::string& error) {
    filled = 0;
    while (filled < size) {
        SourceRead read = source_->Read(buffer + filled, size - filled);
        switch (read.status) {
            case ReadStatus::kOk:
                if (read.bytes == 0) {
                    return true;
                }
                filled += read.bytes;
                break;
            case ReadStatus::kInterrupted:
            case ReadStatus::kWouldBlock:
                break;
            case ReadStatus::kError:
                error = read.error;
                return false;
        }
    }
    return true;
}

// DataStream implementation
DataStream::DataStream(std::unique_ptr<ByteSource> source, uint16_t block_size)
    : reader_(std::move(source)),
      block_size_(block_size),
      block_number_(0),
      finished_(false),
      frame_(kHeaderSize + block_size) {
    if (block_size < kMinBlockSize || block_size > kMaxBlockSize) {
        throw StftpException("Invalid block size: " + std::to_string(block_size));
    }
    internal::WriteU16(frame_.data(), static_cast<uint16_t>(OpCode::kData));
}

BlockStatus DataStream::NextRaw(const uint8_t*& frame, size_t& frame_size) {
    if (finished_) {
        return BlockStatus::kFinished;
    }

    // uint16_t arithmetic wraps 65535 -> 0
    ++block_number_;
    internal::WriteU16(frame_.data() + 2, block_number_);

    size_t filled = 0;
    if (!reader_.TryReadExact(frame_.data() + kHeaderSize, block_size_, filled, last_error_)) {
        STFTP_WARN("Source read failed at block %u: %s", block_number_, last_error_.c_str());
        finished_ = true;
        return BlockStatus::kIoError;
    }

    if (filled < block_size_) {
        STFTP_DEBUG("Terminal block %u carries %zu bytes", block_number_, filled);
        finished_ = true;
    }

    frame = frame_.data();
    frame_size = kHeaderSize + filled;
    return BlockStatus::kBlock;
}

} // namespace stftp

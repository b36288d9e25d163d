/**
 * @file stftp_datastream.h
 * @brief Chunked reading of a byte source into framed DATA packets
 */

#ifndef STFTP_DATASTREAM_H_
#define STFTP_DATASTREAM_H_

#include "stftp/stftp_common.h"
#include "stftp/stftp_byte_source.h"
#include <memory>
#include <string>
#include <vector>

namespace stftp {

/**
 * @class ChunkedReader
 * @brief Fills whole buffers from a ByteSource
 */
class STFTP_EXPORT ChunkedReader {
public:
    explicit ChunkedReader(std::unique_ptr<ByteSource> source);

    /**
     * @brief Fill `buffer` completely unless the source ends first
     *
     * Interrupted and would-block reads are retried.
     *
     * @param buffer Destination
     * @param size Bytes wanted
     * @param filled Out: bytes actually filled; less than `size` only at end of source
     * @param error Out: failure description when false is returned
     * @return false if the source reported an error
     */
    bool TryReadExact(uint8_t* buffer, size_t size, size_t& filled, std::string& error);

    ByteSource& GetSource() { return *source_; }

private:
    std::unique_ptr<ByteSource> source_;
};

/**
 * @brief Result of DataStream::NextRaw
 */
enum class BlockStatus {
    kBlock,      // a framed block is ready
    kFinished,   // nothing left to send
    kIoError     // the source failed; the stream is finished
};

/**
 * @class DataStream
 * @brief Produces the framed DATA packets of one transfer
 *
 * The frame buffer is stamped with the DATA opcode once. Each call to NextRaw
 * advances the 16 bit block counter (wrapping at 65536), stamps it into the
 * frame and fills the payload. A block shorter than the block size is the
 * terminal block; a source whose length is a multiple of the block size
 * ends with an empty block.
 */
class STFTP_EXPORT DataStream {
public:
    DataStream(std::unique_ptr<ByteSource> source, uint16_t block_size);

    DataStream(const DataStream&) = delete;
    DataStream& operator=(const DataStream&) = delete;

    /**
     * @brief Frame the next block
     * @param frame Out: opcode, block number and payload, valid until the next call
     * @param frame_size Out: total frame length
     * @return kBlock, kFinished, or kIoError (see GetLastError)
     */
    BlockStatus NextRaw(const uint8_t*& frame, size_t& frame_size);

    uint16_t BlockSize() const { return block_size_; }

    // Block number of the most recently framed block, 0 before the first one
    uint16_t LastBlock() const { return block_number_; }

    bool IsFinished() const { return finished_; }
    const std::string& GetLastError() const { return last_error_; }

private:
    ChunkedReader reader_;
    uint16_t block_size_;
    uint16_t block_number_;
    bool finished_;
    std::vector<uint8_t> frame_;
    std::string last_error_;
};

} // namespace stftp

#endif // STFTP_DATASTREAM_H_

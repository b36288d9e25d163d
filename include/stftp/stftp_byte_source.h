/**
 * @file stftp_byte_source.h
 * @brief Readable byte sources that can be served by a transfer
 */

#ifndef STFTP_BYTE_SOURCE_H_
#define STFTP_BYTE_SOURCE_H_

#include "stftp/stftp_common.h"
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace stftp {

// Outcome of a single read
enum class ReadStatus {
    kOk,            // `bytes` were read; zero bytes means end of source
    kInterrupted,   // nothing read, try again
    kWouldBlock,    // nothing available yet, try again
    kError          // `error` describes the failure
};

struct SourceRead {
    ReadStatus status = ReadStatus::kOk;
    size_t bytes = 0;
    std::string error;
};

/**
 * @class ByteSource
 * @brief Interface of anything a read request can be served from
 */
class STFTP_EXPORT ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * @brief Read up to `size` bytes
     * @param buffer Destination
     * @param size Capacity of the destination
     * @return Read outcome
     */
    virtual SourceRead Read(uint8_t* buffer, size_t size) = 0;

    /**
     * @brief Total size, if known up front (used to answer "tsize")
     */
    virtual std::optional<uint64_t> Size() const { return std::nullopt; }
};

/**
 * @class MemoryByteSource
 * @brief Serves an in-memory buffer
 */
class STFTP_EXPORT MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(std::vector<uint8_t> data);
    explicit MemoryByteSource(const std::string& data);

    SourceRead Read(uint8_t* buffer, size_t size) override;
    std::optional<uint64_t> Size() const override { return data_.size(); }

private:
    std::vector<uint8_t> data_;
    size_t offset_;
};

/**
 * @class FileByteSource
 * @brief Serves a regular file through a POSIX file descriptor
 *
 * The descriptor is closed when the source is destroyed.
 */
class STFTP_EXPORT FileByteSource : public ByteSource {
public:
    FileByteSource();
    ~FileByteSource() override;

    FileByteSource(const FileByteSource&) = delete;
    FileByteSource& operator=(const FileByteSource&) = delete;

    /**
     * @brief Open a regular file for reading
     * @param path File path
     * @return true if the file is open and is a regular file
     */
    bool Open(const std::string& path);

    bool IsOpen() const { return fd_ >= 0; }
    const std::string& GetLastError() const { return last_error_; }

    SourceRead Read(uint8_t* buffer, size_t size) override;
    std::optional<uint64_t> Size() const override { return size_; }

private:
    void Close();

    int fd_;
    std::optional<uint64_t> size_;
    std::string last_error_;
};

/**
 * @class StreamByteSource
 * @brief Serves a std::istream the caller keeps alive
 */
class STFTP_EXPORT StreamByteSource : public ByteSource {
public:
    explicit StreamByteSource(std::istream& stream);

    SourceRead Read(uint8_t* buffer, size_t size) override;

private:
    std::istream& stream_;
};

} // namespace stftp

#endif // STFTP_BYTE_SOURCE_H_

#include "stftp/stftp_byte_source.h"
#include "stftp/stftp_logger.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace stftp {

// MemoryByteSource implementation
MemoryByteSource::MemoryByteSource(std::vector<uint8_t> data)
    : data_(std::move(data)), offset_(0) {
}

MemoryByteSource::MemoryByteSource(const std::string& data)
    : data_(data.begin(), data.end()), offset_(0) {
}

SourceRead MemoryByteSource::Read(uint8_t* buffer, size_t size) {
    SourceRead result;
    result.bytes = std::min(size, data_.size() - offset_);
    if (result.bytes > 0) {
        std::memcpy(buffer, data_.data() + offset_, result.bytes);
        offset_ += result.bytes;
    }
    return result;
}

// FileByteSource implementation
FileByteSource::FileByteSource() : fd_(-1) {
}

FileByteSource::~FileByteSource() {
    Close();
}

bool FileByteSource::Open(const std::string& path) {
    Close();

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        last_error_ = "Cannot open " + path + ": " + std::strerror(errno);
        STFTP_DEBUG("%s", last_error_.c_str());
        return false;
    }

    struct stat info;
    if (::fstat(fd, &info) != 0) {
        last_error_ = "Cannot stat " + path + ": " + std::strerror(errno);
        ::close(fd);
        return false;
    }
    if (!S_ISREG(info.st_mode)) {
        last_error_ = "Not a regular file: " + path;
        ::close(fd);
        return false;
    }

    fd_ = fd;
    size_ = static_cast<uint64_t>(info.st_size);
    STFTP_DEBUG("Opened %s (fd: %d, %llu bytes)", path.c_str(), fd_,
                static_cast<unsigned long long>(*size_));
    return true;
}

SourceRead FileByteSource::Read(uint8_t* buffer, size_t size) {
    SourceRead result;
    if (fd_ < 0) {
        result.status = ReadStatus::kError;
        result.error = "File is not open";
        return result;
    }

    ssize_t n = ::read(fd_, buffer, size);
    if (n >= 0) {
        result.bytes = static_cast<size_t>(n);
        return result;
    }

    int err = errno;
    if (err == EINTR) {
        result.status = ReadStatus::kInterrupted;
    } else if (err == EAGAIN || err == EWOULDBLOCK) {
        result.status = ReadStatus::kWouldBlock;
    } else {
        result.status = ReadStatus::kError;
        result.error = std::string("File read failed: ") + std::strerror(err);
    }
    return result;
}

void FileByteSource::Close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    size_.reset();
}

// StreamByteSource implementation
StreamByteSource::StreamByteSource(std::istream& stream) : stream_(stream) {
}

SourceRead StreamByteSource::Read(uint8_t* buffer, size_t size) {
    SourceRead result;
    if (stream_.bad()) {
        result.status = ReadStatus::kError;
        result.error = "Stream is in a bad state";
        return result;
    }
    if (stream_.eof()) {
        return result;
    }

    stream_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(size));
    if (stream_.bad()) {
        result.status = ReadStatus::kError;
        result.error = "Stream read failed";
        return result;
    }
    result.bytes = static_cast<size_t>(stream_.gcount());
    return result;
}

} // namespace stftp

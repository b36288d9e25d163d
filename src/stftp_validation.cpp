#include "stftp/stftp_validation.h"
#include "stftp/stftp_logger.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace stftp {
namespace validation {

namespace {

// Logs and rejects values outside [min, max]
bool InRange(const char* what, long long value, long long min, long long max) {
    if (value < min || value > max) {
        STFTP_ERROR("%s %lld outside %lld..%lld", what, value, min, max);
        return false;
    }
    return true;
}

} // namespace

bool ValidateRootDirectory(const std::string& root_dir) {
    if (root_dir.empty() || root_dir.length() > kMaxPathLength) {
        STFTP_ERROR("Root directory length %zu outside 1..%zu", root_dir.length(), kMaxPathLength);
        return false;
    }
    if (root_dir.find('\0') != std::string::npos) {
        STFTP_ERROR("Root directory contains a null byte");
        return false;
    }

    std::filesystem::path path(root_dir);
    if (path.lexically_normal().string().find("..") != std::string::npos) {
        STFTP_ERROR("Root directory escapes upward: %s", root_dir.c_str());
        return false;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        STFTP_ERROR("Root directory is not a directory: %s%s%s", root_dir.c_str(),
                    ec ? ": " : "", ec ? ec.message().c_str() : "");
        return false;
    }

    if (!path.is_absolute()) {
        STFTP_WARN("Serving relative root directory %s", root_dir.c_str());
    }
    return true;
}

bool ValidatePort(uint16_t port) {
    if (port == 0) {
        STFTP_ERROR("Port 0 cannot be used as the listening port");
        return false;
    }
    if (port < 1024) {
        STFTP_WARN("Listening port %u is privileged", static_cast<unsigned>(port));
    }
    return true;
}

bool ValidateTimeout(int timeout_seconds) {
    return InRange("Socket timeout (seconds)", timeout_seconds, kMinTimeout, kMaxTimeout);
}

bool ValidateBlockSize(uint32_t block_size) {
    return InRange("Block size", block_size, kMinBlockSize, kMaxBlockSize);
}

bool ValidateWorkerThreads(size_t count) {
    return InRange("Worker thread count", static_cast<long long>(count), 1,
                   static_cast<long long>(kMaxWorkerThreads));
}

bool ValidateFilename(const std::string& filename) {
    if (filename.empty() || filename.length() > kMaxFilenameLength) {
        STFTP_WARN("Requested filename length %zu outside 1..%zu",
                   filename.length(), kMaxFilenameLength);
        return false;
    }

    auto is_control = [](char c) { return std::iscntrl(static_cast<unsigned char>(c)) != 0; };
    if (std::any_of(filename.begin(), filename.end(), is_control)) {
        STFTP_WARN("Requested filename contains control characters");
        return false;
    }
    return true;
}

} // namespace validation
} // namespace stftp

/**
 * @file stftp_validation.h
 * @brief Input validation for API parameters
 */

#ifndef STFTP_VALIDATION_H_
#define STFTP_VALIDATION_H_

#include "stftp/stftp_common.h"
#include <string>
#include <cstdint>

namespace stftp {
namespace validation {

// Validation constants
constexpr int kMinTimeout = 1;              // Minimum socket timeout in seconds
constexpr int kMaxTimeout = 3600;           // Maximum socket timeout in seconds (1 hour)
constexpr size_t kMaxPathLength = 4096;     // Maximum path length
constexpr size_t kMaxFilenameLength = 255;  // Maximum requested filename length
constexpr size_t kMaxWorkerThreads = 256;

/**
 * @brief Validates root directory path
 * @param root_dir Root directory path to validate
 * @return true if valid, false otherwise
 */
STFTP_EXPORT bool ValidateRootDirectory(const std::string& root_dir);

/**
 * @brief Validates port number
 * @param port Port number to validate
 * @return true if valid, false otherwise
 */
STFTP_EXPORT bool ValidatePort(uint16_t port);

/**
 * @brief Validates a socket level timeout
 * @param timeout_seconds Timeout in seconds to validate
 * @return true if valid, false otherwise
 */
STFTP_EXPORT bool ValidateTimeout(int timeout_seconds);

/**
 * @brief Validates a block size against RFC 2348 limits
 */
STFTP_EXPORT bool ValidateBlockSize(uint32_t block_size);

/**
 * @brief Validates the worker thread count of the server
 */
STFTP_EXPORT bool ValidateWorkerThreads(size_t count);

/**
 * @brief Validates a requested filename
 * @param filename Filename to validate
 * @return true if valid, false otherwise
 */
STFTP_EXPORT bool ValidateFilename(const std::string& filename);

} // namespace validation
} // namespace stftp

#endif // STFTP_VALIDATION_H_

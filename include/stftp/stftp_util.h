/**
 * @file stftp_util.h
 * @brief Path handling for served files
 */

#ifndef STFTP_UTIL_H_
#define STFTP_UTIL_H_

#include "stftp/stftp_common.h"
#include <string>

namespace stftp {
namespace util {

/**
 * @brief Remove every leading '/' of a requested filename
 *
 * Many clients send "/boot/file" for "boot/file".
 */
STFTP_EXPORT std::string StripLeadingSlashes(const std::string& filename);

/**
 * @brief Check that a relative path stays inside the root directory
 * @param path Requested path, relative to root_dir
 * @param root_dir Root directory
 * @return true if safe, false otherwise
 */
STFTP_EXPORT bool IsPathSecure(const std::string& path, const std::string& root_dir);

/**
 * @brief Normalize path, resolving symlinks of the existing prefix
 * @param path Path to normalize
 * @return Normalized path, empty on error
 */
STFTP_EXPORT std::string NormalizePath(const std::string& path);

} // namespace util
} // namespace stftp

#endif // STFTP_UTIL_H_

#include "stftp/stftp_util.h"
#include "stftp/stftp_logger.h"
#include <filesystem>
#include <vector>

namespace stftp {
namespace util {

std::string StripLeadingSlashes(const std::string& filename) {
    size_t first = filename.find_first_not_of('/');
    if (first == std::string::npos) {
        return std::string();
    }
    return filename.substr(first);
}

bool IsPathSecure(const std::string& path, const std::string& root_dir) {
    try {
        if (path.empty() || root_dir.empty()) {
            STFTP_WARN("Security violation: Empty path or root directory");
            return false;
        }

        if (path.find('\0') != std::string::npos) {
            STFTP_WARN("Security violation: Null byte in path");
            return false;
        }

        if (path[0] == '/') {
            STFTP_WARN("Security violation: Absolute path specified: %s", path.c_str());
            return false;
        }

        // Reject traversal and shell metacharacters before touching the filesystem
        const std::vector<std::string> dangerous_patterns = {
            "..", "\\", "~", "$", "%", "<", ">", "|", "?", "*"
        };
        for (const auto& pattern : dangerous_patterns) {
            if (path.find(pattern) != std::string::npos) {
                STFTP_WARN("Security violation: Dangerous pattern '%s' found in path: %s",
                           pattern.c_str(), path.c_str());
                return false;
            }
        }

        std::filesystem::path root_path = std::filesystem::absolute(root_dir);
        std::filesystem::path target_path = root_path / path;

        // Resolve symbolic links, so a link pointing out of the root is caught
        std::filesystem::path canonical_root = std::filesystem::weakly_canonical(root_path);
        std::filesystem::path canonical_target = std::filesystem::weakly_canonical(target_path);

        std::string canonical_root_str = canonical_root.string();
        std::string canonical_target_str = canonical_target.string();
        if (!canonical_root_str.empty() &&
            canonical_root_str.back() != std::filesystem::path::preferred_separator) {
            canonical_root_str += std::filesystem::path::preferred_separator;
        }

        bool is_within_root = canonical_target_str.size() > canonical_root_str.size() &&
                              canonical_target_str.compare(0, canonical_root_str.size(),
                                                           canonical_root_str) == 0;
        if (!is_within_root) {
            STFTP_WARN("Security violation: Access outside root directory. Root: %s, Target: %s",
                       canonical_root_str.c_str(), canonical_target_str.c_str());
            return false;
        }

        STFTP_DEBUG("Path security check passed. Root: %s, Target: %s",
                    canonical_root_str.c_str(), canonical_target_str.c_str());
        return true;

    } catch (const std::filesystem::filesystem_error& e) {
        STFTP_ERROR("Filesystem error in path security check: %s (path: %s, root: %s)",
                    e.what(), path.c_str(), root_dir.c_str());
        return false;
    }
}

std::string NormalizePath(const std::string& path) {
    if (path.empty()) {
        return path;
    }
    if (path.find('\0') != std::string::npos) {
        STFTP_WARN("Security violation: Null byte in path during normalization");
        return "";
    }

    try {
        // weakly_canonical does not require the file to exist
        return std::filesystem::weakly_canonical(std::filesystem::path(path)).string();
    } catch (const std::filesystem::filesystem_error& e) {
        STFTP_ERROR("Filesystem error in path normalization: %s (path: %s)", e.what(), path.c_str());
        return "";
    }
}

} // namespace util
} // namespace stftp

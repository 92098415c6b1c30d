#include "storage/path_guard.hpp"

#include <cctype>

#include "utils/errors.hpp"

namespace codeexec::storage {

bool IsValidSessionId(const std::string& session_id) {
    if (session_id.empty() || session_id.size() > kMaxSessionIdLength) {
        return false;
    }
    for (unsigned char ch : session_id) {
        if (!std::isalnum(ch) && ch != '-' && ch != '_') {
            return false;
        }
    }
    return true;
}

void ValidateSessionId(const std::string& session_id) {
    if (!IsValidSessionId(session_id)) {
        throw utils::ServiceError(utils::ErrorCode::kSessionNotFound, "Session not found");
    }
}

std::string CheckRelativePath(const std::string& path) {
    if (path.empty()) {
        return "path is empty";
    }
    if (path.size() > kMaxPathLength) {
        return "path is too long";
    }
    if (path.front() == '/') {
        return "absolute paths are not allowed";
    }
    for (unsigned char ch : path) {
        if (ch == '\\') {
            return "backslashes are not allowed";
        }
        if (ch < 0x20 || ch == 0x7f) {
            return "control characters are not allowed";
        }
    }

    std::size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        const auto segment = path.substr(start, end - start);
        if (segment.empty()) {
            return "empty path segments are not allowed";
        }
        if (segment == "." || segment == "..") {
            return "relative segments are not allowed";
        }
        if (segment.size() > kMaxSegmentLength) {
            return "path segment is too long";
        }
        if (segment.rfind(kTempFilePrefix, 0) == 0) {
            return "reserved file name";
        }
        start = end + 1;
    }

    if (IsReservedPath(path)) {
        return "reserved file name";
    }
    return {};
}

void ValidateRelativePath(const std::string& path) {
    const auto reason = CheckRelativePath(path);
    if (!reason.empty()) {
        throw utils::ServiceError(utils::ErrorCode::kInvalidPath, "Invalid path: " + reason);
    }
}

bool IsReservedPath(const std::string& path) {
    return path == kMetadataFileName;
}

}  // namespace codeexec::storage

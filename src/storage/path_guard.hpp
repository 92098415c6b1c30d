#pragma once

#include <string>

namespace codeexec::storage {

// Session metadata object stored beside user files in every prefix.
inline constexpr const char* kMetadataFileName = ".meta.json";

// Leading name of in-flight temporary files written by atomic puts.
inline constexpr const char* kTempFilePrefix = ".codeexec-tmp-";

inline constexpr std::size_t kMaxSessionIdLength = 64;
inline constexpr std::size_t kMaxPathLength = 1024;
inline constexpr std::size_t kMaxSegmentLength = 255;

bool IsValidSessionId(const std::string& session_id);

// Throws ServiceError(kSessionNotFound): an id that cannot be a path segment
// can never name an existing session.
void ValidateSessionId(const std::string& session_id);

// Returns the reason a user supplied relative path is unsafe, empty when it is fine.
std::string CheckRelativePath(const std::string& path);

// Throws ServiceError(kInvalidPath) on traversal, absolute paths, reserved names.
void ValidateRelativePath(const std::string& path);

bool IsReservedPath(const std::string& path);

}  // namespace codeexec::storage

#pragma once

#include <stdexcept>
#include <string>

namespace codeexec::utils {

enum class ErrorCode {
    kUnauthorized,
    kSessionNotFound,
    kUnsupportedLanguage,
    kInvalidPath,
    kInvalidRequest,
    kFileNotFound,
    kExecutionTimedOut,
    kResourceLimitExceeded,
    kStorageFailure,
    kInternalError
};

inline const char* ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::kUnauthorized: return "unauthorized";
        case ErrorCode::kSessionNotFound: return "session_not_found";
        case ErrorCode::kUnsupportedLanguage: return "unsupported_language";
        case ErrorCode::kInvalidPath: return "invalid_path";
        case ErrorCode::kInvalidRequest: return "invalid_request";
        case ErrorCode::kFileNotFound: return "file_not_found";
        case ErrorCode::kExecutionTimedOut: return "timed_out";
        case ErrorCode::kResourceLimitExceeded: return "resource_limit_exceeded";
        case ErrorCode::kStorageFailure: return "storage_failure";
        case ErrorCode::kInternalError: return "internal_error";
    }
    return "internal_error";
}

class ServiceError : public std::runtime_error {
public:
    ServiceError(ErrorCode code, const std::string& detail)
        : std::runtime_error(detail)
        , code_(code) {}

    ErrorCode Code() const { return code_; }

private:
    ErrorCode code_;
};

}  // namespace codeexec::utils

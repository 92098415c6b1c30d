#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "executor/executor_registry.hpp"
#include "session/session_registry.hpp"
#include "storage/storage_backend.hpp"

namespace codeexec::engine {

constexpr int kTimedOutExitCode = -9;
constexpr int kLimitExceededExitCode = -10;

enum class ExecutionStatus {
    kOk,
    kTimedOut,
    kResourceLimitExceeded
};

const char* ToString(ExecutionStatus status);

struct ExecuteRequest {
    std::string session_id;
    std::string code;
    std::string stdin_data;
    std::optional<std::string> language;
};

struct ExecutionRecord {
    ExecutionStatus status = ExecutionStatus::kOk;
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    std::chrono::milliseconds duration{0};
    std::vector<storage::FileEntry> files;
    std::vector<std::string> modified_files;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
};

class ExecutionEngine {
public:
    ExecutionEngine(session::SessionRegistry& sessions,
                    storage::StorageBackend& storage,
                    const executor::ExecutorRegistry& executors);

    // Timeouts and limit breaches come back as a record with a status marker;
    // everything else that goes wrong throws ServiceError.
    ExecutionRecord Execute(const ExecuteRequest& request);

private:
    session::Language ResolveLanguage(const session::SessionInfo& info,
                                      const std::optional<std::string>& override_name) const;

    session::SessionRegistry& sessions_;
    storage::StorageBackend& storage_;
    const executor::ExecutorRegistry& executors_;
};

}  // namespace codeexec::engine

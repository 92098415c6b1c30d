#include "engine/execution_engine.hpp"

#include "storage/directory_snapshot.hpp"
#include "storage/path_guard.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace codeexec::engine {
namespace {

using utils::ErrorCode;
using utils::ServiceError;

void AppendNotice(std::string& text, const std::string& notice) {
    if (!text.empty() && text.back() != '\n') {
        text += '\n';
    }
    text += notice;
    text += '\n';
}

std::string LimitNotice(const executor::RunOutcome& outcome) {
    if (outcome.process.cpu_limit_exceeded) {
        return "Resource limit exceeded: CPU time.";
    }
    if (outcome.process.file_size_limit_exceeded) {
        return "Resource limit exceeded: file size.";
    }
    return "Resource limit exceeded: memory.";
}

}  // namespace

const char* ToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::kOk: return "ok";
        case ExecutionStatus::kTimedOut: return utils::ToString(ErrorCode::kExecutionTimedOut);
        case ExecutionStatus::kResourceLimitExceeded: return utils::ToString(ErrorCode::kResourceLimitExceeded);
    }
    return "ok";
}

ExecutionEngine::ExecutionEngine(session::SessionRegistry& sessions,
                                 storage::StorageBackend& storage,
                                 const executor::ExecutorRegistry& executors)
    : sessions_(sessions)
    , storage_(storage)
    , executors_(executors) {}

session::Language ExecutionEngine::ResolveLanguage(const session::SessionInfo& info,
                                                   const std::optional<std::string>& override_name) const {
    if (!override_name) {
        return info.language;
    }
    const auto parsed = session::ParseLanguage(utils::ToLower(*override_name));
    if (!parsed || !sessions_.Supports(*parsed) || !executors_.Has(*parsed)) {
        throw ServiceError(ErrorCode::kUnsupportedLanguage, "Unsupported language: " + *override_name);
    }
    return *parsed;
}

ExecutionRecord ExecutionEngine::Execute(const ExecuteRequest& request) {
    const auto info = sessions_.Get(request.session_id);
    const auto language = ResolveLanguage(info, request.language);
    const auto* executor = executors_.Get(language);
    if (!executor) {
        throw ServiceError(ErrorCode::kUnsupportedLanguage,
                           std::string("Unsupported language: ") + session::ToString(language));
    }
    if (request.code.empty()) {
        throw ServiceError(ErrorCode::kInvalidRequest, "code must not be empty");
    }

    auto workspace = storage_.Checkout(info.id);
    const auto before = storage::SnapshotDirectory(workspace->Directory());
    const auto outcome = executor->Run(workspace->Directory(), request.code, request.stdin_data);
    if (storage::RemoveIrregularEntry(workspace->Directory() / storage::kMetadataFileName)) {
        utils::Log(utils::LogLevel::kWarn, "engine", "executed code replaced metadata with a non-file",
                   {{"session", info.id}});
    }
    const auto after = storage::SnapshotDirectory(workspace->Directory());
    workspace->Commit();
    workspace.reset();
    sessions_.RestoreMetadata(info);

    ExecutionRecord record{};
    record.stdout_text = outcome.process.output;
    record.stderr_text = outcome.process.error;
    record.stdout_truncated = outcome.process.output_truncated;
    record.stderr_truncated = outcome.process.error_truncated;
    record.duration = outcome.process.duration;
    record.exit_code = outcome.process.exit_code;
    record.modified_files = storage::ChangedPaths(before, after);

    if (outcome.process.timed_out) {
        const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
            executor->Limits().wall_timeout).count();
        record.status = ExecutionStatus::kTimedOut;
        record.exit_code = kTimedOutExitCode;
        AppendNotice(record.stderr_text, "Execution timed out after " + std::to_string(seconds) + " seconds.");
    } else if (outcome.LimitExceeded()) {
        record.status = ExecutionStatus::kResourceLimitExceeded;
        record.exit_code = kLimitExceededExitCode;
        AppendNotice(record.stderr_text, LimitNotice(outcome));
    }

    record.files = sessions_.ListFiles(info.id);

    utils::Log(utils::LogLevel::kInfo, "engine", "execution finished",
               {{"session", info.id},
                {"language", session::ToString(language)},
                {"status", ToString(record.status)},
                {"exit_code", std::to_string(record.exit_code)},
                {"duration_ms", std::to_string(record.duration.count())},
                {"modified", std::to_string(record.modified_files.size())}});
    return record;
}

}  // namespace codeexec::engine

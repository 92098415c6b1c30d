#include "session/session_registry.hpp"

#include <algorithm>

#include "nlohmann/json.hpp"
#include "storage/path_guard.hpp"
#include "utils/common.hpp"
#include "utils/crypto.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace codeexec::session {
namespace {

using utils::ErrorCode;
using utils::ServiceError;

[[noreturn]] void ThrowNotFound() {
    throw ServiceError(ErrorCode::kSessionNotFound, "Session not found");
}

}  // namespace

SessionRegistry::SessionRegistry(storage::StorageBackend& storage, std::set<Language> languages)
    : storage_(storage)
    , languages_(std::move(languages)) {}

bool SessionRegistry::Supports(Language language) const {
    return languages_.count(language) > 0;
}

std::string SessionRegistry::SerializeMetadata(const SessionInfo& info) {
    nlohmann::json json = {
        {"session_id", info.id},
        {"language", ToString(info.language)},
        {"created_at", info.created_at}
    };
    return json.dump();
}

SessionInfo SessionRegistry::Create(const std::string& language) {
    const auto parsed = ParseLanguage(utils::ToLower(language));
    if (!parsed || !Supports(*parsed)) {
        throw ServiceError(ErrorCode::kUnsupportedLanguage, "Unsupported language: " + language);
    }

    SessionInfo info{};
    info.id = utils::RandomUuid();
    info.language = *parsed;
    info.created_at = utils::NowIso();

    storage_.CreatePrefix(info.id);
    try {
        storage_.Put(info.id, storage::kMetadataFileName, SerializeMetadata(info));
    } catch (const ServiceError&) {
        try {
            storage_.RemovePrefix(info.id);
        } catch (const ServiceError& cleanup) {
            utils::Log(utils::LogLevel::kWarn, "session", "cleanup after failed create failed",
                       {{"session", info.id}, {"error", cleanup.what()}});
        }
        throw;
    }
    utils::Log(utils::LogLevel::kInfo, "session", "created",
               {{"session", info.id}, {"language", ToString(info.language)}});
    return info;
}

SessionInfo SessionRegistry::Get(const std::string& session_id) {
    storage::ValidateSessionId(session_id);
    const auto data = storage_.Get(session_id, storage::kMetadataFileName);
    if (!data) {
        ThrowNotFound();
    }
    const auto json = nlohmann::json::parse(*data, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        utils::Log(utils::LogLevel::kWarn, "session", "unreadable metadata", {{"session", session_id}});
        ThrowNotFound();
    }
    const auto language = ParseLanguage(json.value("language", ""));
    if (!language) {
        utils::Log(utils::LogLevel::kWarn, "session", "metadata names unknown language", {{"session", session_id}});
        ThrowNotFound();
    }
    SessionInfo info{};
    info.id = session_id;
    info.language = *language;
    info.created_at = json.value("created_at", "");
    return info;
}

void SessionRegistry::Delete(const std::string& session_id) {
    storage::ValidateSessionId(session_id);
    // A prefix whose metadata went missing is still removed.
    if (!storage_.RemovePrefix(session_id)) {
        ThrowNotFound();
    }
    utils::Log(utils::LogLevel::kInfo, "session", "deleted", {{"session", session_id}});
}

std::vector<storage::FileEntry> SessionRegistry::ListFiles(const std::string& session_id) {
    Get(session_id);
    auto entries = storage_.List(session_id);
    entries.erase(std::remove_if(entries.begin(), entries.end(), [](const storage::FileEntry& entry) {
        return storage::IsReservedPath(entry.path);
    }), entries.end());
    return entries;
}

std::vector<std::string> SessionRegistry::SaveFiles(const std::string& session_id,
                                                    const std::vector<UploadedFile>& files) {
    Get(session_id);
    for (const auto& file : files) {
        storage::ValidateRelativePath(file.path);
    }
    std::vector<std::string> saved;
    saved.reserve(files.size());
    for (const auto& file : files) {
        storage_.Put(session_id, file.path, file.content);
        saved.push_back(file.path);
    }
    return saved;
}

std::string SessionRegistry::ReadFile(const std::string& session_id, const std::string& path) {
    Get(session_id);
    storage::ValidateRelativePath(path);
    auto data = storage_.Get(session_id, path);
    if (!data) {
        throw ServiceError(ErrorCode::kFileNotFound, "File not found");
    }
    return std::move(*data);
}

void SessionRegistry::DeleteFile(const std::string& session_id, const std::string& path) {
    Get(session_id);
    storage::ValidateRelativePath(path);
    if (!storage_.Remove(session_id, path)) {
        throw ServiceError(ErrorCode::kFileNotFound, "File not found");
    }
}

void SessionRegistry::RestoreMetadata(const SessionInfo& info) {
    const auto expected = SerializeMetadata(info);
    const auto current = storage_.Get(info.id, storage::kMetadataFileName);
    if (current && *current == expected) {
        return;
    }
    utils::Log(utils::LogLevel::kWarn, "session", "metadata was modified by executed code, restoring",
               {{"session", info.id}});
    storage_.Put(info.id, storage::kMetadataFileName, expected);
}

}  // namespace codeexec::session

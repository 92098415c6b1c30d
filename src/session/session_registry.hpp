#pragma once

#include <set>
#include <string>
#include <utility>
#include <vector>

#include "session/session_types.hpp"
#include "storage/storage_backend.hpp"

namespace codeexec::session {

struct UploadedFile {
    std::string path;
    std::string content;
};

// Identity and lookup of sessions. Every operation on an unknown, deleted or
// malformed id throws ServiceError(kSessionNotFound).
class SessionRegistry {
public:
    SessionRegistry(storage::StorageBackend& storage, std::set<Language> languages);

    SessionInfo Create(const std::string& language);
    SessionInfo Get(const std::string& session_id);
    void Delete(const std::string& session_id);
    std::vector<storage::FileEntry> ListFiles(const std::string& session_id);

    // All paths are validated before the first one is written.
    std::vector<std::string> SaveFiles(const std::string& session_id, const std::vector<UploadedFile>& files);
    std::string ReadFile(const std::string& session_id, const std::string& path);
    void DeleteFile(const std::string& session_id, const std::string& path);

    // Rewrites the metadata object if executed code changed or removed it.
    void RestoreMetadata(const SessionInfo& info);

    bool Supports(Language language) const;
    const std::set<Language>& Languages() const { return languages_; }

private:
    static std::string SerializeMetadata(const SessionInfo& info);

    storage::StorageBackend& storage_;
    std::set<Language> languages_;
};

}  // namespace codeexec::session

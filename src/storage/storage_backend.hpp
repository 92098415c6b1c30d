#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codeexec::storage {

struct FileEntry {
    std::string path;
    std::uint64_t size = 0;
};

// A local directory mirroring one prefix for the duration of an execution.
// Destroying the workspace releases whatever the backend allocated for it.
class Workspace {
public:
    virtual ~Workspace() = default;
    virtual const std::filesystem::path& Directory() const = 0;
    // Pushes files changed in Directory() back into the prefix.
    virtual void Commit() = 0;
};

// Prefix-scoped blob store. Prefixes are session ids and paths are relative,
// already validated by the caller; implementations still refuse anything that
// would resolve outside the prefix. Failures throw ServiceError(kStorageFailure).
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    virtual std::string Name() const = 0;
    virtual void CreatePrefix(const std::string& prefix) = 0;
    // Either the whole content becomes visible or nothing does.
    virtual void Put(const std::string& prefix, const std::string& path, const std::string& data) = 0;
    virtual std::optional<std::string> Get(const std::string& prefix, const std::string& path) = 0;
    virtual bool Exists(const std::string& prefix, const std::string& path) = 0;
    // All regular files under the prefix, sorted by path, metadata included.
    virtual std::vector<FileEntry> List(const std::string& prefix) = 0;
    virtual bool Remove(const std::string& prefix, const std::string& path) = 0;
    // False when nothing was stored under the prefix.
    virtual bool RemovePrefix(const std::string& prefix) = 0;
    virtual std::unique_ptr<Workspace> Checkout(const std::string& prefix) = 0;
};

}  // namespace codeexec::storage

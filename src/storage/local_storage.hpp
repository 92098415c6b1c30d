#pragma once

#include <filesystem>

#include "storage/storage_backend.hpp"

namespace codeexec::storage {

// Prefixes are subdirectories of root. The executor works directly in them.
class LocalStorage : public StorageBackend {
public:
    explicit LocalStorage(const std::filesystem::path& root);

    std::string Name() const override { return "local"; }
    void CreatePrefix(const std::string& prefix) override;
    void Put(const std::string& prefix, const std::string& path, const std::string& data) override;
    std::optional<std::string> Get(const std::string& prefix, const std::string& path) override;
    bool Exists(const std::string& prefix, const std::string& path) override;
    std::vector<FileEntry> List(const std::string& prefix) override;
    bool Remove(const std::string& prefix, const std::string& path) override;
    bool RemovePrefix(const std::string& prefix) override;
    std::unique_ptr<Workspace> Checkout(const std::string& prefix) override;

    const std::filesystem::path& Root() const { return root_; }

private:
    std::filesystem::path PrefixDir(const std::string& prefix) const;
    // Resolves symlinks and throws ServiceError(kInvalidPath) if the result
    // leaves the prefix directory.
    std::filesystem::path Resolve(const std::string& prefix, const std::string& path) const;

    std::filesystem::path root_;
};

}  // namespace codeexec::storage

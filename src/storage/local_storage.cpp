#include "storage/local_storage.hpp"

#include <algorithm>
#include <system_error>

#include "storage/directory_snapshot.hpp"
#include "storage/path_guard.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace codeexec::storage {
namespace {

namespace fs = std::filesystem;

using utils::ErrorCode;
using utils::ServiceError;

bool IsRegularFile(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(fs::symlink_status(path, ec));
}

bool IsWithin(const fs::path& base, const fs::path& candidate) {
    const auto relative = candidate.lexically_relative(base);
    if (relative.empty()) {
        return false;
    }
    const auto first = *relative.begin();
    return first != "..";
}

class LocalWorkspace : public Workspace {
public:
    explicit LocalWorkspace(fs::path directory)
        : directory_(std::move(directory)) {}

    const fs::path& Directory() const override { return directory_; }
    void Commit() override {}

private:
    fs::path directory_;
};

}  // namespace

LocalStorage::LocalStorage(const fs::path& root) {
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        throw ServiceError(ErrorCode::kStorageFailure,
                           "cannot create storage root " + root.string() + ": " + ec.message());
    }
    root_ = fs::canonical(root, ec);
    if (ec) {
        throw ServiceError(ErrorCode::kStorageFailure,
                           "cannot resolve storage root " + root.string() + ": " + ec.message());
    }
    utils::Log(utils::LogLevel::kInfo, "storage", "local backend ready", {{"root", root_.string()}});
}

fs::path LocalStorage::PrefixDir(const std::string& prefix) const {
    if (!IsValidSessionId(prefix)) {
        throw ServiceError(ErrorCode::kInvalidPath, "Invalid prefix");
    }
    return root_ / prefix;
}

fs::path LocalStorage::Resolve(const std::string& prefix, const std::string& path) const {
    const auto base = PrefixDir(prefix);
    std::error_code ec;
    const auto canonical_base = fs::weakly_canonical(base, ec);
    if (ec || !IsWithin(root_, canonical_base) || canonical_base == root_) {
        throw ServiceError(ErrorCode::kInvalidPath, "Invalid path: prefix escapes storage root");
    }
    const auto lexical = (base / fs::path(path)).lexically_normal();
    if (!lexical.has_filename()) {
        throw ServiceError(ErrorCode::kInvalidPath, "Invalid path: no file name");
    }
    const auto parent = fs::weakly_canonical(lexical.parent_path(), ec);
    if (ec) {
        throw ServiceError(ErrorCode::kStorageFailure, "cannot resolve " + path + ": " + ec.message());
    }
    const auto resolved = parent / lexical.filename();
    if (!IsWithin(canonical_base, resolved) || resolved == canonical_base) {
        throw ServiceError(ErrorCode::kInvalidPath, "Invalid path: escapes session directory");
    }
    return resolved;
}

void LocalStorage::CreatePrefix(const std::string& prefix) {
    std::error_code ec;
    fs::create_directories(PrefixDir(prefix), ec);
    if (ec) {
        throw ServiceError(ErrorCode::kStorageFailure, "cannot create prefix " + prefix + ": " + ec.message());
    }
}

void LocalStorage::Put(const std::string& prefix, const std::string& path, const std::string& data) {
    const auto target = Resolve(prefix, path);
    std::error_code ec;
    if (fs::is_directory(fs::symlink_status(target, ec))) {
        throw ServiceError(ErrorCode::kInvalidPath, "Invalid path: a directory exists at " + path);
    }
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw ServiceError(ErrorCode::kStorageFailure,
                           "cannot create directory for " + path + ": " + ec.message());
    }
    WriteFileAtomic(target, data);
}

std::optional<std::string> LocalStorage::Get(const std::string& prefix, const std::string& path) {
    const auto target = Resolve(prefix, path);
    if (!IsRegularFile(target)) {
        return std::nullopt;
    }
    return ReadWholeFile(target);
}

bool LocalStorage::Exists(const std::string& prefix, const std::string& path) {
    return IsRegularFile(Resolve(prefix, path));
}

std::vector<FileEntry> LocalStorage::List(const std::string& prefix) {
    std::vector<FileEntry> entries;
    WalkRegularFiles(PrefixDir(prefix), [&entries](const std::string& relative, const fs::path&, std::uintmax_t size) {
        entries.push_back(FileEntry{relative, static_cast<std::uint64_t>(size)});
    });
    std::sort(entries.begin(), entries.end(), [](const FileEntry& a, const FileEntry& b) {
        return a.path < b.path;
    });
    return entries;
}

bool LocalStorage::Remove(const std::string& prefix, const std::string& path) {
    const auto target = Resolve(prefix, path);
    if (!IsRegularFile(target)) {
        return false;
    }
    std::error_code ec;
    const bool removed = fs::remove(target, ec);
    if (ec) {
        throw ServiceError(ErrorCode::kStorageFailure, "cannot remove " + path + ": " + ec.message());
    }
    return removed;
}

bool LocalStorage::RemovePrefix(const std::string& prefix) {
    const auto dir = PrefixDir(prefix);
    std::error_code ec;
    const auto status = fs::symlink_status(dir, ec);
    if (!fs::exists(status)) {
        return false;
    }
    fs::remove_all(dir, ec);
    if (ec) {
        throw ServiceError(ErrorCode::kStorageFailure, "cannot remove prefix " + prefix + ": " + ec.message());
    }
    return true;
}

std::unique_ptr<Workspace> LocalStorage::Checkout(const std::string& prefix) {
    CreatePrefix(prefix);
    return std::make_unique<LocalWorkspace>(PrefixDir(prefix));
}

}  // namespace codeexec::storage

#include "storage/directory_snapshot.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#include "storage/path_guard.hpp"
#include "utils/crypto.hpp"
#include "utils/errors.hpp"

namespace codeexec::storage {

namespace fs = std::filesystem;

void WalkRegularFiles(const fs::path& root,
                      const std::function<void(const std::string&, const fs::path&, std::uintmax_t)>& visit) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return;
    }
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw utils::ServiceError(utils::ErrorCode::kStorageFailure,
                                  "cannot list " + root.string() + ": " + ec.message());
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw utils::ServiceError(utils::ErrorCode::kStorageFailure,
                                      "cannot list " + root.string() + ": " + ec.message());
        }
        const auto status = it->symlink_status(ec);
        if (ec || !fs::is_regular_file(status)) {
            ec.clear();
            continue;
        }
        const auto& path = it->path();
        if (path.filename().string().rfind(kTempFilePrefix, 0) == 0) {
            continue;
        }
        const auto size = it->file_size(ec);
        if (ec) {
            ec.clear();
            continue;
        }
        visit(path.lexically_relative(root).generic_string(), path, size);
    }
    if (ec) {
        throw utils::ServiceError(utils::ErrorCode::kStorageFailure,
                                  "cannot list " + root.string() + ": " + ec.message());
    }
}

DirectorySnapshot SnapshotDirectory(const fs::path& root) {
    DirectorySnapshot snapshot;
    WalkRegularFiles(root, [&snapshot](const std::string& relative, const fs::path& path, std::uintmax_t size) {
        if (IsReservedPath(relative)) {
            return;
        }
        snapshot[relative] = SnapshotEntry{size, utils::Sha256File(path)};
    });
    return snapshot;
}

std::vector<std::string> ChangedPaths(const DirectorySnapshot& before, const DirectorySnapshot& after) {
    std::vector<std::string> changed;
    for (const auto& [path, entry] : after) {
        auto it = before.find(path);
        if (it == before.end() || it->second.size != entry.size || it->second.digest != entry.digest) {
            changed.push_back(path);
        }
    }
    return changed;
}

std::vector<std::string> RemovedPaths(const DirectorySnapshot& before, const DirectorySnapshot& after) {
    std::vector<std::string> removed;
    for (const auto& entry : before) {
        if (after.find(entry.first) == after.end()) {
            removed.push_back(entry.first);
        }
    }
    return removed;
}

bool RemoveIrregularEntry(const fs::path& path) {
    std::error_code ec;
    const auto status = fs::symlink_status(path, ec);
    if (!fs::exists(status) || fs::is_regular_file(status)) {
        return false;
    }
    fs::remove_all(path, ec);
    if (ec) {
        throw utils::ServiceError(utils::ErrorCode::kStorageFailure,
                                  "cannot remove " + path.string() + ": " + ec.message());
    }
    return true;
}

std::string ReadWholeFile(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw utils::ServiceError(utils::ErrorCode::kStorageFailure, "cannot open " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        throw utils::ServiceError(utils::ErrorCode::kStorageFailure, "read failed on " + path.string());
    }
    return buffer.str();
}

void WriteFileAtomic(const fs::path& target, const std::string& data) {
    const auto temp = target.parent_path() / (std::string(kTempFilePrefix) + utils::RandomUuid());
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            throw utils::ServiceError(utils::ErrorCode::kStorageFailure, "cannot create " + temp.string());
        }
        output.write(data.data(), static_cast<std::streamsize>(data.size()));
        output.flush();
        if (!output) {
            output.close();
            std::error_code ignored;
            fs::remove(temp, ignored);
            throw utils::ServiceError(utils::ErrorCode::kStorageFailure, "write failed on " + target.string());
        }
    }
    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw utils::ServiceError(utils::ErrorCode::kStorageFailure,
                                  "cannot replace " + target.string() + ": " + ec.message());
    }
}

}  // namespace codeexec::storage

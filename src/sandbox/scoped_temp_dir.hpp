#pragma once

#include <filesystem>
#include <string>
#include <system_error>

#include "utils/crypto.hpp"
#include "utils/errors.hpp"

namespace codeexec::sandbox {

// Private directory under the system temp dir, removed with its contents on destruction.
class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::string& tag)
        : path_(std::filesystem::temp_directory_path() / ("codeexec-" + tag + "-" + utils::RandomUuid())) {
        std::error_code ec;
        std::filesystem::create_directories(path_, ec);
        if (ec) {
            throw utils::ServiceError(utils::ErrorCode::kInternalError,
                                      "cannot create temp dir " + path_.string() + ": " + ec.message());
        }
        std::filesystem::permissions(path_, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::replace, ec);
    }

    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace codeexec::sandbox

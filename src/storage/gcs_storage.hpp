#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>

#include "config/config_schema.hpp"
#include "storage/storage_backend.hpp"

namespace httplib {
class Client;
class Result;
}  // namespace httplib

namespace codeexec::storage {

// Google Cloud Storage through its JSON API. Prefix "<id>" maps to object
// names "<id>/<path>"; executions run in a temp directory mirrored from the
// prefix and committed back afterwards.
class GcsStorage : public StorageBackend {
public:
    explicit GcsStorage(config::GcsConfig config);

    std::string Name() const override { return "gcs"; }
    void CreatePrefix(const std::string& prefix) override;
    void Put(const std::string& prefix, const std::string& path, const std::string& data) override;
    std::optional<std::string> Get(const std::string& prefix, const std::string& path) override;
    bool Exists(const std::string& prefix, const std::string& path) override;
    std::vector<FileEntry> List(const std::string& prefix) override;
    bool Remove(const std::string& prefix, const std::string& path) override;
    bool RemovePrefix(const std::string& prefix) override;
    std::unique_ptr<Workspace> Checkout(const std::string& prefix) override;

private:
    using Request = std::function<httplib::Result(httplib::Client&)>;

    std::string ObjectName(const std::string& prefix, const std::string& path) const;
    std::string ObjectPath(const std::string& object_name) const;
    // Runs request, retrying once on transport errors, 429 and 5xx.
    httplib::Result Send(const std::string& what, const Request& request);
    std::string AccessToken();

    config::GcsConfig config_;
    std::string scheme_host_port_;
    std::string base_path_;
    bool use_metadata_server_ = false;

    std::mutex token_mutex_;
    std::string cached_token_;
    std::chrono::steady_clock::time_point token_expiry_{};
};

}  // namespace codeexec::storage

#include "storage/gcs_storage.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "storage/directory_snapshot.hpp"
#include "storage/path_guard.hpp"
#include "utils/crypto.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace codeexec::storage {
namespace {

namespace fs = std::filesystem;

using utils::ErrorCode;
using utils::ServiceError;

constexpr const char* kTokenPath = "/computeMetadata/v1/instance/service-accounts/default/token";

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string base_path;
};

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        try {
            parsed.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            throw ServiceError(ErrorCode::kStorageFailure, "invalid port in GCS endpoint: " + url);
        }
    } else {
        parsed.host = host_port;
    }

    if (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }
    return parsed;
}

std::string UrlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return encoded.str();
}

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
        value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool IsTransient(const httplib::Result& result) {
    if (!result) {
        return true;
    }
    return result->status == 429 || result->status >= 500;
}

std::string Describe(const httplib::Result& result) {
    if (!result) {
        return "httplib error=" + httplib::to_string(result.error());
    }
    return "HTTP " + std::to_string(result->status);
}

// The JSON API reports object sizes as decimal strings.
std::uint64_t ParseObjectSize(const std::string& name, const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw ServiceError(ErrorCode::kStorageFailure, "list returned invalid size for " + name + ": " + text);
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw ServiceError(ErrorCode::kStorageFailure, "list returned out of range size for " + name);
    }
}

class GcsWorkspace : public Workspace {
public:
    GcsWorkspace(GcsStorage& storage, std::string prefix, fs::path directory)
        : storage_(storage)
        , prefix_(std::move(prefix))
        , directory_(std::move(directory)) {}

    ~GcsWorkspace() override {
        std::error_code ec;
        fs::remove_all(directory_, ec);
        if (ec) {
            utils::Log(utils::LogLevel::kWarn, "storage", "failed to remove workspace",
                       {{"dir", directory_.string()}, {"error", ec.message()}});
        }
    }

    const fs::path& Directory() const override { return directory_; }

    void SetBaseline(DirectorySnapshot baseline) { baseline_ = std::move(baseline); }

    void Commit() override {
        const auto current = SnapshotDirectory(directory_);
        for (const auto& path : ChangedPaths(baseline_, current)) {
            const auto reason = CheckRelativePath(path);
            if (!reason.empty()) {
                utils::Log(utils::LogLevel::kWarn, "storage", "skipping unsafe workspace file",
                           {{"session", prefix_}, {"path", path}, {"reason", reason}});
                continue;
            }
            storage_.Put(prefix_, path, ReadWholeFile(directory_ / path));
        }
        for (const auto& path : RemovedPaths(baseline_, current)) {
            storage_.Remove(prefix_, path);
        }
        baseline_ = current;
    }

private:
    GcsStorage& storage_;
    std::string prefix_;
    fs::path directory_;
    DirectorySnapshot baseline_;
};

}  // namespace

GcsStorage::GcsStorage(config::GcsConfig config)
    : config_(std::move(config)) {
    const auto parsed = ParseUrl(config_.endpoint);
    if (parsed.host.empty()) {
        throw ServiceError(ErrorCode::kStorageFailure, "invalid GCS endpoint: " + config_.endpoint);
    }
    scheme_host_port_ = parsed.https ? "https://" : "http://";
    scheme_host_port_ += parsed.host + ":" + std::to_string(parsed.port);
    base_path_ = parsed.base_path;
    use_metadata_server_ = config_.access_token.empty() && EndsWith(parsed.host, "googleapis.com");
    utils::Log(utils::LogLevel::kInfo, "storage", "gcs backend ready",
               {{"bucket", config_.bucket},
                {"endpoint", scheme_host_port_ + base_path_},
                {"auth", use_metadata_server_ ? "metadata" : (config_.access_token.empty() ? "none" : "token")}});
}

std::string GcsStorage::ObjectName(const std::string& prefix, const std::string& path) const {
    if (!IsValidSessionId(prefix)) {
        throw ServiceError(ErrorCode::kInvalidPath, "Invalid prefix");
    }
    return prefix + "/" + path;
}

std::string GcsStorage::ObjectPath(const std::string& object_name) const {
    return base_path_ + "/storage/v1/b/" + UrlEncode(config_.bucket) + "/o/" + UrlEncode(object_name);
}

std::string GcsStorage::AccessToken() {
    if (!config_.access_token.empty()) {
        return config_.access_token;
    }
    if (!use_metadata_server_) {
        return {};
    }
    std::lock_guard<std::mutex> lock(token_mutex_);
    const auto now = std::chrono::steady_clock::now();
    if (!cached_token_.empty() && now < token_expiry_) {
        return cached_token_;
    }
    httplib::Client client("http://" + config_.metadata_host);
    client.set_connection_timeout(5);
    client.set_read_timeout(5);
    auto response = client.Get(kTokenPath, httplib::Headers{{"Metadata-Flavor", "Google"}});
    if (!response || response->status != 200) {
        throw ServiceError(ErrorCode::kStorageFailure, "metadata token request failed: " + Describe(response));
    }
    const auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (json.is_discarded() || !json.contains("access_token") || !json["access_token"].is_string()) {
        throw ServiceError(ErrorCode::kStorageFailure, "metadata token response is invalid");
    }
    cached_token_ = json["access_token"].get<std::string>();
    int expires_in = 300;
    if (json.contains("expires_in") && json["expires_in"].is_number_integer()) {
        expires_in = json["expires_in"].get<int>();
    }
    token_expiry_ = now + std::chrono::seconds(std::max(0, expires_in - 60));
    return cached_token_;
}

httplib::Result GcsStorage::Send(const std::string& what, const Request& request) {
    for (int attempt = 1;; ++attempt) {
        httplib::Client client(scheme_host_port_);
        client.set_connection_timeout(config_.timeout_s);
        client.set_read_timeout(config_.timeout_s);
        client.set_write_timeout(config_.timeout_s);
        client.set_url_encode(false);
        const auto token = AccessToken();
        if (!token.empty()) {
            client.set_default_headers({{"Authorization", "Bearer " + token}});
        }
        auto result = request(client);
        if (!IsTransient(result)) {
            return result;
        }
        if (attempt >= 2) {
            throw ServiceError(ErrorCode::kStorageFailure, what + " failed: " + Describe(result));
        }
        utils::Log(utils::LogLevel::kWarn, "storage", "transient gcs failure, retrying",
                   {{"op", what}, {"result", Describe(result)}});
    }
}

void GcsStorage::CreatePrefix(const std::string& prefix) {
    // Object stores have no directories; the prefix appears with its first object.
    ObjectName(prefix, kMetadataFileName);
}

void GcsStorage::Put(const std::string& prefix, const std::string& path, const std::string& data) {
    const auto name = ObjectName(prefix, path);
    const auto target = base_path_ + "/upload/storage/v1/b/" + UrlEncode(config_.bucket) +
        "/o?uploadType=media&name=" + UrlEncode(name);
    auto result = Send("upload " + name, [&](httplib::Client& client) {
        return client.Post(target, data, "application/octet-stream");
    });
    if (result->status != 200 && result->status != 201) {
        throw ServiceError(ErrorCode::kStorageFailure, "upload " + name + " failed: " + Describe(result));
    }
}

std::optional<std::string> GcsStorage::Get(const std::string& prefix, const std::string& path) {
    const auto name = ObjectName(prefix, path);
    const auto target = ObjectPath(name) + "?alt=media";
    auto result = Send("download " + name, [&](httplib::Client& client) {
        return client.Get(target);
    });
    if (result->status == 404) {
        return std::nullopt;
    }
    if (result->status != 200) {
        throw ServiceError(ErrorCode::kStorageFailure, "download " + name + " failed: " + Describe(result));
    }
    return result->body;
}

bool GcsStorage::Exists(const std::string& prefix, const std::string& path) {
    const auto name = ObjectName(prefix, path);
    const auto target = ObjectPath(name);
    auto result = Send("stat " + name, [&](httplib::Client& client) {
        return client.Get(target);
    });
    if (result->status == 404) {
        return false;
    }
    if (result->status != 200) {
        throw ServiceError(ErrorCode::kStorageFailure, "stat " + name + " failed: " + Describe(result));
    }
    return true;
}

std::vector<FileEntry> GcsStorage::List(const std::string& prefix) {
    const auto object_prefix = ObjectName(prefix, "");
    std::vector<FileEntry> entries;
    std::string page_token;
    do {
        auto target = base_path_ + "/storage/v1/b/" + UrlEncode(config_.bucket) +
            "/o?prefix=" + UrlEncode(object_prefix);
        if (!page_token.empty()) {
            target += "&pageToken=" + UrlEncode(page_token);
        }
        auto result = Send("list " + object_prefix, [&](httplib::Client& client) {
            return client.Get(target);
        });
        if (result->status != 200) {
            throw ServiceError(ErrorCode::kStorageFailure, "list " + object_prefix + " failed: " + Describe(result));
        }
        const auto json = nlohmann::json::parse(result->body, nullptr, false);
        if (json.is_discarded() || !json.is_object()) {
            throw ServiceError(ErrorCode::kStorageFailure, "list " + object_prefix + " returned invalid JSON");
        }
        if (json.contains("items") && json["items"].is_array()) {
            for (const auto& item : json["items"]) {
                const auto name = item.value("name", "");
                if (name.size() <= object_prefix.size() || name.back() == '/') {
                    continue;
                }
                FileEntry entry{};
                entry.path = name.substr(object_prefix.size());
                if (item.contains("size") && item["size"].is_string()) {
                    entry.size = ParseObjectSize(name, item["size"].get<std::string>());
                } else if (item.contains("size") && item["size"].is_number_unsigned()) {
                    entry.size = item["size"].get<std::uint64_t>();
                }
                entries.push_back(std::move(entry));
            }
        }
        page_token = json.value("nextPageToken", "");
    } while (!page_token.empty());

    std::sort(entries.begin(), entries.end(), [](const FileEntry& a, const FileEntry& b) {
        return a.path < b.path;
    });
    return entries;
}

bool GcsStorage::Remove(const std::string& prefix, const std::string& path) {
    const auto name = ObjectName(prefix, path);
    const auto target = ObjectPath(name);
    auto result = Send("delete " + name, [&](httplib::Client& client) {
        return client.Delete(target);
    });
    if (result->status == 404) {
        return false;
    }
    if (result->status != 200 && result->status != 204) {
        throw ServiceError(ErrorCode::kStorageFailure, "delete " + name + " failed: " + Describe(result));
    }
    return true;
}

bool GcsStorage::RemovePrefix(const std::string& prefix) {
    const auto entries = List(prefix);
    bool removed = false;
    for (const auto& entry : entries) {
        removed = Remove(prefix, entry.path) || removed;
    }
    return removed;
}

std::unique_ptr<Workspace> GcsStorage::Checkout(const std::string& prefix) {
    const auto directory = fs::temp_directory_path() / ("codeexec-" + prefix + "-" + utils::RandomUuid());
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw ServiceError(ErrorCode::kStorageFailure,
                           "cannot create workspace " + directory.string() + ": " + ec.message());
    }
    auto workspace = std::make_unique<GcsWorkspace>(*this, prefix, directory);
    for (const auto& entry : List(prefix)) {
        if (!CheckRelativePath(entry.path).empty()) {
            continue;
        }
        auto data = Get(prefix, entry.path);
        if (!data) {
            continue;
        }
        const auto target = directory / entry.path;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw ServiceError(ErrorCode::kStorageFailure,
                               "cannot create directory in workspace: " + ec.message());
        }
        WriteFileAtomic(target, *data);
    }
    workspace->SetBaseline(SnapshotDirectory(directory));
    return workspace;
}

}  // namespace codeexec::storage

#include "api/http_server.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <optional>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/crypto.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace codeexec::api {
namespace {

using utils::ErrorCode;
using utils::ServiceError;

constexpr const char* kApiKeyHeader = "x-api-key";
constexpr const char* kJsonType = "application/json";
constexpr std::size_t kMebibyte = 1024 * 1024;

thread_local std::chrono::steady_clock::time_point t_request_started;

int HttpStatusFor(ErrorCode code, bool download) {
    switch (code) {
        case ErrorCode::kUnauthorized: return 401;
        case ErrorCode::kSessionNotFound: return 404;
        case ErrorCode::kUnsupportedLanguage: return 400;
        case ErrorCode::kInvalidPath: return download ? 404 : 400;
        case ErrorCode::kInvalidRequest: return 400;
        case ErrorCode::kFileNotFound: return 404;
        case ErrorCode::kStorageFailure: return 503;
        case ErrorCode::kExecutionTimedOut:
        case ErrorCode::kResourceLimitExceeded:
        case ErrorCode::kInternalError:
            return 500;
    }
    return 500;
}

void WriteJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), kJsonType);
}

void WriteError(httplib::Response& res, ErrorCode code, const std::string& detail, bool download) {
    std::string public_detail = detail;
    if (code == ErrorCode::kStorageFailure) {
        utils::Log(utils::LogLevel::kError, "api", "storage failure", {{"detail", detail}});
        public_detail = "Storage backend unavailable";
    } else if (code == ErrorCode::kInternalError) {
        utils::Log(utils::LogLevel::kError, "api", "internal error", {{"detail", detail}});
        public_detail = "Internal server error";
    }
    WriteJson(res, HttpStatusFor(code, download), {{"error", utils::ToString(code)}, {"detail", public_detail}});
}

using RouteHandler = std::function<void(const httplib::Request&, httplib::Response&)>;

// Maps exceptions thrown by the core into error responses.
httplib::Server::Handler Guarded(RouteHandler handler, bool download = false) {
    return [handler = std::move(handler), download](const httplib::Request& req, httplib::Response& res) {
        try {
            handler(req, res);
        } catch (const ServiceError& ex) {
            WriteError(res, ex.Code(), ex.what(), download);
        } catch (const std::exception& ex) {
            WriteError(res, ErrorCode::kInternalError, ex.what(), download);
        }
    };
}

nlohmann::json ParseJsonBody(const httplib::Request& req) {
    if (req.body.empty()) {
        return nlohmann::json::object();
    }
    auto json = nlohmann::json::parse(req.body, nullptr, false);
    if (json.is_discarded()) {
        throw ServiceError(ErrorCode::kInvalidRequest, "Malformed JSON body");
    }
    if (!json.is_object()) {
        throw ServiceError(ErrorCode::kInvalidRequest, "JSON body must be an object");
    }
    return json;
}

std::optional<std::string> OptionalString(const nlohmann::json& body, const char* key) {
    if (!body.contains(key) || body[key].is_null()) {
        return std::nullopt;
    }
    if (!body[key].is_string()) {
        throw ServiceError(ErrorCode::kInvalidRequest, std::string(key) + " must be a string");
    }
    return body[key].get<std::string>();
}

nlohmann::json FileNames(const std::vector<storage::FileEntry>& files) {
    nlohmann::json names = nlohmann::json::array();
    for (const auto& file : files) {
        names.push_back(file.path);
    }
    return names;
}

nlohmann::json SessionJson(const session::SessionInfo& info, const std::vector<storage::FileEntry>& files) {
    return {
        {"session_id", info.id},
        {"language", session::ToString(info.language)},
        {"created_at", info.created_at},
        {"files", FileNames(files)}
    };
}

// Last path segment, with quotes replaced so it fits a quoted header parameter.
std::string DownloadName(const std::string& path) {
    const auto slash = path.find_last_of('/');
    auto name = slash == std::string::npos ? path : path.substr(slash + 1);
    std::replace(name.begin(), name.end(), '"', '_');
    return name;
}

}  // namespace

HttpServer::HttpServer(const config::ServerConfig& server_config,
                       const config::LimitsConfig& limits,
                       session::SessionRegistry& sessions,
                       engine::ExecutionEngine& engine)
    : config_(server_config)
    , sessions_(sessions)
    , engine_(engine)
    , server_(std::make_unique<httplib::Server>()) {
    const auto workers = static_cast<std::size_t>(config_.workers);
    server_->new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
    server_->set_payload_max_length(static_cast<std::size_t>(limits.max_upload_mb) * kMebibyte);
    RegisterRoutes();
}

HttpServer::~HttpServer() = default;

void HttpServer::RegisterRoutes() {
    server_->set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        t_request_started = std::chrono::steady_clock::now();
        if (req.path == "/health" || config_.disable_auth) {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        const auto provided = req.get_header_value(kApiKeyHeader);
        if (provided.empty() || !utils::ConstantTimeEquals(provided, config_.api_key)) {
            WriteError(res, ErrorCode::kUnauthorized, "Invalid API key", false);
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });

    server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t_request_started);
        utils::Log(utils::LogLevel::kInfo, "http", "request",
                   {{"method", req.method},
                    {"path", req.path},
                    {"status", std::to_string(res.status)},
                    {"duration_ms", std::to_string(elapsed.count())}});
    });

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        WriteJson(res, 200, {{"status", "ok"}});
    });

    server_->Post("/v1/sessions", Guarded([this](const httplib::Request& req, httplib::Response& res) {
        const auto body = ParseJsonBody(req);
        const auto language = OptionalString(body, "language").value_or("python");
        const auto info = sessions_.Create(language);
        WriteJson(res, 201, SessionJson(info, {}));
    }));

    server_->Get(R"(/v1/sessions/([^/]+))", Guarded([this](const httplib::Request& req, httplib::Response& res) {
        const std::string session_id = req.matches[1];
        const auto info = sessions_.Get(session_id);
        WriteJson(res, 200, SessionJson(info, sessions_.ListFiles(session_id)));
    }));

    server_->Delete(R"(/v1/sessions/([^/]+))", Guarded([this](const httplib::Request& req, httplib::Response& res) {
        sessions_.Delete(req.matches[1]);
        res.status = 204;
    }));

    server_->Post(R"(/v1/sessions/([^/]+)/execute)",
                  Guarded([this](const httplib::Request& req, httplib::Response& res) {
        const auto body = ParseJsonBody(req);
        const auto code = OptionalString(body, "code");
        if (!code) {
            throw ServiceError(ErrorCode::kInvalidRequest, "code is required");
        }
        engine::ExecuteRequest request{};
        request.session_id = req.matches[1];
        request.code = *code;
        request.stdin_data = OptionalString(body, "stdin").value_or("");
        request.language = OptionalString(body, "language");

        const auto record = engine_.Execute(request);
        WriteJson(res, 200, {
            {"status", engine::ToString(record.status)},
            {"stdout", record.stdout_text},
            {"stderr", record.stderr_text},
            {"exit_code", record.exit_code},
            {"duration_ms", record.duration.count()},
            {"files", FileNames(record.files)},
            {"modified_files", record.modified_files},
            {"stdout_truncated", record.stdout_truncated},
            {"stderr_truncated", record.stderr_truncated}
        });
    }));

    server_->Post(R"(/v1/sessions/([^/]+)/files)", Guarded([this](const httplib::Request& req, httplib::Response& res) {
        if (!req.is_multipart_form_data()) {
            throw ServiceError(ErrorCode::kInvalidRequest, "multipart/form-data body required");
        }
        std::vector<session::UploadedFile> uploads;
        for (const auto& [field, part] : req.files) {
            session::UploadedFile upload{};
            upload.path = part.filename.empty() ? field : part.filename;
            upload.content = part.content;
            uploads.push_back(std::move(upload));
        }
        if (uploads.empty()) {
            throw ServiceError(ErrorCode::kInvalidRequest, "no files in request");
        }
        const auto saved = sessions_.SaveFiles(req.matches[1], uploads);
        WriteJson(res, 200, {{"saved", saved}});
    }));

    server_->Get(R"(/v1/sessions/([^/]+)/files)", Guarded([this](const httplib::Request& req, httplib::Response& res) {
        nlohmann::json files = nlohmann::json::array();
        for (const auto& entry : sessions_.ListFiles(req.matches[1])) {
            files.push_back({{"path", entry.path}, {"size", entry.size}});
        }
        WriteJson(res, 200, {{"files", files}});
    }));

    server_->Get(R"(/v1/sessions/([^/]+)/files/(.+))",
                 Guarded([this](const httplib::Request& req, httplib::Response& res) {
        const std::string path = req.matches[2];
        auto data = sessions_.ReadFile(req.matches[1], path);
        res.status = 200;
        res.set_header("Content-Disposition", "attachment; filename=\"" + DownloadName(path) + "\"");
        res.set_content(std::move(data), "application/octet-stream");
    }, true));

    server_->Delete(R"(/v1/sessions/([^/]+)/files/(.+))",
                    Guarded([this](const httplib::Request& req, httplib::Response& res) {
        sessions_.DeleteFile(req.matches[1], req.matches[2]);
        res.status = 204;
    }));
}

bool HttpServer::Listen() {
    utils::Log(utils::LogLevel::kInfo, "http", "listening",
               {{"host", config_.host},
                {"port", std::to_string(config_.port)},
                {"workers", std::to_string(config_.workers)},
                {"auth", config_.disable_auth ? "disabled" : "enabled"}});
    return server_->listen(config_.host, config_.port);
}

int HttpServer::BindToAnyPort(const std::string& host) {
    return server_->bind_to_any_port(host);
}

bool HttpServer::ListenAfterBind() {
    return server_->listen_after_bind();
}

void HttpServer::Stop() {
    server_->stop();
}

bool HttpServer::IsRunning() const {
    return server_->is_running();
}

void HttpServer::WaitUntilReady() const {
    server_->wait_until_ready();
}

}  // namespace codeexec::api

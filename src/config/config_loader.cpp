#include "config/config_loader.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"

namespace codeexec::config {
namespace {

using utils::GetEnv;

bool ParseBool(const std::string& value) {
    const auto lowered = utils::ToLower(utils::Trim(value));
    return lowered == "1" || lowered == "true" || lowered == "t" || lowered == "yes" ||
        lowered == "y" || lowered == "on";
}

int ParseInt(const char* name, const std::string& value) {
    std::size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(std::string("Invalid integer for ") + name + ": " + value);
    }
    if (consumed != utils::Trim(value).size()) {
        throw ConfigError(std::string("Invalid integer for ") + name + ": " + value);
    }
    return parsed;
}

long long ParseLong(const char* name, const std::string& value) {
    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(std::string("Invalid integer for ") + name + ": " + value);
    }
    if (consumed != utils::Trim(value).size()) {
        throw ConfigError(std::string("Invalid integer for ") + name + ": " + value);
    }
    return parsed;
}

StorageKind ParseStorageKind(const std::string& value) {
    const auto lowered = utils::ToLower(utils::Trim(value));
    if (lowered == "local") {
        return StorageKind::kLocal;
    }
    if (lowered == "gcs" || lowered == "object-store") {
        return StorageKind::kGcs;
    }
    throw ConfigError("Invalid CODEEXEC_STORAGE_BACKEND: " + value + ". Use 'local' or 'gcs'.");
}

std::vector<std::string> LowerAll(std::vector<std::string> items) {
    for (auto& item : items) {
        item = utils::ToLower(item);
    }
    return items;
}

std::vector<std::string> StringArray(const nlohmann::json& array) {
    std::vector<std::string> items;
    for (const auto& item : array) {
        if (item.is_string()) {
            items.push_back(item.get<std::string>());
        }
    }
    return items;
}

void ApplyServer(ServerConfig& server, const nlohmann::json& data) {
    if (data.contains("host") && data["host"].is_string()) {
        server.host = data["host"].get<std::string>();
    }
    if (data.contains("port") && data["port"].is_number_integer()) {
        server.port = data["port"].get<int>();
    }
    if (data.contains("workers") && data["workers"].is_number_integer()) {
        server.workers = data["workers"].get<int>();
    }
    if (data.contains("apiKey") && data["apiKey"].is_string()) {
        server.api_key = data["apiKey"].get<std::string>();
    }
    if (data.contains("disableAuth") && data["disableAuth"].is_boolean()) {
        server.disable_auth = data["disableAuth"].get<bool>();
    }
}

void ApplyStorage(StorageConfig& storage, const nlohmann::json& data) {
    if (data.contains("backend") && data["backend"].is_string()) {
        storage.kind = ParseStorageKind(data["backend"].get<std::string>());
    }
    if (data.contains("path") && data["path"].is_string()) {
        storage.path = data["path"].get<std::string>();
    }
    if (data.contains("gcs") && data["gcs"].is_object()) {
        const auto& gcs = data["gcs"];
        if (gcs.contains("bucket") && gcs["bucket"].is_string()) {
            storage.gcs.bucket = gcs["bucket"].get<std::string>();
        }
        if (gcs.contains("endpoint") && gcs["endpoint"].is_string()) {
            storage.gcs.endpoint = gcs["endpoint"].get<std::string>();
        }
        if (gcs.contains("accessToken") && gcs["accessToken"].is_string()) {
            storage.gcs.access_token = gcs["accessToken"].get<std::string>();
        }
        if (gcs.contains("timeoutS") && gcs["timeoutS"].is_number_integer()) {
            storage.gcs.timeout_s = gcs["timeoutS"].get<int>();
        }
    }
}

void ApplyLimits(LimitsConfig& limits, const nlohmann::json& data) {
    if (data.contains("maxMemoryMb") && data["maxMemoryMb"].is_number_integer()) {
        limits.max_memory_mb = data["maxMemoryMb"].get<int>();
    }
    if (data.contains("maxCpuSecs") && data["maxCpuSecs"].is_number_integer()) {
        limits.max_cpu_secs = data["maxCpuSecs"].get<int>();
    }
    if (data.contains("maxExecutionSeconds") && data["maxExecutionSeconds"].is_number_integer()) {
        limits.max_execution_seconds = data["maxExecutionSeconds"].get<int>();
    }
    if (data.contains("maxFileSizeMb") && data["maxFileSizeMb"].is_number_integer()) {
        limits.max_file_size_mb = data["maxFileSizeMb"].get<int>();
    }
    if (data.contains("maxOutputBytes") && data["maxOutputBytes"].is_number_integer()) {
        limits.max_output_bytes = data["maxOutputBytes"].get<long long>();
    }
    if (data.contains("maxUploadMb") && data["maxUploadMb"].is_number_integer()) {
        limits.max_upload_mb = data["maxUploadMb"].get<int>();
    }
}

void ApplySandbox(SandboxConfig& sandbox, const nlohmann::json& data) {
    if (data.contains("allowedLangs") && data["allowedLangs"].is_array()) {
        sandbox.allowed_langs = LowerAll(StringArray(data["allowedLangs"]));
    }
    if (data.contains("disableNetwork") && data["disableNetwork"].is_boolean()) {
        sandbox.disable_network = data["disableNetwork"].get<bool>();
    }
    if (data.contains("envPassthrough") && data["envPassthrough"].is_array()) {
        sandbox.env_passthrough = StringArray(data["envPassthrough"]);
    }
    if (data.contains("pythonBin") && data["pythonBin"].is_string()) {
        sandbox.python_bin = data["pythonBin"].get<std::string>();
    }
    if (data.contains("bashBin") && data["bashBin"].is_string()) {
        sandbox.bash_bin = data["bashBin"].get<std::string>();
    }
}

void ApplyEnvironment(Config& config) {
    if (const auto value = GetEnv("CODEEXEC_API_KEY"); !value.empty()) {
        config.server.api_key = value;
    }
    if (const auto value = GetEnv("CODEEXEC_DISABLE_AUTH"); !value.empty()) {
        config.server.disable_auth = ParseBool(value);
    }
    if (const auto value = GetEnv("CODEEXEC_HOST"); !value.empty()) {
        config.server.host = value;
    }
    if (const auto value = GetEnv("PORT"); !value.empty()) {
        config.server.port = ParseInt("PORT", value);
    }
    if (const auto value = GetEnv("CODEEXEC_WORKERS"); !value.empty()) {
        config.server.workers = ParseInt("CODEEXEC_WORKERS", value);
    }

    if (const auto value = GetEnv("CODEEXEC_STORAGE_BACKEND"); !value.empty()) {
        config.storage.kind = ParseStorageKind(value);
    }
    if (const auto value = GetEnv("CODEEXEC_STORAGE_PATH"); !value.empty()) {
        config.storage.path = value;
    }
    if (const auto value = GetEnv("CODEEXEC_GCS_BUCKET"); !value.empty()) {
        config.storage.gcs.bucket = value;
    }
    if (const auto value = GetEnv("CODEEXEC_GCS_ENDPOINT"); !value.empty()) {
        config.storage.gcs.endpoint = value;
    }
    if (const auto value = GetEnv("CODEEXEC_GCS_ACCESS_TOKEN"); !value.empty()) {
        config.storage.gcs.access_token = value;
    }

    if (const auto value = GetEnv("CODEEXEC_ALLOWED_LANGS"); !value.empty()) {
        config.sandbox.allowed_langs = LowerAll(utils::SplitCsv(value));
    }
    if (const auto value = GetEnv("CODEEXEC_MAX_MEMORY_MB"); !value.empty()) {
        config.limits.max_memory_mb = ParseInt("CODEEXEC_MAX_MEMORY_MB", value);
    }
    if (const auto value = GetEnv("CODEEXEC_MAX_CPU_SECS"); !value.empty()) {
        config.limits.max_cpu_secs = ParseInt("CODEEXEC_MAX_CPU_SECS", value);
    }
    if (const auto value = GetEnv("CODEEXEC_MAX_EXECUTION_SECONDS"); !value.empty()) {
        config.limits.max_execution_seconds = ParseInt("CODEEXEC_MAX_EXECUTION_SECONDS", value);
    }
    if (const auto value = GetEnv("CODEEXEC_MAX_FILE_SIZE_MB"); !value.empty()) {
        config.limits.max_file_size_mb = ParseInt("CODEEXEC_MAX_FILE_SIZE_MB", value);
    }
    if (const auto value = GetEnv("CODEEXEC_MAX_OUTPUT_BYTES"); !value.empty()) {
        config.limits.max_output_bytes = ParseLong("CODEEXEC_MAX_OUTPUT_BYTES", value);
    }
    if (const auto value = GetEnv("CODEEXEC_MAX_UPLOAD_MB"); !value.empty()) {
        config.limits.max_upload_mb = ParseInt("CODEEXEC_MAX_UPLOAD_MB", value);
    }

    if (const auto value = GetEnv("CODEEXEC_DISABLE_NETWORK"); !value.empty()) {
        config.sandbox.disable_network = ParseBool(value);
    }
    if (const auto value = GetEnv("CODEEXEC_ENV_PASSTHROUGH"); !value.empty()) {
        config.sandbox.env_passthrough = utils::SplitCsv(value);
    }
    if (const auto value = GetEnv("CODEEXEC_PYTHON_BIN"); !value.empty()) {
        config.sandbox.python_bin = value;
    }
    if (const auto value = GetEnv("CODEEXEC_BASH_BIN"); !value.empty()) {
        config.sandbox.bash_bin = value;
    }

    if (const auto value = GetEnv("CODEEXEC_LOG_LEVEL"); !value.empty()) {
        if (!utils::ParseLogLevel(value, config.logging.min_level)) {
            throw ConfigError("Invalid CODEEXEC_LOG_LEVEL: " + value);
        }
    }
}

}  // namespace

const char* ToString(StorageKind kind) {
    switch (kind) {
        case StorageKind::kLocal: return "local";
        case StorageKind::kGcs: return "gcs";
    }
    return "local";
}

void ApplyConfigFromJson(Config& config, const std::string& json_text) {
    const auto data = nlohmann::json::parse(json_text, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        throw ConfigError("config file is not a JSON object");
    }
    if (data.contains("server") && data["server"].is_object()) {
        ApplyServer(config.server, data["server"]);
    }
    if (data.contains("storage") && data["storage"].is_object()) {
        ApplyStorage(config.storage, data["storage"]);
    }
    if (data.contains("limits") && data["limits"].is_object()) {
        ApplyLimits(config.limits, data["limits"]);
    }
    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        ApplySandbox(config.sandbox, data["sandbox"]);
    }
    if (data.contains("logLevel") && data["logLevel"].is_string()) {
        const auto level = data["logLevel"].get<std::string>();
        if (!utils::ParseLogLevel(level, config.logging.min_level)) {
            throw ConfigError("Invalid logLevel: " + level);
        }
    }
}

void Validate(const Config& config) {
    if (config.server.api_key.empty() && !config.server.disable_auth) {
        throw ConfigError("CODEEXEC_API_KEY must be set (or CODEEXEC_DISABLE_AUTH=true for local development)");
    }
    if (config.server.port <= 0 || config.server.port > 65535) {
        throw ConfigError("PORT out of range: " + std::to_string(config.server.port));
    }
    if (config.server.workers <= 0) {
        throw ConfigError("CODEEXEC_WORKERS must be positive");
    }
    if (config.storage.kind == StorageKind::kGcs && config.storage.gcs.bucket.empty()) {
        throw ConfigError("CODEEXEC_GCS_BUCKET must be set when using the GCS storage backend");
    }
    if (config.storage.kind == StorageKind::kLocal && config.storage.path.empty()) {
        throw ConfigError("CODEEXEC_STORAGE_PATH must not be empty");
    }
    if (config.limits.max_execution_seconds <= 0) {
        throw ConfigError("CODEEXEC_MAX_EXECUTION_SECONDS must be positive");
    }
    if (config.limits.max_memory_mb < 0 || config.limits.max_cpu_secs < 0 ||
        config.limits.max_file_size_mb < 0 || config.limits.max_upload_mb < 0) {
        throw ConfigError("resource limits must not be negative");
    }
    if (config.limits.max_output_bytes <= 0) {
        throw ConfigError("CODEEXEC_MAX_OUTPUT_BYTES must be positive");
    }
    if (config.sandbox.allowed_langs.empty()) {
        throw ConfigError("CODEEXEC_ALLOWED_LANGS must name at least one language");
    }
}

Config LoadConfig() {
    Config config{};

    const auto config_path = GetEnv("CODEEXEC_CONFIG_FILE");
    if (!config_path.empty()) {
        std::ifstream input(config_path);
        if (!input.is_open()) {
            throw ConfigError("cannot open config file: " + config_path);
        }
        std::stringstream buffer;
        buffer << input.rdbuf();
        ApplyConfigFromJson(config, buffer.str());
    }

    ApplyEnvironment(config);
    Validate(config);
    return config;
}

}  // namespace codeexec::config

#pragma once

#include <string>
#include <vector>

#include "utils/logging.hpp"

namespace codeexec::config {

enum class StorageKind {
    kLocal,
    kGcs
};

struct GcsConfig {
    std::string bucket;
    std::string endpoint = "https://storage.googleapis.com";
    std::string access_token;
    std::string metadata_host = "metadata.google.internal";
    int timeout_s = 30;
};

struct StorageConfig {
    StorageKind kind = StorageKind::kLocal;
    std::string path = "/tmp/codeexec";
    GcsConfig gcs;
};

struct LimitsConfig {
    int max_memory_mb = 512;
    int max_cpu_secs = 30;
    int max_execution_seconds = 30;
    int max_file_size_mb = 100;
    long long max_output_bytes = 1024 * 1024;
    int max_upload_mb = 50;
};

struct SandboxConfig {
    std::vector<std::string> allowed_langs = {"python", "bash"};
    bool disable_network = true;
    std::vector<std::string> env_passthrough;
    std::string python_bin = "python3";
    std::string bash_bin = "bash";
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    int workers = 4;
    std::string api_key;
    bool disable_auth = false;
};

struct Config {
    ServerConfig server;
    StorageConfig storage;
    LimitsConfig limits;
    SandboxConfig sandbox;
    utils::LogConfig logging;
};

const char* ToString(StorageKind kind);

}  // namespace codeexec::config

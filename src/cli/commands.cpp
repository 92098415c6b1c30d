#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "api/http_server.hpp"
#include "config/config_loader.hpp"
#include "engine/execution_engine.hpp"
#include "executor/executor_registry.hpp"
#include "nlohmann/json.hpp"
#include "session/session_registry.hpp"
#include "storage/storage_factory.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

nlohmann::json DescribeConfig(const codeexec::config::Config& config) {
    return {
        {"server", {
            {"host", config.server.host},
            {"port", config.server.port},
            {"workers", config.server.workers},
            {"apiKey", config.server.api_key.empty() ? "" : codeexec::utils::MaskKey(config.server.api_key)},
            {"disableAuth", config.server.disable_auth}
        }},
        {"storage", {
            {"backend", codeexec::config::ToString(config.storage.kind)},
            {"path", config.storage.path},
            {"gcs", {
                {"bucket", config.storage.gcs.bucket},
                {"endpoint", config.storage.gcs.endpoint},
                {"accessToken", config.storage.gcs.access_token.empty() ? "" : "****"}
            }}
        }},
        {"limits", {
            {"maxMemoryMb", config.limits.max_memory_mb},
            {"maxCpuSecs", config.limits.max_cpu_secs},
            {"maxExecutionSeconds", config.limits.max_execution_seconds},
            {"maxFileSizeMb", config.limits.max_file_size_mb},
            {"maxOutputBytes", config.limits.max_output_bytes},
            {"maxUploadMb", config.limits.max_upload_mb}
        }},
        {"sandbox", {
            {"allowedLangs", config.sandbox.allowed_langs},
            {"disableNetwork", config.sandbox.disable_network},
            {"envPassthrough", config.sandbox.env_passthrough},
            {"pythonBin", config.sandbox.python_bin},
            {"bashBin", config.sandbox.bash_bin}
        }},
        {"logLevel", codeexec::utils::ToLower(codeexec::utils::ToString(config.logging.min_level))}
    };
}

int CheckConfig() {
    try {
        const auto config = codeexec::config::LoadConfig();
        std::cout << DescribeConfig(config).dump(2) << std::endl;
        return 0;
    } catch (const codeexec::config::ConfigError& ex) {
        std::cerr << "Invalid configuration: " << ex.what() << std::endl;
        return 1;
    }
}

int Serve() {
    codeexec::config::Config config;
    try {
        config = codeexec::config::LoadConfig();
    } catch (const codeexec::config::ConfigError& ex) {
        std::cerr << "Invalid configuration: " << ex.what() << std::endl;
        return 1;
    }
    codeexec::utils::ConfigureLogging(config.logging);

    std::unique_ptr<codeexec::storage::StorageBackend> storage;
    try {
        storage = codeexec::storage::CreateStorage(config.storage);
    } catch (const codeexec::utils::ServiceError& ex) {
        codeexec::utils::Log(codeexec::utils::LogLevel::kError, "main", "storage unavailable",
                             {{"error", ex.what()}});
        return 1;
    }

    auto executors = codeexec::executor::CreateExecutors(config);
    if (executors->Languages().empty()) {
        codeexec::utils::Log(codeexec::utils::LogLevel::kError, "main", "no language has a usable interpreter");
        return 1;
    }
    codeexec::session::SessionRegistry sessions(*storage, executors->Languages());
    codeexec::engine::ExecutionEngine engine(sessions, *storage, *executors);
    codeexec::api::HttpServer http_server(config.server, config.limits, sessions, engine);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    signal(SIGPIPE, SIG_IGN);

    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&http_server, &listen_failed]() {
        if (!http_server.Listen()) {
            listen_failed.store(true);
        }
    });

    codeexec::utils::Log(codeexec::utils::LogLevel::kInfo, "main", "codeexec started",
                         {{"storage", storage->Name()},
                          {"api_key", config.server.disable_auth ? "disabled"
                                                                 : codeexec::utils::MaskKey(config.server.api_key)}});
    while (g_signal == 0 && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    http_server.Stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    if (listen_failed.load()) {
        codeexec::utils::Log(codeexec::utils::LogLevel::kError, "main", "http server failed to listen",
                             {{"host", config.server.host}, {"port", std::to_string(config.server.port)}});
        return 1;
    }
    codeexec::utils::Log(codeexec::utils::LogLevel::kInfo, "main", "codeexec stopped",
                         {{"signal", std::to_string(static_cast<int>(g_signal))}});
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    const std::string command = argc >= 2 ? argv[1] : "serve";
    if (command == "serve") {
        return Serve();
    }
    if (command == "check-config") {
        return CheckConfig();
    }
    std::cout << "Usage: codeexec [serve | check-config]" << std::endl;
    return 1;
}

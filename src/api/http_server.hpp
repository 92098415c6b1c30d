#pragma once

#include <memory>
#include <string>

#include "config/config_schema.hpp"
#include "engine/execution_engine.hpp"
#include "session/session_registry.hpp"

namespace httplib {
class Server;
}

namespace codeexec::api {

// HTTP surface over the registry and the engine. Every route except /health
// requires the x-api-key header unless auth is disabled in config.
class HttpServer {
public:
    HttpServer(const config::ServerConfig& server_config,
               const config::LimitsConfig& limits,
               session::SessionRegistry& sessions,
               engine::ExecutionEngine& engine);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Blocks until Stop() is called. Returns false when the socket cannot be bound.
    bool Listen();
    // Binds an ephemeral port on host and returns it, or -1.
    int BindToAnyPort(const std::string& host);
    bool ListenAfterBind();
    void Stop();
    bool IsRunning() const;
    void WaitUntilReady() const;

private:
    void RegisterRoutes();

    config::ServerConfig config_;
    session::SessionRegistry& sessions_;
    engine::ExecutionEngine& engine_;
    std::unique_ptr<httplib::Server> server_;
};

}  // namespace codeexec::api

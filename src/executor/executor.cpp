#include "executor/executor.hpp"

#include <boost/process/search_path.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unistd.h>

#include "sandbox/scoped_temp_dir.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace codeexec::executor {

namespace fs = std::filesystem;

const char* const kSandboxPath = "/usr/local/bin:/usr/bin:/bin";

namespace {

const char* kProxyVars[] = {
    "HTTP_PROXY",
    "HTTPS_PROXY",
    "ALL_PROXY",
    "http_proxy",
    "https_proxy",
    "all_proxy",
    "NO_PROXY",
    "no_proxy"
};

void WriteScript(const fs::path& path, const std::string& code) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw utils::ServiceError(utils::ErrorCode::kInternalError, "cannot create script " + path.string());
    }
    output << code;
    if (!output) {
        throw utils::ServiceError(utils::ErrorCode::kInternalError, "cannot write script " + path.string());
    }
}

}  // namespace

std::string ResolveInterpreter(const std::string& name) {
    if (name.empty()) {
        return {};
    }
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0 ? name : std::string();
    }
    std::vector<boost::filesystem::path> dirs;
    std::stringstream stream(kSandboxPath);
    std::string dir;
    while (std::getline(stream, dir, ':')) {
        dirs.emplace_back(dir);
    }
    const auto found = boost::process::search_path(name, dirs);
    return found.empty() ? std::string() : found.string();
}

Executor::Executor(std::string interpreter, sandbox::ResourceLimits limits, EnvironmentPolicy policy)
    : interpreter_(std::move(interpreter))
    , limiter_(limits)
    , policy_(std::move(policy)) {}

void Executor::AddLanguageEnvironment(std::map<std::string, std::string>&, const fs::path&) const {}

std::map<std::string, std::string> Executor::BuildEnvironment(const fs::path& session_dir,
                                                              const fs::path& temp_dir) const {
    std::map<std::string, std::string> env;
    for (const auto& name : policy_.passthrough) {
        if (const char* value = std::getenv(name.c_str())) {
            env[name] = value;
        }
    }
    if (!policy_.disable_network) {
        for (const auto* key : kProxyVars) {
            if (const char* value = std::getenv(key)) {
                env[key] = value;
            }
        }
    }
    env["PATH"] = kSandboxPath;
    env["HOME"] = session_dir.string();
    env["LANG"] = "C.UTF-8";
    env["TMPDIR"] = temp_dir.string();
    env["CODEEXEC_NETWORK"] = policy_.disable_network ? "disabled" : "enabled";
    AddLanguageEnvironment(env, session_dir);
    return env;
}

RunOutcome Executor::Run(const fs::path& session_dir,
                         const std::string& code,
                         const std::string& stdin_data) const {
    sandbox::ScopedTempDir script_dir("script");
    const auto script = script_dir.Path() / ScriptName();
    WriteScript(script, code);
    const auto temp_dir = script_dir.Path() / "tmp";
    std::error_code ec;
    fs::create_directories(temp_dir, ec);
    if (ec) {
        throw utils::ServiceError(utils::ErrorCode::kInternalError, "cannot create " + temp_dir.string());
    }

    sandbox::Invocation invocation{};
    invocation.program = interpreter_;
    invocation.args = Arguments(script);
    invocation.working_dir = session_dir;
    invocation.environment = BuildEnvironment(session_dir, temp_dir);
    invocation.stdin_data = stdin_data;

    utils::Log(utils::LogLevel::kDebug, "executor", "spawning",
               {{"language", session::ToString(Lang())}, {"interpreter", interpreter_}});
    RunOutcome outcome{};
    outcome.process = limiter_.Run(invocation);
    outcome.memory_exhausted = Limits().max_memory_bytes > 0 && !outcome.process.timed_out &&
        outcome.process.exit_code != 0 && ReportsOutOfMemory(outcome.process.error);
    return outcome;
}

}  // namespace codeexec::executor

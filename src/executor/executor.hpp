#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "sandbox/resource_limiter.hpp"
#include "session/session_types.hpp"

namespace codeexec::executor {

struct EnvironmentPolicy {
    bool disable_network = true;
    std::vector<std::string> passthrough;
};

struct RunOutcome {
    sandbox::ExecResult process;
    bool memory_exhausted = false;

    bool LimitExceeded() const {
        return process.cpu_limit_exceeded || process.file_size_limit_exceeded || memory_exhausted;
    }
};

class Executor {
public:
    Executor(std::string interpreter, sandbox::ResourceLimits limits, EnvironmentPolicy policy);
    virtual ~Executor() = default;

    virtual session::Language Lang() const = 0;

    // Writes the code to a private script outside session_dir and runs it with
    // session_dir as the working directory.
    RunOutcome Run(const std::filesystem::path& session_dir,
                   const std::string& code,
                   const std::string& stdin_data) const;

    const std::string& Interpreter() const { return interpreter_; }
    const sandbox::ResourceLimits& Limits() const { return limiter_.Limits(); }

protected:
    virtual std::string ScriptName() const = 0;
    virtual std::vector<std::string> Arguments(const std::filesystem::path& script) const = 0;
    virtual void AddLanguageEnvironment(std::map<std::string, std::string>& env,
                                        const std::filesystem::path& session_dir) const;
    virtual bool ReportsOutOfMemory(const std::string& error_output) const = 0;

private:
    std::map<std::string, std::string> BuildEnvironment(const std::filesystem::path& session_dir,
                                                        const std::filesystem::path& temp_dir) const;

    std::string interpreter_;
    sandbox::ResourceLimiter limiter_;
    EnvironmentPolicy policy_;
};

// Absolute path of an interpreter looked up on the sandbox PATH, or empty when
// it cannot be found. Names containing a slash are taken as paths.
std::string ResolveInterpreter(const std::string& name);

extern const char* const kSandboxPath;

}  // namespace codeexec::executor

#pragma once

#include "executor/executor.hpp"

namespace codeexec::executor {

class PythonExecutor : public Executor {
public:
    using Executor::Executor;

    session::Language Lang() const override { return session::Language::kPython; }

protected:
    std::string ScriptName() const override { return "main.py"; }
    std::vector<std::string> Arguments(const std::filesystem::path& script) const override;
    void AddLanguageEnvironment(std::map<std::string, std::string>& env,
                                const std::filesystem::path& session_dir) const override;
    bool ReportsOutOfMemory(const std::string& error_output) const override;
};

}  // namespace codeexec::executor

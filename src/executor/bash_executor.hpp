#pragma once

#include "executor/executor.hpp"

namespace codeexec::executor {

class BashExecutor : public Executor {
public:
    using Executor::Executor;

    session::Language Lang() const override { return session::Language::kBash; }

protected:
    std::string ScriptName() const override { return "main.sh"; }
    std::vector<std::string> Arguments(const std::filesystem::path& script) const override;
    bool ReportsOutOfMemory(const std::string& error_output) const override;
};

}  // namespace codeexec::executor

#pragma once

#include <map>
#include <memory>
#include <set>

#include "config/config_schema.hpp"
#include "executor/executor.hpp"

namespace codeexec::executor {

class ExecutorRegistry {
public:
    void Register(std::unique_ptr<Executor> executor);
    const Executor* Get(session::Language language) const;
    bool Has(session::Language language) const;
    std::set<session::Language> Languages() const;

private:
    std::map<session::Language, std::unique_ptr<Executor>> executors_;
};

sandbox::ResourceLimits LimitsFromConfig(const config::LimitsConfig& limits);

// One executor per allowed language whose interpreter can be found. Languages
// that are allowed but unavailable are logged and left out.
std::unique_ptr<ExecutorRegistry> CreateExecutors(const config::Config& config);

}  // namespace codeexec::executor

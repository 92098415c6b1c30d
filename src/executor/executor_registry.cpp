#include "executor/executor_registry.hpp"

#include "executor/bash_executor.hpp"
#include "executor/python_executor.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codeexec::executor {
namespace {

constexpr std::uint64_t kMebibyte = 1024ULL * 1024ULL;

}  // namespace

void ExecutorRegistry::Register(std::unique_ptr<Executor> executor) {
    const auto language = executor->Lang();
    executors_[language] = std::move(executor);
}

const Executor* ExecutorRegistry::Get(session::Language language) const {
    auto it = executors_.find(language);
    if (it == executors_.end()) {
        return nullptr;
    }
    return it->second.get();
}

bool ExecutorRegistry::Has(session::Language language) const {
    return executors_.find(language) != executors_.end();
}

std::set<session::Language> ExecutorRegistry::Languages() const {
    std::set<session::Language> languages;
    for (const auto& [language, executor] : executors_) {
        languages.insert(language);
    }
    return languages;
}

sandbox::ResourceLimits LimitsFromConfig(const config::LimitsConfig& limits) {
    sandbox::ResourceLimits result{};
    result.wall_timeout = std::chrono::seconds(limits.max_execution_seconds);
    result.max_memory_bytes = static_cast<std::uint64_t>(limits.max_memory_mb) * kMebibyte;
    result.cpu_seconds = static_cast<unsigned>(limits.max_cpu_secs);
    result.max_file_size_bytes = static_cast<std::uint64_t>(limits.max_file_size_mb) * kMebibyte;
    result.max_output_bytes = static_cast<std::size_t>(limits.max_output_bytes);
    return result;
}

std::unique_ptr<ExecutorRegistry> CreateExecutors(const config::Config& config) {
    auto registry = std::make_unique<ExecutorRegistry>();
    const auto limits = LimitsFromConfig(config.limits);
    EnvironmentPolicy policy{};
    policy.disable_network = config.sandbox.disable_network;
    policy.passthrough = config.sandbox.env_passthrough;

    for (const auto& name : config.sandbox.allowed_langs) {
        const auto language = session::ParseLanguage(utils::ToLower(name));
        if (!language) {
            utils::Log(utils::LogLevel::kWarn, "executor", "unknown language in allowed list", {{"language", name}});
            continue;
        }
        const auto& wanted = *language == session::Language::kPython
            ? config.sandbox.python_bin
            : config.sandbox.bash_bin;
        const auto interpreter = ResolveInterpreter(wanted);
        if (interpreter.empty()) {
            utils::Log(utils::LogLevel::kWarn, "executor", "interpreter not found, language disabled",
                       {{"language", name}, {"interpreter", wanted}});
            continue;
        }
        switch (*language) {
            case session::Language::kPython:
                registry->Register(std::make_unique<PythonExecutor>(interpreter, limits, policy));
                break;
            case session::Language::kBash:
                registry->Register(std::make_unique<BashExecutor>(interpreter, limits, policy));
                break;
        }
        utils::Log(utils::LogLevel::kInfo, "executor", "registered",
                   {{"language", session::ToString(*language)}, {"interpreter", interpreter}});
    }
    return registry;
}

}  // namespace codeexec::executor

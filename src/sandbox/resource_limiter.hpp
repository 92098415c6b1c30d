#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace codeexec::sandbox {

struct ResourceLimits {
    std::chrono::milliseconds wall_timeout{30000};
    // Zero disables the corresponding ceiling.
    std::uint64_t max_memory_bytes = 0;
    unsigned cpu_seconds = 0;
    std::uint64_t max_file_size_bytes = 0;
    std::size_t max_output_bytes = 1024 * 1024;
};

struct Invocation {
    std::string program;
    std::vector<std::string> args;
    std::filesystem::path working_dir;
    std::map<std::string, std::string> environment;
    std::string stdin_data;
};

struct ExecResult {
    int exit_code = -1;
    int term_signal = 0;
    bool timed_out = false;
    bool cpu_limit_exceeded = false;
    bool file_size_limit_exceeded = false;
    std::string output;
    std::string error;
    bool output_truncated = false;
    bool error_truncated = false;
    std::chrono::milliseconds duration{0};
    std::chrono::milliseconds cpu_time{0};
    long max_rss_kb = 0;
};

// Runs one invocation in its own process group under rlimits and a wall-clock
// deadline. The group is always killed and the leader always reaped before
// Run returns, whichever way it returns.
class ResourceLimiter {
public:
    explicit ResourceLimiter(ResourceLimits limits);

    ExecResult Run(const Invocation& invocation) const;

    const ResourceLimits& Limits() const { return limits_; }

private:
    ResourceLimits limits_;
};

}  // namespace codeexec::sandbox

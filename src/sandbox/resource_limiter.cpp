#include "sandbox/resource_limiter.hpp"

#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <fstream>
#include <thread>
#include <fcntl.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include "sandbox/scoped_temp_dir.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace codeexec::sandbox {
namespace {

namespace bp = boost::process;
namespace fs = std::filesystem;

constexpr int kMaxDescriptorScan = 65536;

// Runs in the forked child between fork and exec; async-signal-safe calls only.
class ChildSetup : public bp::extend::handler {
public:
    ChildSetup(const ResourceLimits& limits, int max_fd)
        : limits_(limits)
        , max_fd_(max_fd) {}

    template <typename Executor>
    void on_exec_setup(Executor&) const {
        ::setpgid(0, 0);
        ::prctl(PR_SET_PDEATHSIG, SIGKILL);
        SetLimit(RLIMIT_CORE, 0, 0);
        if (limits_.max_memory_bytes > 0) {
            SetLimit(RLIMIT_AS, limits_.max_memory_bytes, limits_.max_memory_bytes);
        }
        if (limits_.cpu_seconds > 0) {
            SetLimit(RLIMIT_CPU, limits_.cpu_seconds, limits_.cpu_seconds + 1);
        }
        if (limits_.max_file_size_bytes > 0) {
            SetLimit(RLIMIT_FSIZE, limits_.max_file_size_bytes, limits_.max_file_size_bytes);
        }
        for (int fd = STDERR_FILENO + 1; fd < max_fd_; ++fd) {
            const int flags = ::fcntl(fd, F_GETFD);
            if (flags >= 0 && !(flags & FD_CLOEXEC)) {
                ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
            }
        }
    }

private:
    static void SetLimit(int resource, rlim_t soft, rlim_t hard) {
        struct rlimit limit {};
        limit.rlim_cur = soft;
        limit.rlim_max = hard;
        ::setrlimit(resource, &limit);
    }

    ResourceLimits limits_;
    int max_fd_;
};

// Owns a spawned process group until its leader is reaped and its members killed.
class ProcessGroupGuard {
public:
    explicit ProcessGroupGuard(pid_t pid)
        : pid_(pid) {}

    ~ProcessGroupGuard() {
        if (!reaped_) {
            KillGroup();
            int status = 0;
            Reap(status, nullptr);
        }
    }

    ProcessGroupGuard(const ProcessGroupGuard&) = delete;
    ProcessGroupGuard& operator=(const ProcessGroupGuard&) = delete;

    // True once the leader has terminated. The zombie is left in place so the
    // group id cannot be recycled before KillGroup runs.
    bool LeaderExited() {
        siginfo_t info{};
        while (true) {
            const int rc = ::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT);
            if (rc == 0) {
                return info.si_pid == pid_;
            }
            if (errno != EINTR) {
                return true;
            }
        }
    }

    void KillGroup() const {
        ::kill(-pid_, SIGKILL);
        ::kill(pid_, SIGKILL);
    }

    void Reap(int& status, struct rusage* usage) {
        while (true) {
            const auto waited = ::wait4(pid_, &status, 0, usage);
            if (waited == pid_ || (waited < 0 && errno != EINTR)) {
                break;
            }
        }
        reaped_ = true;
    }

private:
    pid_t pid_;
    bool reaped_ = false;
};

int DescriptorScanLimit() {
    const long open_max = ::sysconf(_SC_OPEN_MAX);
    if (open_max <= 0) {
        return 1024;
    }
    return static_cast<int>(std::min<long>(open_max, kMaxDescriptorScan));
}

void WriteInput(const fs::path& path, const std::string& data) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw utils::ServiceError(utils::ErrorCode::kInternalError, "cannot create " + path.string());
    }
    output.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!output) {
        throw utils::ServiceError(utils::ErrorCode::kInternalError, "cannot write " + path.string());
    }
}

std::string ReadCapped(const fs::path& path, std::size_t max_bytes, bool& truncated) {
    truncated = false;
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::string data(max_bytes, '\0');
    input.read(data.data(), static_cast<std::streamsize>(max_bytes));
    data.resize(static_cast<std::size_t>(input.gcount()));
    if (data.size() == max_bytes && input.peek() != std::char_traits<char>::eof()) {
        truncated = true;
    }
    return data;
}

std::chrono::milliseconds CpuTime(const struct rusage& usage) {
    const auto micros = (usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) * 1000000LL +
        usage.ru_utime.tv_usec + usage.ru_stime.tv_usec;
    return std::chrono::milliseconds(micros / 1000);
}

}  // namespace

ResourceLimiter::ResourceLimiter(ResourceLimits limits)
    : limits_(limits) {}

ExecResult ResourceLimiter::Run(const Invocation& invocation) const {
    ExecResult result{};
    ScopedTempDir io_dir("io");
    const auto stdin_path = io_dir.Path() / "stdin";
    const auto stdout_path = io_dir.Path() / "stdout";
    const auto stderr_path = io_dir.Path() / "stderr";
    WriteInput(stdin_path, invocation.stdin_data);

    bp::environment env;
    for (const auto& [key, value] : invocation.environment) {
        env[key] = value;
    }
    const ChildSetup setup(limits_, DescriptorScanLimit());

    pid_t pid = -1;
    const auto started = std::chrono::steady_clock::now();
    try {
        bp::child child_process(
            bp::exe = invocation.program,
            bp::args = invocation.args,
            env,
            bp::start_dir = invocation.working_dir.string(),
            bp::std_in < stdin_path.string(),
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string(),
            setup);
        pid = child_process.id();
        child_process.detach();
    } catch (const bp::process_error& ex) {
        throw utils::ServiceError(utils::ErrorCode::kInternalError,
                                  "exec failed for " + invocation.program + ": " + ex.what());
    }
    ::setpgid(pid, pid);

    ProcessGroupGuard guard(pid);
    const auto deadline = started + limits_.wall_timeout;
    auto poll_interval = std::chrono::milliseconds(2);
    while (!guard.LeaderExited()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(poll_interval, remaining + std::chrono::milliseconds(1)));
        poll_interval = std::min(poll_interval * 2, std::chrono::milliseconds(50));
    }

    // Background children outlive a normal exit too; the group goes either way.
    guard.KillGroup();
    int status = 0;
    struct rusage usage {};
    guard.Reap(status, &usage);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    result.cpu_time = CpuTime(usage);
    result.max_rss_kb = usage.ru_maxrss;

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }

    if (!result.timed_out) {
        const bool shell_reported_xcpu = WIFEXITED(status) && result.exit_code == 128 + SIGXCPU;
        const bool shell_reported_xfsz = WIFEXITED(status) && result.exit_code == 128 + SIGXFSZ;
        const bool hard_cpu_kill = result.term_signal == SIGKILL && limits_.cpu_seconds > 0 &&
            result.cpu_time >= std::chrono::seconds(limits_.cpu_seconds);
        result.cpu_limit_exceeded = result.term_signal == SIGXCPU || shell_reported_xcpu || hard_cpu_kill;
        result.file_size_limit_exceeded = result.term_signal == SIGXFSZ || shell_reported_xfsz;
    }

    result.output = ReadCapped(stdout_path, limits_.max_output_bytes, result.output_truncated);
    result.error = ReadCapped(stderr_path, limits_.max_output_bytes, result.error_truncated);

    utils::Log(utils::LogLevel::kDebug, "sandbox", "process finished",
               {{"pid", std::to_string(pid)},
                {"exit_code", std::to_string(result.exit_code)},
                {"signal", std::to_string(result.term_signal)},
                {"timed_out", result.timed_out ? "true" : "false"},
                {"duration_ms", std::to_string(result.duration.count())},
                {"cpu_ms", std::to_string(result.cpu_time.count())},
                {"max_rss_kb", std::to_string(result.max_rss_kb)}});
    return result;
}

}  // namespace codeexec::sandbox

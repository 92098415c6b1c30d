#include "executor/bash_executor.hpp"

#include <sstream>
#include <string_view>

namespace codeexec::executor {
namespace {

constexpr std::string_view kErrnoSuffix = ": Cannot allocate memory";

}  // namespace

std::vector<std::string> BashExecutor::Arguments(const std::filesystem::path& script) const {
    return {"--noprofile", "--norc", script.string()};
}

// Matches bash's own diagnostics: "<script>: line N: <cmd>: Cannot allocate memory"
// for a failed fork or exec, "...: xmalloc: cannot allocate N bytes" when the shell runs out.
bool BashExecutor::ReportsOutOfMemory(const std::string& error_output) const {
    std::istringstream stream(error_output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const bool errno_report = line.size() > kErrnoSuffix.size() &&
            line.compare(line.size() - kErrnoSuffix.size(), kErrnoSuffix.size(), kErrnoSuffix) == 0;
        if (errno_report || line.find(": xmalloc: cannot allocate") != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace codeexec::executor

#include "executor/python_executor.hpp"

namespace codeexec::executor {

std::vector<std::string> PythonExecutor::Arguments(const std::filesystem::path& script) const {
    // -B: no .pyc files in the session, -u: unbuffered streams.
    return {"-B", "-u", script.string()};
}

void PythonExecutor::AddLanguageEnvironment(std::map<std::string, std::string>& env,
                                            const std::filesystem::path& session_dir) const {
    env["PYTHONUNBUFFERED"] = "1";
    env["PYTHONDONTWRITEBYTECODE"] = "1";
    env["PYTHONPATH"] = session_dir.string();
}

// An uncaught MemoryError is the last line of the traceback.
bool PythonExecutor::ReportsOutOfMemory(const std::string& error_output) const {
    const auto end = error_output.find_last_not_of("\r\n");
    if (end == std::string::npos) {
        return false;
    }
    const auto newline = error_output.rfind('\n', end);
    const auto begin = newline == std::string::npos ? 0 : newline + 1;
    const auto line = error_output.substr(begin, end + 1 - begin);
    return line == "MemoryError" || line.rfind("MemoryError: ", 0) == 0;
}

}  // namespace codeexec::executor

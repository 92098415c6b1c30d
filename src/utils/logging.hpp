#pragma once

#include <string>
#include <utility>
#include <vector>

namespace codeexec::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

using LogFields = std::vector<std::pair<std::string, std::string>>;

struct LogMessage {
    LogLevel level;
    std::string component;
    std::string message;
    LogFields fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

// Returns false for names other than debug/info/warn/warning/error.
bool ParseLogLevel(const std::string& name, LogLevel& level);

void ConfigureLogging(const LogConfig& config);
bool IsEnabled(LogLevel level);
void Log(const LogMessage& message);

inline void Log(LogLevel level, const std::string& component, const std::string& message,
                LogFields fields = {}) {
    Log(LogMessage{level, component, message, std::move(fields)});
}

}  // namespace codeexec::utils

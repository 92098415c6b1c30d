#include "utils/logging.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>

#include "utils/common.hpp"

namespace codeexec::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_output_mutex;

bool NeedsQuoting(const std::string& value) {
    if (value.empty()) {
        return true;
    }
    return value.find_first_of(" \t\r\n\"=") != std::string::npos;
}

std::string QuoteValue(const std::string& value) {
    std::string quoted = "\"";
    for (char ch : value) {
        if (ch == '"' || ch == '\\') {
            quoted.push_back('\\');
            quoted.push_back(ch);
        } else if (ch == '\n') {
            quoted += "\\n";
        } else if (ch == '\r') {
            quoted += "\\r";
        } else {
            quoted.push_back(ch);
        }
    }
    quoted.push_back('"');
    return quoted;
}

}  // namespace

bool ParseLogLevel(const std::string& name, LogLevel& level) {
    const auto lowered = ToLower(Trim(name));
    if (lowered == "debug") {
        level = LogLevel::kDebug;
    } else if (lowered == "info") {
        level = LogLevel::kInfo;
    } else if (lowered == "warn" || lowered == "warning") {
        level = LogLevel::kWarn;
    } else if (lowered == "error") {
        level = LogLevel::kError;
    } else {
        return false;
    }
    return true;
}

void ConfigureLogging(const LogConfig& config) {
    g_min_level.store(static_cast<int>(config.min_level));
}

bool IsEnabled(LogLevel level) {
    return static_cast<int>(level) >= g_min_level.load();
}

void Log(const LogMessage& message) {
    if (!IsEnabled(message.level)) {
        return;
    }
    std::ostringstream line;
    line << NowIso() << " " << ToString(message.level) << " [" << message.component << "] "
         << message.message;
    for (const auto& [key, value] : message.fields) {
        line << " " << key << "=" << (NeedsQuoting(value) ? QuoteValue(value) : value);
    }
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << line.str() << std::endl;
}

}  // namespace codeexec::utils

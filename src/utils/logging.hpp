#pragma once

#include <map>
#include <string>

namespace codebox::utils {

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

// Unknown names map to kInfo.
LogLevel LogLevelFromString(const std::string& value);

struct LogMessage {
    LogLevel level = LogLevel::kInfo;
    std::string tag;
    std::string message;
    std::map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

// Writes "[tag] message key=value ..." to stderr when the level passes the threshold.
void Log(const LogMessage& message);

inline void Log(LogLevel level,
                const std::string& tag,
                const std::string& message,
                std::map<std::string, std::string> fields = {}) {
    Log(LogMessage{level, tag, message, std::move(fields)});
}

}  // namespace codebox::utils

#include "utils/logging.hpp"

#include <iostream>
#include <mutex>
#include <sstream>

#include "utils/common.hpp"

namespace codebox::utils {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

LogConfig& MutableConfig() {
    static LogConfig config;
    return config;
}

}  // namespace

LogLevel LogLevelFromString(const std::string& value) {
    const auto lowered = ToLower(Trim(value));
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(LogMutex());
    MutableConfig() = config;
}

LogConfig GetLogConfig() {
    std::lock_guard<std::mutex> lock(LogMutex());
    return MutableConfig();
}

void Log(const LogMessage& message) {
    std::ostringstream line;
    line << "[" << message.tag << "] ";
    if (message.level != LogLevel::kInfo) {
        line << ToString(message.level) << " ";
    }
    line << message.message;
    for (const auto& [key, value] : message.fields) {
        line << " " << key << "=" << value;
    }

    std::lock_guard<std::mutex> lock(LogMutex());
    if (static_cast<int>(message.level) < static_cast<int>(MutableConfig().min_level)) {
        return;
    }
    std::cerr << line.str() << std::endl;
}

}  // namespace codebox::utils

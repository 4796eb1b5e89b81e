#pragma once

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>

#include "utils/common.hpp"

namespace dailyfeels::utils {

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

inline LogLevel ParseLogLevel(std::string value, LogLevel fallback) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (value == "debug") {
        return LogLevel::kDebug;
    }
    if (value == "info") {
        return LogLevel::kInfo;
    }
    if (value == "warn" || value == "warning") {
        return LogLevel::kWarn;
    }
    if (value == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

inline LogConfig& GlobalLogConfig() {
    static LogConfig config;
    return config;
}

inline void SetLogConfig(const LogConfig& config) {
    GlobalLogConfig() = config;
}

inline void Log(const LogMessage& msg) {
    if (static_cast<int>(msg.level) < static_cast<int>(GlobalLogConfig().min_level)) {
        return;
    }
    std::ostringstream line;
    line << NowIsoUtc() << ' ' << ToString(msg.level) << " [" << msg.tag << "] " << msg.message;
    for (const auto& [key, value] : msg.fields) {
        line << ' ' << key << '=' << value;
    }
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    std::cerr << line.str() << std::endl;
}

inline void LogDebug(const std::string& tag, const std::string& message) {
    Log(LogMessage{LogLevel::kDebug, tag, message, {}});
}

inline void LogInfo(const std::string& tag, const std::string& message) {
    Log(LogMessage{LogLevel::kInfo, tag, message, {}});
}

inline void LogWarn(const std::string& tag, const std::string& message) {
    Log(LogMessage{LogLevel::kWarn, tag, message, {}});
}

inline void LogError(const std::string& tag, const std::string& message) {
    Log(LogMessage{LogLevel::kError, tag, message, {}});
}

}  // namespace dailyfeels::utils

#pragma once

#include <sstream>
#include <string>
#include <utility>

namespace agentyard::utils {

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

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback = LogLevel::kInfo);

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

// Process-wide sink for "[tag] message" lines on stderr. Lines from
// concurrent task workers never interleave.
class Logger {
public:
    static void Configure(const LogConfig& config);
    static bool Enabled(LogLevel level);
    static void Write(LogLevel level, const std::string& tag, const std::string& message);
};

// Builds one log line and writes it on destruction:
//   LogLine(LogLevel::kInfo, "task") << "submitted id=" << id;
class LogLine {
public:
    LogLine(LogLevel level, std::string tag);
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& value) {
        if (enabled_) {
            stream_ << value;
        }
        return *this;
    }

private:
    LogLevel level_;
    std::string tag_;
    bool enabled_ = false;
    std::ostringstream stream_;
};

inline LogLine LogDebug(std::string tag) { return LogLine(LogLevel::kDebug, std::move(tag)); }
inline LogLine LogInfo(std::string tag) { return LogLine(LogLevel::kInfo, std::move(tag)); }
inline LogLine LogWarn(std::string tag) { return LogLine(LogLevel::kWarn, std::move(tag)); }
inline LogLine LogError(std::string tag) { return LogLine(LogLevel::kError, std::move(tag)); }

}  // namespace agentyard::utils

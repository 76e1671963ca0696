#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace agentyard::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_write_mutex;

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void Logger::Configure(const LogConfig& config) {
    g_min_level.store(static_cast<int>(config.min_level));
}

bool Logger::Enabled(LogLevel level) {
    return static_cast<int>(level) >= g_min_level.load();
}

void Logger::Write(LogLevel level, const std::string& tag, const std::string& message) {
    if (!Enabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << "[" << tag << "] ";
    if (level != LogLevel::kInfo) {
        std::cerr << ToString(level) << " ";
    }
    std::cerr << message << std::endl;
}

LogLine::LogLine(LogLevel level, std::string tag)
    : level_(level)
    , tag_(std::move(tag))
    , enabled_(Logger::Enabled(level)) {}

LogLine::~LogLine() {
    if (enabled_) {
        Logger::Write(level_, tag_, stream_.str());
    }
}

}  // namespace agentyard::utils

#include "core_util/logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace uicomp {
namespace util {

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warning") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    return std::nullopt;
}

Logger& Logger::GetInstance() {
    static Logger instance;
    return instance;
}

void Logger::SetLogLevel(LogLevel level) {
    min_level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::GetLogLevel() const {
    return min_level_.load(std::memory_order_relaxed);
}

bool Logger::IsEnabled(LogLevel level) const {
    return GetLogLevel() <= level;
}

void Logger::Log(LogLevel level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
#ifdef _WIN32
    localtime_s(&tm_now, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_now);
#endif

    const char* level_str = "[UNKNOWN]";
    std::ostream* output = &std::cout;

    switch (level) {
        case LogLevel::Debug:
            level_str = "[DEBUG]";
            break;
        case LogLevel::Info:
            level_str = "[INFO]";
            break;
        case LogLevel::Warning:
            level_str = "[WARNING]";
            output = &std::cerr;
            break;
        case LogLevel::Error:
            level_str = "[ERROR]";
            output = &std::cerr;
            break;
    }

    std::lock_guard<std::mutex> lock(output_mutex_);
    *output << std::put_time(&tm_now, "%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << " " << level_str << " " << message << std::endl;
}

}  // namespace util
}  // namespace uicomp

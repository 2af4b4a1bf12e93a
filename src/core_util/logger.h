#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace uicomp {
namespace util {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

// Parses "debug", "info", "warning" or "error" (case-sensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view name);

class Logger {
public:
    static Logger& GetInstance();

    void SetLogLevel(LogLevel level);
    LogLevel GetLogLevel() const;
    bool IsEnabled(LogLevel level) const;

    template<typename... Args>
    void Write(LogLevel level, Args&&... args) {
        if (!IsEnabled(level)) return;
        std::ostringstream oss;
        (oss << ... << std::forward<Args>(args));
        Log(level, oss.str());
    }

private:
    Logger() = default;
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void Log(LogLevel level, const std::string& message);

    std::atomic<LogLevel> min_level_{LogLevel::Info};
    std::mutex output_mutex_;
};

template<typename... Args>
void LogDebug(Args&&... args) { Logger::GetInstance().Write(LogLevel::Debug, std::forward<Args>(args)...); }

template<typename... Args>
void LogInfo(Args&&... args) { Logger::GetInstance().Write(LogLevel::Info, std::forward<Args>(args)...); }

template<typename... Args>
void LogWarning(Args&&... args) { Logger::GetInstance().Write(LogLevel::Warning, std::forward<Args>(args)...); }

template<typename... Args>
void LogError(Args&&... args) { Logger::GetInstance().Write(LogLevel::Error, std::forward<Args>(args)...); }

}  // namespace util
}  // namespace uicomp

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/format.h>
#include <memory>
#include <string>

namespace vigil {

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

// Accepts "trace", "debug", "info", "warn", "error", "critical" (case-insensitive).
// Unknown names map to INFO.
// Throws std::invalid_argument for unknown names.
LogLevel ParseLogLevel(const std::string& name);

struct LoggingOptions {
    std::string file_path = "logs/vigil.log";
    size_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 5;
    LogLevel level = LogLevel::INFO;
    bool console = true;
};

class Logger {
public:
    static void Initialize(const LoggingOptions& options = LoggingOptions());

    static void SetLevel(LogLevel level);
    static void Shutdown();

    static std::shared_ptr<spdlog::logger> Get();

    template<typename... Args>
    static void Trace(fmt::format_string<Args...> fmt, Args&&... args) {
        Get()->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Debug(fmt::format_string<Args...> fmt, Args&&... args) {
        Get()->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Info(fmt::format_string<Args...> fmt, Args&&... args) {
        Get()->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Warn(fmt::format_string<Args...> fmt, Args&&... args) {
        Get()->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Error(fmt::format_string<Args...> fmt, Args&&... args) {
        Get()->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Critical(fmt::format_string<Args...> fmt, Args&&... args) {
        Get()->critical(fmt, std::forward<Args>(args)...);
    }

private:
    static void InitializeLocked(const LoggingOptions& options);

    static std::shared_ptr<spdlog::logger> logger_;
};

// Convenience macros
#define LOG_TRACE(...) vigil::Logger::Trace(__VA_ARGS__)
#define LOG_DEBUG(...) vigil::Logger::Debug(__VA_ARGS__)
#define LOG_INFO(...) vigil::Logger::Info(__VA_ARGS__)
#define LOG_WARN(...) vigil::Logger::Warn(__VA_ARGS__)
#define LOG_ERROR(...) vigil::Logger::Error(__VA_ARGS__)
#define LOG_CRITICAL(...) vigil::Logger::Critical(__VA_ARGS__)

} // namespace vigil

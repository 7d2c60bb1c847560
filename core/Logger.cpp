#include "core/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <filesystem>
#include <mutex>

namespace vigil {

namespace {

spdlog::level::level_enum ToSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:    return spdlog::level::trace;
        case LogLevel::DEBUG:    return spdlog::level::debug;
        case LogLevel::INFO:     return spdlog::level::info;
        case LogLevel::WARN:     return spdlog::level::warn;
        case LogLevel::ERROR:    return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

std::mutex g_init_mutex;

} // namespace

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

LogLevel ParseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace")    return LogLevel::TRACE;
    if (lower == "debug")    return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error")    return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    if (lower == "info")     return LogLevel::INFO;
    throw std::invalid_argument("Unknown log level '" + name + "'");
}

void Logger::Initialize(const LoggingOptions& options) {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    InitializeLocked(options);
}

void Logger::InitializeLocked(const LoggingOptions& options) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (options.console) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(ToSpdlogLevel(options.level));
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
            sinks.push_back(console_sink);
        }

        if (!options.file_path.empty()) {
            std::filesystem::path log_path(options.file_path);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options.file_path, options.max_file_size, options.max_files);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [%t] %v");
            sinks.push_back(file_sink);
        }

        if (logger_) {
            spdlog::drop(logger_->name());
        }

        auto logger = std::make_shared<spdlog::logger>("Vigil", sinks.begin(), sinks.end());
        logger->set_level(ToSpdlogLevel(options.level));
        logger->flush_on(spdlog::level::err);

        spdlog::register_logger(logger);
        std::atomic_store(&logger_, logger);

        logger->info("Logger initialized: {}",
                      options.file_path.empty() ? std::string("console") : options.file_path);
    } catch (const std::exception& ex) {
        fprintf(stderr, "Failed to initialize logger: %s\n", ex.what());
        throw;
    }
}

void Logger::SetLevel(LogLevel level) {
    auto logger = std::atomic_load(&logger_);
    if (!logger) return;
    logger->set_level(ToSpdlogLevel(level));
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (logger_) {
        logger_->flush();
        spdlog::shutdown();
        std::atomic_store(&logger_, std::shared_ptr<spdlog::logger>());
    }
}

std::shared_ptr<spdlog::logger> Logger::Get() {
    auto logger = std::atomic_load(&logger_);
    if (logger) {
        return logger;
    }

    // First use without explicit setup: console only, no file side effects.
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (!logger_) {
        LoggingOptions defaults;
        defaults.file_path.clear();
        InitializeLocked(defaults);
    }
    return logger_;
}

} // namespace vigil

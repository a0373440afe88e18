#pragma once

/**
 * Logger.hpp
 *
 * Centralized logging for the transfer engine and its front ends.
 * Uses spdlog as the underlying logging library.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace flux::core {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Logger class - Thread-safe singleton logger
 *
 * Provides formatted logging with two output sinks:
 * - Console output with colors
 * - Rotating file output
 *
 * Until initialize() is called every call is a no-op, so the engine can be
 * embedded (and unit tested) without any logging setup.
 */
class Logger {
public:
    /**
     * Get singleton instance
     * @return Reference to Logger instance
     */
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    /**
     * Initialize the logger
     * @param level Minimum log level
     * @param logDir Log file directory (empty = ./logs)
     */
    void initialize(LogLevel level = LogLevel::Info,
                   const std::string& logDir = "") {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_level(toSpdlogLevel(level));
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(consoleSink);

            std::filesystem::path logPath;
            if (logDir.empty()) {
                logPath = std::filesystem::current_path() / "logs" / "flux.log";
            } else {
                logPath = std::filesystem::path(logDir) / "flux.log";
            }

            std::filesystem::create_directories(logPath.parent_path());

            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logPath.string(),
                1024 * 1024 * 10, // 10 MB
                5,                // 5 rotated files
                true              // Rotate on open
            );
            fileSink->set_level(spdlog::level::trace);
            fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(fileSink);

            m_logger = std::make_shared<spdlog::logger>("flux", sinks.begin(), sinks.end());
            m_logger->set_level(toSpdlogLevel(level));
            m_logger->flush_on(spdlog::level::warn);

            spdlog::set_default_logger(m_logger);
            spdlog::flush_every(std::chrono::seconds(3));

        } catch (const spdlog::spdlog_ex& ex) {
            // Fallback to basic console logging
            m_logger = spdlog::stdout_color_mt("flux_fallback");
            m_logger->error("Logger initialization failed: {}", ex.what());
        } catch (const std::filesystem::filesystem_error& ex) {
            m_logger = spdlog::stdout_color_mt("flux_fallback");
            m_logger->error("Cannot create log directory: {}", ex.what());
        }
    }

    void flush() {
        if (m_logger) {
            m_logger->flush();
        }
    }

    /**
     * Parse a level name as written in the configuration file
     * ("trace", "debug", "info", "warn", "error", "critical", "off").
     */
    static LogLevel parseLevel(std::string name) {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "trace")    return LogLevel::Trace;
        if (name == "debug")    return LogLevel::Debug;
        if (name == "warn" || name == "warning") return LogLevel::Warn;
        if (name == "error")    return LogLevel::Error;
        if (name == "critical") return LogLevel::Critical;
        if (name == "off")      return LogLevel::Off;
        return LogLevel::Info;
    }

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->trace(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->error(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->critical(fmt, std::forward<Args>(args)...);
        }
    }

private:
    Logger() = default;
    ~Logger() {
        if (m_logger) {
            m_logger->flush();
        }
        spdlog::shutdown();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
            default:                 return spdlog::level::info;
        }
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace flux::core

// Convenience macros
#define FLUX_LOG_TRACE(...)    flux::core::Logger::instance().trace(__VA_ARGS__)
#define FLUX_LOG_DEBUG(...)    flux::core::Logger::instance().debug(__VA_ARGS__)
#define FLUX_LOG_INFO(...)     flux::core::Logger::instance().info(__VA_ARGS__)
#define FLUX_LOG_WARN(...)     flux::core::Logger::instance().warn(__VA_ARGS__)
#define FLUX_LOG_ERROR(...)    flux::core::Logger::instance().error(__VA_ARGS__)
#define FLUX_LOG_CRITICAL(...) flux::core::Logger::instance().critical(__VA_ARGS__)

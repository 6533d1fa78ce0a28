/**
 * @file logger.hpp
 * @brief Thread-safe native logging framework for cmdkit.
 *
 * Zero external dependencies. Provides structured logging with
 * configurable levels, component tags, and timestamps. Log lines go to
 * standard error by default so they never mix with command output.
 *
 * @copyright Copyright (c) 2024 cmdkit Contributors
 * @license MIT License
 */

#pragma once

#include "cmdkit/utils/export.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace cmdkit {
namespace utils {

/**
 * @enum LogLevel
 * @brief Logging severity levels.
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

/**
 * @brief Convert LogLevel to its padded tag representation.
 */
inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF  ";
        default:              return "?????";
    }
}

/**
 * @brief Parse a level name (case-insensitive).
 * @return The level, or std::nullopt if the name is unknown.
 */
CMDKIT_UTILS_API std::optional<LogLevel> logLevelFromString(const std::string& name);

/**
 * @class Logger
 * @brief Thread-safe singleton logger with configurable output.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_DEBUG("Registry", "Registered command {}", path);
 * LOG_WARN("Dispatcher", "Unknown command: {}", name);
 * @endcode
 */
class CMDKIT_UTILS_API Logger {
public:
    /**
     * @brief Get the singleton logger instance.
     */
    static Logger& instance();

    /**
     * @brief Level name without padding ("INFO", "WARN", ...).
     */
    static std::string levelName(LogLevel level);

    /**
     * @brief Set the minimum log level. Messages below this are ignored.
     */
    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool isEnabled(LogLevel level) const {
        return static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Redirect log output. Passing nullptr restores std::cerr.
     */
    void setStream(std::ostream* stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        stream_ = stream ? stream : &std::cerr;
    }

    /**
     * @brief Log a message with the given level and component.
     */
    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }

        std::string message = formatMessage(format, std::forward<Args>(args)...);

        std::ostringstream oss;

        // Timestamp: [YYYY-MM-DD HH:MM:SS.mmm]
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_buf);
#endif

        oss << "["
            << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count()
            << "] ";

        oss << "[" << logLevelToString(level) << "] [" << component << "] " << message;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            *stream_ << oss.str() << std::endl;
        }

        if (level == LogLevel::FATAL) {
            std::abort();
        }
    }

private:
    Logger() : level_(static_cast<int>(LogLevel::WARN)), stream_(&std::cerr) {}
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string formatMessage(const char* format) {
        return std::string(format);
    }

    template<typename T, typename... Args>
    std::string formatMessage(const char* format, T&& value, Args&&... args) {
        std::ostringstream oss;

        while (*format) {
            if (*format == '{' && *(format + 1) == '}') {
                oss << value;
                return oss.str() + formatMessage(format + 2, std::forward<Args>(args)...);
            }
            oss << *format++;
        }

        return oss.str();
    }

    std::atomic<int> level_;
    std::ostream* stream_;
    std::mutex mutex_;
};

}  // namespace utils
}  // namespace cmdkit

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOG_TRACE(component, ...) \
    ::cmdkit::utils::Logger::instance().log(::cmdkit::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::cmdkit::utils::Logger::instance().log(::cmdkit::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::cmdkit::utils::Logger::instance().log(::cmdkit::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::cmdkit::utils::Logger::instance().log(::cmdkit::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::cmdkit::utils::Logger::instance().log(::cmdkit::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::cmdkit::utils::Logger::instance().log(::cmdkit::utils::LogLevel::FATAL, component, __VA_ARGS__)

// Conditional logging (avoid evaluation if level disabled)
#define LOG_IF(level, component, condition, ...) \
    do { \
        if ((condition) && ::cmdkit::utils::Logger::instance().isEnabled(level)) { \
            ::cmdkit::utils::Logger::instance().log(level, component, __VA_ARGS__); \
        } \
    } while(0)

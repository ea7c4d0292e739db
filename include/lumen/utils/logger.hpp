/**
 * @file logger.hpp
 * @brief Thread-safe logging for Lumen.
 *
 * Structured log lines with configurable level, component tag and
 * millisecond timestamps. Output goes to stderr unless redirected.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/utils/export.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace lumen {
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
 * @brief Fixed-width label used in log lines.
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
 * @brief Parse a level name ("debug", "WARN", ...).
 * @return The matching level, or INFO when the name is not recognised.
 */
inline LogLevel parseLogLevel(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (name == "TRACE") return LogLevel::TRACE;
    if (name == "DEBUG") return LogLevel::DEBUG;
    if (name == "INFO") return LogLevel::INFO;
    if (name == "WARN" || name == "WARNING") return LogLevel::WARN;
    if (name == "ERROR") return LogLevel::ERROR;
    if (name == "FATAL") return LogLevel::FATAL;
    if (name == "OFF") return LogLevel::OFF;
    return LogLevel::INFO;
}

/**
 * @class Logger
 * @brief Process-wide logger shared by every Lumen component.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("Registry", "Connected to {}:{}", address, port);
 * LOG_WARN("Correlator", "Dropping malformed datagram from {}", sender);
 * @endcode
 */
class LUMEN_UTILS_API Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool isEnabled(LogLevel level) const {
        return level != LogLevel::OFF &&
               static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Enable or disable ANSI colour codes around the level label.
     */
    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Redirect log output. nullptr restores stderr.
     *
     * The stream must outlive every subsequent log call.
     */
    void setOutput(std::ostream* out) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = out ? out : &std::cerr;
    }

    template<typename... Args>
    void log(LogLevel level, const std::string& component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }

        std::ostringstream line;
        appendTimestamp(line);

        const bool color = colorEnabled_.load(std::memory_order_relaxed);
        if (color) {
            line << getColorCode(level);
        }
        line << "[" << logLevelToString(level) << "]";
        if (color) {
            line << "\033[0m";
        }

        line << " [" << component << "] ";
        formatInto(line, format, std::forward<Args>(args)...);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            *out_ << line.str() << std::endl;
        }

        if (level == LogLevel::FATAL) {
            std::abort();
        }
    }

private:
    Logger()
        : level_(static_cast<int>(LogLevel::INFO))
        , colorEnabled_(true)
        , out_(&std::cerr)
    {}
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // [YYYY-MM-DD HH:MM:SS.mmm]
    static void appendTimestamp(std::ostringstream& oss) {
        auto now = std::chrono::system_clock::now();
        auto timeNow = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tmBuf{};
#ifdef _WIN32
        localtime_s(&tmBuf, &timeNow);
#else
        localtime_r(&timeNow, &tmBuf);
#endif
        oss << "[" << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    }

    static void formatInto(std::ostringstream& oss, const char* format) {
        oss << format;
    }

    // Substitutes each "{}" with the next argument; surplus placeholders are
    // printed verbatim, surplus arguments are ignored.
    template<typename T, typename... Args>
    static void formatInto(std::ostringstream& oss, const char* format, T&& value, Args&&... args) {
        while (*format) {
            if (format[0] == '{' && format[1] == '}') {
                oss << value;
                formatInto(oss, format + 2, std::forward<Args>(args)...);
                return;
            }
            oss << *format++;
        }
    }

    static const char* getColorCode(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "\033[90m";
            case LogLevel::DEBUG: return "\033[36m";
            case LogLevel::INFO:  return "\033[32m";
            case LogLevel::WARN:  return "\033[33m";
            case LogLevel::ERROR: return "\033[31m";
            case LogLevel::FATAL: return "\033[35;1m";
            default:              return "";
        }
    }

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::mutex mutex_;
    std::ostream* out_;
};

}  // namespace utils
}  // namespace lumen

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOG_TRACE(component, ...) \
    ::lumen::utils::Logger::instance().log(::lumen::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::lumen::utils::Logger::instance().log(::lumen::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::lumen::utils::Logger::instance().log(::lumen::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::lumen::utils::Logger::instance().log(::lumen::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::lumen::utils::Logger::instance().log(::lumen::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::lumen::utils::Logger::instance().log(::lumen::utils::LogLevel::FATAL, component, __VA_ARGS__)

// Arguments are not evaluated when the level is disabled or the condition fails
#define LOG_IF(level, component, condition, ...) \
    do { \
        if ((condition) && ::lumen::utils::Logger::instance().isEnabled(level)) { \
            ::lumen::utils::Logger::instance().log(level, component, __VA_ARGS__); \
        } \
    } while(0)

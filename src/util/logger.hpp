#ifndef PIIGUARD_UTIL_LOGGER_HPP
#define PIIGUARD_UTIL_LOGGER_HPP

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <mutex>
#include <memory>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <stdexcept>
#include <cctype>

/**
 * @file logger.hpp
 * @brief A thread-safe logging utility for PII Guard.
 *
 * Console output goes to std::clog so that stdout stays reserved for the
 * redacted payload the CLI prints.
 *
 * Usage:
 *   - Logger::getInstance().info("Info message");
 *   - logger::debug("Debug message");
 *   - logger::enableFileOutput("piiguard.log");
 *
 * Never pass raw document text to the logger. Log lengths, counts and
 * fingerprints (see hashing.hpp) instead.
 */

namespace piiguard {
namespace util {
namespace logger {

/**
 * @brief Enumeration of log levels.
 */
enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Parse a level name ("debug", "INFO", "warn", ...) into a LogLevel.
 * @throw std::runtime_error for an unknown name.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    throw std::runtime_error("logger: unknown log level '" + name + "'");
}

inline const char* levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::DEBUG:    return "DEBUG";
    case LogLevel::INFO:     return "INFO";
    case LogLevel::WARN:     return "WARN";
    case LogLevel::ERROR:    return "ERROR";
    case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Escape control characters: one call always yields exactly one
 *        log line, even when the message quotes request-supplied names.
 *        Bytes >= 0x80 pass through unchanged.
 */
inline std::string escapeControl(const std::string &msg)
{
    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(msg.size());
    for (char c : msg) {
        const unsigned char u = static_cast<unsigned char>(c);
        if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else if (c == '\t') {
            out += "\\t";
        } else if (u < 0x20 || u == 0x7F) {
            out += "\\x";
            out.push_back(hex[u >> 4]);
            out.push_back(hex[u & 0x0F]);
        } else {
            out.push_back(c);
        }
    }
    return out;
}

/**
 * @brief A singleton logger class that supports:
 *  - Thread-safe logging
 *  - Various log levels
 *  - A console sink on std::clog that can be silenced
 *  - Optional file output
 */
class Logger {
public:
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Set the minimal log level. Messages below this level are discarded.
     */
    void setLogLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logLevel_ = level;
    }

    LogLevel getLogLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return logLevel_;
    }

    /**
     * @brief Mirror every line into @p filename.
     * @param append keep existing content instead of truncating
     * @return false if the file could not be opened; console output is unaffected.
     */
    bool enableFileOutput(const std::string &filename, bool append = false)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
        }
        fileStream_ = std::make_unique<std::ofstream>(filename,
            append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc));
        if (!fileStream_->is_open()) {
            fileStream_.reset();
            return false;
        }
        return true;
    }

    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
            fileStream_.reset();
        }
    }

    /**
     * @brief Silence or restore console output (tests keep the file sink only).
     */
    void setConsoleOutput(bool enabled)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        consoleEnabled_ = enabled;
    }

    void log(LogLevel level, const std::string &msg)
    {
        const auto now = std::chrono::system_clock::now();

        std::lock_guard<std::mutex> lock(mutex_);
        if (level < logLevel_) {
            return;
        }
        const std::string line = formatLine(level, msg, now);
        if (consoleEnabled_) {
            std::clog << line;
            std::clog.flush();
        }
        if (fileStream_) {
            (*fileStream_) << line;
            fileStream_->flush();
        }
    }

    void debug(const std::string &msg)    { log(LogLevel::DEBUG, msg); }
    void info(const std::string &msg)     { log(LogLevel::INFO, msg); }
    void warn(const std::string &msg)     { log(LogLevel::WARN, msg); }
    void error(const std::string &msg)    { log(LogLevel::ERROR, msg); }
    void critical(const std::string &msg) { log(LogLevel::CRITICAL, msg); }

    /**
     * @brief "[2026-10-19 14:03:07.512][WARN] message\n", local time.
     */
    static std::string formatLine(LogLevel level,
                                  const std::string &msg,
                                  std::chrono::system_clock::time_point when)
    {
        const auto time_t_when = std::chrono::system_clock::to_time_t(when);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            when.time_since_epoch()).count() % 1000;
        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t_when);
#else
        localtime_r(&time_t_when, &tm_buf);
#endif
        std::ostringstream line;
        line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
             << "." << std::setw(3) << std::setfill('0') << millis
             << "][" << levelName(level) << "] " << escapeControl(msg) << "\n";
        return line.str();
    }

private:
    Logger()
        : logLevel_(LogLevel::INFO),
          consoleEnabled_(true)
    {
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex mutex_;
    LogLevel logLevel_;
    bool consoleEnabled_;
    std::unique_ptr<std::ofstream> fileStream_;
};

// ----------------------------------------------------------------------------
//  Convenience free functions (shortcuts)
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level)
{
    Logger::getInstance().setLogLevel(level);
}

inline bool enableFileOutput(const std::string &filename, bool append = false)
{
    return Logger::getInstance().enableFileOutput(filename, append);
}

inline void disableFileOutput()
{
    Logger::getInstance().disableFileOutput();
}

inline void debug(const std::string &msg)
{
    Logger::getInstance().debug(msg);
}

inline void info(const std::string &msg)
{
    Logger::getInstance().info(msg);
}

inline void warn(const std::string &msg)
{
    Logger::getInstance().warn(msg);
}

inline void error(const std::string &msg)
{
    Logger::getInstance().error(msg);
}

inline void critical(const std::string &msg)
{
    Logger::getInstance().critical(msg);
}

} // namespace logger
} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_LOGGER_HPP

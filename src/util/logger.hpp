#ifndef TRIAGEGUARD_UTIL_LOGGER_HPP
#define TRIAGEGUARD_UTIL_LOGGER_HPP

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <mutex>
#include <memory>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <algorithm>
#include <cctype>

/**
 * @file logger.hpp
 * @brief A thread-safe logging utility for TriageGuard.
 *
 * Lines go to stderr so that CLI output on stdout only carries masked results.
 * Callers must never pass original (unmasked) values into a log message:
 * log placeholders, entity types, counts and session ids only.
 *
 * Usage:
 *   - Logger::getInstance().info("Info message");
 *   - logger::warn("Quality issue");
 *   - logger::enableFileOutput("guard.log");
 */

namespace triageguard {
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
 * @brief Parse a level name ("debug", "INFO", ...). Unknown names map to INFO.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

/**
 * @brief A singleton logger class that supports:
 *  - Thread-safe logging
 *  - Various log levels
 *  - Optional file output
 */
class Logger {
public:
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    void setLogLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logLevel_ = level;
    }

    /**
     * @brief Mirror log lines into a file.
     * @param filename The file path to write logs into.
     * @param append If true, appends to existing file; otherwise overwrites.
     */
    void enableFileOutput(const std::string &filename, bool append = false)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
        }
        fileStream_ = std::make_unique<std::ofstream>(filename,
            append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc));
        if (!fileStream_->is_open()) {
            fileStream_.reset();
            std::cerr << "[Logger] Failed to open log file: " << filename << std::endl;
        }
    }

    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
            fileStream_.reset();
        }
    }

    void debug(const std::string &msg) { log(LogLevel::DEBUG, "DEBUG", msg); }
    void info(const std::string &msg) { log(LogLevel::INFO, "INFO", msg); }
    void warn(const std::string &msg) { log(LogLevel::WARN, "WARN", msg); }
    void error(const std::string &msg) { log(LogLevel::ERROR, "ERROR", msg); }

    /**
     * @brief Security-relevant, fail-closed events that need operator attention.
     */
    void critical(const std::string &msg) { log(LogLevel::CRITICAL, "CRITICAL", msg); }

private:
    Logger()
        : logLevel_(LogLevel::INFO)
    {
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string &levelName, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < logLevel_) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;
        std::tm tm_buf{};
        localtime_r(&time_t_now, &tm_buf);

        std::ostringstream line;
        line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
             << "." << std::setw(3) << std::setfill('0') << millis
             << "][" << levelName << "] " << msg << "\n";

        std::cerr << line.str();
        std::cerr.flush();

        if (fileStream_) {
            (*fileStream_) << line.str();
            fileStream_->flush();
        }
    }

    mutable std::mutex mutex_;
    LogLevel logLevel_;
    std::unique_ptr<std::ofstream> fileStream_;
};

// Shortcuts onto the singleton.
inline void setLogLevel(LogLevel level) { Logger::getInstance().setLogLevel(level); }
inline void enableFileOutput(const std::string &filename, bool append = false)
{
    Logger::getInstance().enableFileOutput(filename, append);
}
inline void disableFileOutput() { Logger::getInstance().disableFileOutput(); }

inline void debug(const std::string &msg) { Logger::getInstance().debug(msg); }
inline void info(const std::string &msg) { Logger::getInstance().info(msg); }
inline void warn(const std::string &msg) { Logger::getInstance().warn(msg); }
inline void error(const std::string &msg) { Logger::getInstance().error(msg); }
inline void critical(const std::string &msg) { Logger::getInstance().critical(msg); }

} // namespace logger
} // namespace util
} // namespace triageguard

#endif // TRIAGEGUARD_UTIL_LOGGER_HPP

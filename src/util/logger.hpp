#ifndef XPECONOMY_UTIL_LOGGER_HPP
#define XPECONOMY_UTIL_LOGGER_HPP

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
#include <stdexcept>

/**
 * @file logger.hpp
 * @brief A thread-safe logging utility for the XP economy service.
 *
 * Usage:
 *   - logger::info("[TransactionManager] ...");
 *   - logger::configure("DEBUG", "xpeconomy.log");
 *
 * Messages at WARN and above go to stderr, the rest to stdout unless
 * setStderrOnly(true) routes everything to stderr. File output,
 * when enabled, receives every line that passes the level filter.
 */

namespace xpeconomy {
namespace util {
namespace logger {

enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Parse a level name (case-insensitive). Throws std::runtime_error on unknown names.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    throw std::runtime_error("logger: unknown log level '" + name + "'");
}

/**
 * @brief Singleton logger with level filtering and optional file output.
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

    LogLevel getLogLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return logLevel_;
    }

    /**
     * @brief Enable output to a file.
     * @param filename The file path to write logs into.
     * @param append If true, appends to existing file; otherwise overwrites.
     * @return false if the file could not be opened (console output continues).
     */
    bool enableFileOutput(const std::string &filename, bool append = true)
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
            return false;
        }
        return true;
    }

    /// Send every console line to stderr, keeping stdout free for program output.
    void setStderrOnly(bool stderrOnly)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stderrOnly_ = stderrOnly;
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
    void critical(const std::string &msg) { log(LogLevel::CRITICAL, "CRITICAL", msg); }

private:
    Logger()
        : logLevel_(LogLevel::INFO), stderrOnly_(false)
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
             << "][" << levelName << "] " << msg << '\n';

        std::ostream &console = (stderrOnly_ || level >= LogLevel::WARN) ? std::cerr : std::cout;
        console << line.str();
        console.flush();

        if (fileStream_) {
            (*fileStream_) << line.str();
            fileStream_->flush();
        }
    }

    mutable std::mutex mutex_;
    LogLevel logLevel_;
    bool stderrOnly_;
    std::unique_ptr<std::ofstream> fileStream_;
};

// ----------------------------------------------------------------------------
//  Convenience free functions
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level)
{
    Logger::getInstance().setLogLevel(level);
}

/**
 * @brief Apply the level name and optional log file from configuration.
 */
inline void configure(const std::string &levelName, const std::string &logFile)
{
    Logger::getInstance().setLogLevel(parseLogLevel(levelName));
    if (!logFile.empty() && !Logger::getInstance().enableFileOutput(logFile)) {
        Logger::getInstance().warn("[Logger] Continuing with console output only.");
    }
}

inline void debug(const std::string &msg) { Logger::getInstance().debug(msg); }
inline void info(const std::string &msg) { Logger::getInstance().info(msg); }
inline void warn(const std::string &msg) { Logger::getInstance().warn(msg); }
inline void error(const std::string &msg) { Logger::getInstance().error(msg); }
inline void critical(const std::string &msg) { Logger::getInstance().critical(msg); }

} // namespace logger
} // namespace util
} // namespace xpeconomy

#endif // XPECONOMY_UTIL_LOGGER_HPP

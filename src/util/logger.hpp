#ifndef PRIVGATE_UTIL_LOGGER_HPP
#define PRIVGATE_UTIL_LOGGER_HPP

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <mutex>
#include <memory>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <cctype>
#include <thread>

/**
 * @file logger.hpp
 * @brief Process-wide leveled logger for privgate.
 *
 * LINE FORMAT:
 *   [2026-01-31 12:00:00.123][WARN][tid 140213] MlEntityDetector: degraded mode ...
 *
 * Console lines go to stderr; stdout carries the driver's verdict output.
 * A log file, when enabled, receives the same lines.
 *
 * USAGE:
 *   @code
 *   privgate::util::logger::setLogLevel(privgate::util::logger::LogLevel::DEBUG);
 *   privgate::util::logger::enableFileOutput("privgate.log", true);
 *   privgate::util::logger::warn("AuditLedger: store rejected entry");
 *   @endcode
 */

namespace privgate {
namespace util {
namespace logger {

enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

inline const char* logLevelName(LogLevel level)
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
 * @brief Parse a level name, case-insensitively. "warning" is accepted for WARN.
 * @return false if the name is unknown; out is left untouched.
 */
inline bool parseLogLevel(const std::string &name, LogLevel &out)
{
    std::string upper;
    for (char c : name) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (upper == "WARNING") {
        out = LogLevel::WARN;
        return true;
    }
    for (LogLevel level : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN,
                           LogLevel::ERROR, LogLevel::CRITICAL}) {
        if (upper == logLevelName(level)) {
            out = level;
            return true;
        }
    }
    return false;
}

/**
 * @class Logger
 * @brief Singleton sink. Every public method is safe to call from worker threads.
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
        threshold_ = level;
    }

    LogLevel getLogLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return threshold_;
    }

    /**
     * @brief Mirror lines into filename.
     * @return false if the file could not be opened; console logging continues.
     */
    bool enableFileOutput(const std::string &filename, bool append = false)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto mode = append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc);
        auto stream = std::make_unique<std::ofstream>(filename, mode);
        if (!stream->is_open()) {
            return false;
        }
        file_ = std::move(stream);
        return true;
    }

    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        file_.reset();
    }

    /// File output, if enabled, is unaffected.
    void setConsoleOutput(bool enabled)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        console_ = enabled;
    }

    void log(LogLevel level, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < threshold_) {
            return;
        }
        const std::string line = formatLine(level, msg);
        if (console_) {
            std::cerr << line << std::flush;
        }
        if (file_) {
            (*file_) << line << std::flush;
        }
    }

private:
    Logger()
        : threshold_(LogLevel::INFO)
        , console_(true)
    {
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string formatLine(LogLevel level, const std::string &msg)
    {
        const auto now = std::chrono::system_clock::now();
        const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;
        std::tm local{};
        localtime_r(&seconds, &local);

        std::ostringstream line;
        line << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "."
             << std::setw(3) << std::setfill('0') << millis << "]"
             << "[" << logLevelName(level) << "]"
             << "[tid " << std::this_thread::get_id() << "] "
             << msg << '\n';
        return line.str();
    }

    mutable std::mutex mutex_;
    LogLevel threshold_;
    bool console_;
    std::unique_ptr<std::ofstream> file_;
};

inline void setLogLevel(LogLevel level) { Logger::getInstance().setLogLevel(level); }

inline bool enableFileOutput(const std::string &filename, bool append = false)
{
    return Logger::getInstance().enableFileOutput(filename, append);
}

inline void disableFileOutput() { Logger::getInstance().disableFileOutput(); }

inline void debug(const std::string &msg) { Logger::getInstance().log(LogLevel::DEBUG, msg); }
inline void info(const std::string &msg) { Logger::getInstance().log(LogLevel::INFO, msg); }
inline void warn(const std::string &msg) { Logger::getInstance().log(LogLevel::WARN, msg); }
inline void error(const std::string &msg) { Logger::getInstance().log(LogLevel::ERROR, msg); }
inline void critical(const std::string &msg) { Logger::getInstance().log(LogLevel::CRITICAL, msg); }

} // namespace logger
} // namespace util
} // namespace privgate

#endif // PRIVGATE_UTIL_LOGGER_HPP

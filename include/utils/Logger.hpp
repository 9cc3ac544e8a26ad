#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <iostream>
#include <fstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <atomic>
#include <sstream>

namespace transdist {

/**
 * @enum LogLevel
 * @brief Defines severity levels for log messages.
 */
enum class LogLevel {
    DEBUG,    ///< Per-stage diagnostics (matrix sizes, repetition counts).
    INFO,     ///< Pipeline progress.
    WARNING,  ///< Recoverable anomalies, e.g. a temporal window recorded as absent.
    ERROR,    ///< Errors aborting one estimate.
    FATAL     ///< Errors terminating the driver.
};

/**
 * @class Logger
 * @brief A thread-safe singleton logger.
 *
 * Messages are timestamped and tagged with a level and a source identifier,
 * written to stdout and optionally appended to a file. Worker threads of the
 * parallel stages log through the same instance.
 */
class Logger {
public:
    /**
     * @brief Retrieves the singleton instance of the Logger.
     * @return Logger& Reference to the unique logger instance.
     */
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Sets the minimum severity level for messages to be processed.
     * @param level [in] The minimum LogLevel to output.
     */
    void setLogLevel(LogLevel level) {
        logLevel_.store(level);
    }

    /**
     * @brief Enables or disables appending log lines to a file.
     *
     * @param enable   [in] True to enable file logging, false to disable.
     * @param filename [in] Log file path, used only when enabling.
     * @return bool False if the file could not be opened.
     */
    bool enableFileLogging(bool enable, const std::string& filename = "transdist.log") {
        std::unique_lock<std::mutex> lock(mutex_);
        if (enable) {
            if (logFile_.is_open()) {
                logFile_.close();
            }
            logFile_.open(filename, std::ios::app);
            if (!logFile_.is_open()) {
                std::cerr << formatLogMessage(LogLevel::ERROR, "Logger", "Failed to open log file: " + filename) << std::endl;
                return false;
            }
            lock.unlock();
            log(LogLevel::INFO, "Logger", "File logging enabled to: " + filename);
            return true;
        }
        if (logFile_.is_open()) {
            logFile_ << formatLogMessage(LogLevel::INFO, "Logger", "File logging disabled.") << std::endl;
            logFile_.close();
        }
        return true;
    }

    /**
     * @brief Logs a message if its level meets the minimum threshold.
     *
     * @param level   [in] The severity level of the message.
     * @param source  [in] Identifier for the source of the message (class or function name).
     * @param message [in] The content of the log message.
     */
    void log(LogLevel level, const std::string& source, const std::string& message) {
        if (level < logLevel_.load()) return;

        std::string formattedMessage = formatLogMessage(level, source, message);

        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << formattedMessage << std::endl;
        if (logFile_.is_open()) {
            logFile_ << formattedMessage << std::endl;
        }
    }

    void debug(const std::string& source, const std::string& message)   { log(LogLevel::DEBUG, source, message); }
    void info(const std::string& source, const std::string& message)    { log(LogLevel::INFO, source, message); }
    void warning(const std::string& source, const std::string& message) { log(LogLevel::WARNING, source, message); }
    void error(const std::string& source, const std::string& message)   { log(LogLevel::ERROR, source, message); }
    void fatal(const std::string& source, const std::string& message)   { log(LogLevel::FATAL, source, message); }

private:
    Logger() : logLevel_(LogLevel::INFO) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string formatLogMessage(LogLevel level, const std::string& source, const std::string& message) {
        std::ostringstream oss;
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        std::tm local_tm{};
        localtime_r(&time_t_now, &local_tm);
        oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << " ";

        switch (level) {
            case LogLevel::DEBUG:   oss << "[DEBUG]  "; break;
            case LogLevel::INFO:    oss << "[INFO]   "; break;
            case LogLevel::WARNING: oss << "[WARNING]"; break;
            case LogLevel::ERROR:   oss << "[ERROR]  "; break;
            case LogLevel::FATAL:   oss << "[FATAL]  "; break;
        }

        oss << " [" << source << "] " << message;
        return oss.str();
    }

    std::atomic<LogLevel> logLevel_;
    std::ofstream logFile_;
    std::mutex mutex_;
};

} // namespace transdist

#endif // LOGGER_H

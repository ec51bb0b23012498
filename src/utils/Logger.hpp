/**
 * @file Logger.hpp
 * @brief Thread-safe leveled logging for the scanner and its collaborators
 */

#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <memory>
#include <chrono>
#include <sstream>
#include <iostream>
#include <iomanip>
#include <fmt/format.h>

namespace SpreadArb {

/**
 * @enum LogLevel
 * @brief Defines the severity levels for logging
 */
enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

/**
 * @class Logger
 * @brief Thread-safe logging utility writing to a file and the console
 *
 * Messages use fmt-style `{}` placeholders. Lines below the minimum level
 * are dropped before formatting.
 */
class Logger {
public:
    /**
     * @brief Constructor
     * @param logFile Path to the log file, empty to disable the file sink
     * @param consoleOutput Whether to output to console as well
     * @param minLevel Minimum log level to record
     */
    Logger(const std::string& logFile, bool consoleOutput = true, LogLevel minLevel = LogLevel::INFO);

    /**
     * @brief Destructor, writes the end-of-session marker
     */
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    template<typename... Args>
    void trace(const std::string& fmt, Args&&... args) {
        log(LogLevel::TRACE, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(const std::string& fmt, Args&&... args) {
        log(LogLevel::DEBUG, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& fmt, Args&&... args) {
        log(LogLevel::INFO, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const std::string& fmt, Args&&... args) {
        log(LogLevel::WARN, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(const std::string& fmt, Args&&... args) {
        log(LogLevel::ERROR, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void fatal(const std::string& fmt, Args&&... args) {
        log(LogLevel::FATAL, fmt, std::forward<Args>(args)...);
    }

    /**
     * @brief Parse a level name such as "debug" or "WARN"
     * @param name Level name, case insensitive
     * @param fallback Level returned when the name is not recognised
     * @return Parsed log level
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

private:
    template<typename... Args>
    void log(LogLevel level, const std::string& fmt, Args&&... args) {
        if (level < m_minLevel) {
            return;
        }

        std::string message;
        try {
            message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
        } catch (const std::exception& e) {
            message = fmt + " (Error formatting message: " + e.what() + ")";
        }

        std::string logLine = timestamp() + " [" + levelToString(level) + "] " + message;

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_logFile.is_open()) {
            m_logFile << logLine << std::endl;
        }

        if (m_consoleOutput) {
            if (level >= LogLevel::ERROR) {
                std::cerr << logLine << std::endl;
            } else {
                std::cout << logLine << std::endl;
            }
        }
    }

    /**
     * @brief Current local time as "YYYY-MM-DD HH:MM:SS"
     */
    static std::string timestamp();

    /**
     * @brief Convert log level to string
     * @param level Log level
     * @return String representation of the log level
     */
    static std::string levelToString(LogLevel level);

    std::ofstream m_logFile;    ///< Log file stream, closed when no file was requested
    bool m_consoleOutput;       ///< Whether to output to console
    LogLevel m_minLevel;        ///< Minimum log level to record
    std::mutex m_mutex;         ///< Mutex for thread safety
};

}  // namespace SpreadArb

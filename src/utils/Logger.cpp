/**
 * @file Logger.cpp
 * @brief Implementation of the Logger class
 */

#include "../utils/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>

namespace SpreadArb {

Logger::Logger(const std::string& logFile, bool consoleOutput, LogLevel minLevel)
    : m_consoleOutput(consoleOutput), m_minLevel(minLevel) {
    if (!logFile.empty()) {
        m_logFile.open(logFile, std::ios::app);
        if (!m_logFile.is_open()) {
            std::cerr << "Failed to open log file: " << logFile << std::endl;
        }
    }

    info("Logger initialized. Session started.");
}

Logger::~Logger() {
    info("Session ended.");

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_logFile.is_open()) {
        m_logFile.close();
    }
}

LogLevel Logger::parseLevel(const std::string& name, LogLevel fallback) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE")                      return LogLevel::TRACE;
    if (upper == "DEBUG")                      return LogLevel::DEBUG;
    if (upper == "INFO")                       return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR")                      return LogLevel::ERROR;
    if (upper == "FATAL")                      return LogLevel::FATAL;
    return fallback;
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t timeT = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&timeT, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default:              return "UNKNOWN";
    }
}

}  // namespace SpreadArb

/**
 * @file Logger.cpp
 * @brief Line-oriented logger that shares the console's output lock.
 */

#include "Logger.hpp"

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "?";
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
    if (level < minLevel) return;

    std::lock_guard<std::mutex> lock(outMutex);
    out << linePrefix << "[" << levelName(level) << "] " << component << ": " << message << "\n"
        << std::flush;
}

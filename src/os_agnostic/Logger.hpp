/**
 * @file Logger.hpp
 * @brief Line-oriented logger that shares the console's output lock.
 */

#pragma once

#include <mutex>
#include <ostream>
#include <string>
#include <utility>

/**
 * @brief Severity of a log line. Lines below the logger's threshold are dropped.
 */
enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

/**
 * @brief Writes "[level] component: message" lines to a stream.
 *
 * The stream and its mutex are borrowed, not owned. The console passes
 * std::cout together with the context's coutMutex so log lines never tear
 * through a frame being painted; tests pass a std::ostringstream.
 */
class Logger {
public:
    Logger(std::ostream& os, std::mutex& lock, LogLevel threshold = LogLevel::Info)
        : out(os), outMutex(lock), minLevel(threshold) {}

    void setThreshold(LogLevel level) { minLevel = level; }
    LogLevel threshold() const { return minLevel; }

    /** @brief Written before every line, e.g. a clear-line escape on a live prompt. */
    void setLinePrefix(std::string prefix) { linePrefix = std::move(prefix); }

    void log(LogLevel level, const std::string& component, const std::string& message);

    void debug(const std::string& component, const std::string& message) { log(LogLevel::Debug, component, message); }
    void info(const std::string& component, const std::string& message)  { log(LogLevel::Info, component, message); }
    void warn(const std::string& component, const std::string& message)  { log(LogLevel::Warn, component, message); }
    void error(const std::string& component, const std::string& message) { log(LogLevel::Error, component, message); }

    static const char* levelName(LogLevel level);

private:
    std::ostream& out;
    std::mutex& outMutex;
    LogLevel minLevel;
    std::string linePrefix;
};

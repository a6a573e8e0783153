// File: Logger.hpp
// Description: Provides a thread-safe, level-filtered logging facility that
//              writes timestamped messages to a console stream and optionally
//              mirrors them to a log file.

#pragma once

#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace backend {

enum class LogLevel { Debug, Info, Warning, Error };

const char* toString(LogLevel level);

class Logger {
public:
    explicit Logger(std::ostream& console, LogLevel threshold = LogLevel::Info);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Mirrors every subsequent line to logFilePath. Throws std::runtime_error
    // when the file cannot be opened.
    void openFile(const std::string& logFilePath);
    std::string logFilePath() const;

    void setThreshold(LogLevel threshold);
    LogLevel threshold() const;
    bool isEnabled(LogLevel level) const;

    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message) { log(LogLevel::Debug, message); }
    void info(const std::string& message) { log(LogLevel::Info, message); }
    void warning(const std::string& message) { log(LogLevel::Warning, message); }
    void error(const std::string& message) { log(LogLevel::Error, message); }

private:
    mutable std::mutex m_mutex;
    std::ostream& m_console;
    LogLevel m_threshold;
    std::string m_logFilePath;
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

}  // namespace backend

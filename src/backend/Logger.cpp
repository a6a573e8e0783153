// File: Logger.cpp
// Description: Implements the logging utility with timestamped, level-tagged
//              output mirrored to the console stream and an optional file.

#include "backend/Logger.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace backend {

struct Logger::Impl {
    std::ofstream logStream;
};

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARNING";
        case LogLevel::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}

Logger::Logger(std::ostream& console, LogLevel threshold)
    : m_console(console), m_threshold(threshold), m_impl(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

void Logger::openFile(const std::string& logFilePath) {
    std::lock_guard<std::mutex> guard(m_mutex);

    const std::filesystem::path targetPath(logFilePath);
    if (const auto parent = targetPath.parent_path(); !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory " + parent.string() + ": " +
                                     ec.message());
        }
    }

    m_impl->logStream.close();
    m_impl->logStream.open(targetPath, std::ios::out | std::ios::trunc);
    if (!m_impl->logStream.is_open()) {
        throw std::runtime_error("Failed to open log file: " + targetPath.string());
    }

    m_logFilePath = targetPath.string();
}

std::string Logger::logFilePath() const {
    std::lock_guard<std::mutex> guard(m_mutex);
    return m_logFilePath;
}

void Logger::setThreshold(LogLevel threshold) {
    std::lock_guard<std::mutex> guard(m_mutex);
    m_threshold = threshold;
}

LogLevel Logger::threshold() const {
    std::lock_guard<std::mutex> guard(m_mutex);
    return m_threshold;
}

bool Logger::isEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> guard(m_mutex);
    return static_cast<int>(level) >= static_cast<int>(m_threshold);
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> guard(m_mutex);
    if (static_cast<int>(level) < static_cast<int>(m_threshold)) {
        return;
    }

    const auto now = std::chrono::system_clock::now();
    const auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm tm {};
#if defined(_WIN32)
    localtime_s(&tm, &timeT);
#else
    localtime_r(&timeT, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    oss << " | " << toString(level) << " | " << message;
    const std::string line = oss.str();

    if (m_impl->logStream.is_open()) {
        m_impl->logStream << line << '\n';
        m_impl->logStream.flush();
    }
    m_console << line << std::endl;
}

}  // namespace backend

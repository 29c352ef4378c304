#pragma once

#include <atomic>
#include <cstdio>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace DIGISTREAM::Wire {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

/**
 * @brief Parse "debug", "info", "warning"/"warn" or "error" (case-insensitive)
 */
std::optional<LogLevel> logLevelFromString(const std::string& name);

const char* logLevelToString(LogLevel level);

/**
 * @brief Named logger shared by the codecs
 *
 * Without a log directory every line goes to stderr. After initialize() with
 * a directory, each named logger appends to "<dir>/<name>.log" and ERROR
 * lines are echoed to stderr.
 */
class Logger {
public:
    // Get logger instance by name
    static std::shared_ptr<Logger> getLogger(const std::string& name);

    // Initialize logging system (empty directory = stderr only)
    static bool initialize(const std::string& logDir, LogLevel level = LogLevel::WARNING);

    // Level applied to loggers created afterwards and to all existing ones
    static void setGlobalLogLevel(LogLevel level);

    // Log methods
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // Log with format
    template<typename... Args>
    void debug(const char* format, Args... args);

    template<typename... Args>
    void info(const char* format, Args... args);

    template<typename... Args>
    void warning(const char* format, Args... args);

    template<typename... Args>
    void error(const char* format, Args... args);

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    bool isEnabled(LogLevel level) const;

    const std::string& getName() const { return name_; }

    void flush();

    // Destructor (public for shared_ptr)
    ~Logger();

private:
    Logger(const std::string& name, const std::string& logFile);

    void writeLog(LogLevel level, const std::string& message);
    std::string getTimestamp() const;

    template<typename... Args>
    void writeFormatted(LogLevel level, const char* format, Args... args);

    std::string name_;
    std::ofstream logFile_;
    std::atomic<LogLevel> currentLevel_;
    std::mutex logMutex_;

    static std::string logDirectory;
    static std::atomic<LogLevel> globalLogLevel;
};

// Template implementations
template<typename... Args>
void Logger::writeFormatted(LogLevel level, const char* format, Args... args) {
    if (!isEnabled(level)) {
        return;
    }
    char buffer[1024];
    std::snprintf(buffer, sizeof(buffer), format, args...);
    writeLog(level, std::string(buffer));
}

template<typename... Args>
void Logger::debug(const char* format, Args... args) {
    writeFormatted(LogLevel::DEBUG, format, args...);
}

template<typename... Args>
void Logger::info(const char* format, Args... args) {
    writeFormatted(LogLevel::INFO, format, args...);
}

template<typename... Args>
void Logger::warning(const char* format, Args... args) {
    writeFormatted(LogLevel::WARNING, format, args...);
}

template<typename... Args>
void Logger::error(const char* format, Args... args) {
    writeFormatted(LogLevel::ERROR, format, args...);
}

} // namespace DIGISTREAM::Wire

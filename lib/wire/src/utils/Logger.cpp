#include "digistream/wire/utils/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>

namespace DIGISTREAM::Wire {

std::string Logger::logDirectory;
std::atomic<LogLevel> Logger::globalLogLevel{LogLevel::WARNING};

namespace {

std::map<std::string, std::shared_ptr<Logger>>& registry() {
    static std::map<std::string, std::shared_ptr<Logger>> loggers;
    return loggers;
}

std::mutex& registryMutex() {
    static std::mutex mutex;
    return mutex;
}

std::string logFileFor(const std::string& dir, const std::string& name) {
    if (dir.empty()) {
        return std::string();
    }
    return dir + "/" + name + ".log";
}

} // namespace

std::optional<LogLevel> logLevelFromString(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return std::nullopt;
}

const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

std::shared_ptr<Logger> Logger::getLogger(const std::string& name) {
    std::lock_guard<std::mutex> lock(registryMutex());

    auto& loggers = registry();
    auto it = loggers.find(name);
    if (it != loggers.end()) {
        return it->second;
    }

    auto logger = std::shared_ptr<Logger>(new Logger(name, logFileFor(logDirectory, name)));
    loggers[name] = logger;
    return logger;
}

bool Logger::initialize(const std::string& logDir, LogLevel level) {
    std::lock_guard<std::mutex> lock(registryMutex());

    if (!logDir.empty() && mkdir(logDir.c_str(), 0755) != 0 && errno != EEXIST) {
        std::cerr << "Failed to create log directory: " << logDir << std::endl;
        return false;
    }

    logDirectory = logDir;
    globalLogLevel = level;

    // Existing loggers follow the new directory and level
    for (auto& entry : registry()) {
        auto& logger = entry.second;
        std::lock_guard<std::mutex> fileLock(logger->logMutex_);
        if (logger->logFile_.is_open()) {
            logger->logFile_.close();
        }
        auto path = logFileFor(logDir, logger->name_);
        if (!path.empty()) {
            logger->logFile_.open(path, std::ios::out | std::ios::app);
        }
        logger->currentLevel_ = level;
    }
    return true;
}

void Logger::setGlobalLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(registryMutex());
    globalLogLevel = level;
    for (auto& entry : registry()) {
        entry.second->setLogLevel(level);
    }
}

Logger::Logger(const std::string& name, const std::string& logFile)
    : name_(name), currentLevel_(globalLogLevel.load()) {

    if (!logFile.empty()) {
        logFile_.open(logFile, std::ios::out | std::ios::app);
        if (!logFile_.is_open()) {
            std::cerr << "Failed to open log file: " << logFile << std::endl;
        }
    }
}

Logger::~Logger() {
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::debug(const std::string& message) {
    writeLog(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    writeLog(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    writeLog(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    writeLog(LogLevel::ERROR, message);
}

void Logger::setLogLevel(LogLevel level) {
    currentLevel_ = level;
}

LogLevel Logger::getLogLevel() const {
    return currentLevel_.load();
}

bool Logger::isEnabled(LogLevel level) const {
    return level >= currentLevel_.load();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logFile_.is_open()) {
        logFile_.flush();
    }
}

void Logger::writeLog(LogLevel level, const std::string& message) {
    if (!isEnabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(logMutex_);

    std::string logEntry = "[" + getTimestamp() + "] [" + logLevelToString(level) + "] [" +
                           name_ + "] " + message;

    if (logFile_.is_open()) {
        logFile_ << logEntry << std::endl;
        if (level == LogLevel::ERROR) {
            std::cerr << logEntry << std::endl;
        }
    } else {
        std::cerr << logEntry << std::endl;
    }
}

std::string Logger::getTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now{};
    localtime_r(&time_t, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

} // namespace DIGISTREAM::Wire

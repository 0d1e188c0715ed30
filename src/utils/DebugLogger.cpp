#include "DebugLogger.h"
#include "ProcessUtils.h"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>

namespace ReelSync {

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

DebugLogger& DebugLogger::getInstance() {
    static DebugLogger instance;
    return instance;
}

DebugLogger::DebugLogger() : minLevel_(LogLevel::Info), console_(true) {
    const char* debugEnv = std::getenv("REELSYNC_DEBUG");
    if (debugEnv && debugEnv[0] != '\0' && debugEnv[0] != '0') {
        minLevel_ = LogLevel::Debug;
    }

    logPath_ = getTempDir() + "reelsync_debug.log";
    logFile_ = std::make_unique<std::ofstream>(logPath_, std::ios::out | std::ios::app);
    if (logFile_->is_open()) {
        *logFile_ << "[ReelSync] Debug log started at " << logPath_ << std::endl;
    } else {
        logFile_.reset();
    }
}

DebugLogger::~DebugLogger() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_) {
        logFile_->close();
    }
}

void DebugLogger::log(const std::string& msg) {
    log(LogLevel::Info, msg);
}

void DebugLogger::log(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(minLevel_)) {
        return;
    }

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tmBuf{};
    localtime_r(&now, &tmBuf);
    char timeBuf[32] = {0};
    std::strftime(timeBuf, sizeof(timeBuf), "%H:%M:%S", &tmBuf);

    std::string line = std::string("[") + timeBuf + "] [" + logLevelName(level) + "] " + msg;

    if (console_) {
        std::cerr << line << std::endl;
    }
    if (logFile_ && logFile_->is_open()) {
        *logFile_ << line << std::endl;
        logFile_->flush();
    }
    if (sink_) {
        sink_(level, msg);
    }
}

void DebugLogger::setMinimumLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    minLevel_ = level;
}

LogLevel DebugLogger::getMinimumLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return minLevel_;
}

void DebugLogger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void DebugLogger::setConsoleEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_ = enabled;
}

void logDebug(const std::string& msg) { DebugLogger::getInstance().log(LogLevel::Debug, msg); }
void logInfo(const std::string& msg)  { DebugLogger::getInstance().log(LogLevel::Info, msg); }
void logWarn(const std::string& msg)  { DebugLogger::getInstance().log(LogLevel::Warn, msg); }
void logError(const std::string& msg) { DebugLogger::getInstance().log(LogLevel::Error, msg); }

} // namespace ReelSync

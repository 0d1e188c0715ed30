#pragma once

#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace ReelSync {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

const char* logLevelName(LogLevel level);

// Thread-safe logger writing to stderr and <tempdir>/reelsync_debug.log
// Used by every pipeline component
class DebugLogger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    // Get the singleton instance
    static DebugLogger& getInstance();

    // Log a message at Info level (thread-safe)
    void log(const std::string& msg);
    void log(LogLevel level, const std::string& msg);

    // Messages below this level are dropped. REELSYNC_DEBUG=1 lowers it to Debug.
    void setMinimumLevel(LogLevel level);
    LogLevel getMinimumLevel() const;

    // Mirror every emitted line to an extra sink (tests capture output this way)
    void setSink(Sink sink);

    // Silence stderr output; the log file still receives messages
    void setConsoleEnabled(bool enabled);

    std::string getLogPath() const { return logPath_; }

private:
    DebugLogger();
    ~DebugLogger();

    // Prevent copying
    DebugLogger(const DebugLogger&) = delete;
    DebugLogger& operator=(const DebugLogger&) = delete;

    mutable std::mutex mutex_;
    std::unique_ptr<std::ofstream> logFile_;
    std::string logPath_;
    LogLevel minLevel_;
    bool console_;
    Sink sink_;
};

void logDebug(const std::string& msg);
void logInfo(const std::string& msg);
void logWarn(const std::string& msg);
void logError(const std::string& msg);

} // namespace ReelSync

#pragma once

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace toolwire {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// "DEBUG", "INFO", "WARN", "ERROR".
const char* LogLevelName(LogLevel level);

// Accepts debug, info, warn/warning, error in any case. Returns false and
// leaves `out` untouched on an unknown name.
bool ParseLogLevel(std::string_view name, LogLevel& out);

// Destination of formatted log lines. stdout carries the protocol, so sinks
// write to stderr, a caller-supplied stream or a file.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// Human-readable lines:
//   plain:  2024-01-01T12:00:00.000Z [INFO] [mcp] message
//   color:  12:00:00 INFO  [mcp] message   (ANSI, errors in red)
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(bool use_color = false, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// One JSON object per line: {"ts","level","component","message"}.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

// Appends plain lines to a file and flushes each one, so the [RECV]/[SEND]
// trace is complete even when the client kills the process.
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path);

    [[nodiscard]] bool IsOpen() const { return file_.is_open(); }

    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ofstream file_;
};

// Sends every line to both sinks.
class TeeSink : public ILogSink {
public:
    TeeSink(std::unique_ptr<ILogSink> first, std::unique_ptr<ILogSink> second);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::unique_ptr<ILogSink> first_;
    std::unique_ptr<ILogSink> second_;
};

// Forwards only lines at or above its own threshold. Lets the debug file see
// everything while stderr keeps the configured level.
class LevelFilterSink : public ILogSink {
public:
    LevelFilterSink(std::unique_ptr<ILogSink> inner, LogLevel min_level);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::unique_ptr<ILogSink> inner_;
    LogLevel min_level_;
};

// Thread-safe front end: level check, then one sink call under a lock.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    // Swap sink and level in one step.
    void Reset(std::unique_ptr<ILogSink> sink, LogLevel min_level);
    void SetLevel(LogLevel level);

    // Cheap pre-check for callers that build expensive messages.
    [[nodiscard]] bool IsEnabled(LogLevel level);

    void Debug(std::string_view component, std::string_view message);
    void Info(std::string_view component, std::string_view message);
    void Warn(std::string_view component, std::string_view message);
    void Error(std::string_view component, std::string_view message);

    void Log(LogLevel level, std::string_view component,
             std::string_view message);

private:
    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Process-wide logger. Silent until InitGlobalLogger() installs a sink.
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);
Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace toolwire

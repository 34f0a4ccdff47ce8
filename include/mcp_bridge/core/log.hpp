#pragma once

#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace mcp_bridge {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// "DEBUG", "INFO", "WARN", "ERROR".
const char* LogLevelName(LogLevel level);

/// Short, stable tag for the calling thread ("t1", "t2", ...).
std::string CurrentThreadTag();

// ---------------------------------------------------------------------------
// LogRecord: one log event, captured on the producing thread.
//
// The thread tag and timestamp are taken when the event is logged, not when
// a sink formats it, so every sink reports the request or execution thread
// that produced the line.
// ---------------------------------------------------------------------------
struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string_view component;
    std::string_view message;
    std::string thread;
    std::chrono::system_clock::time_point time;

    static LogRecord Now(LogLevel level, std::string_view component,
                         std::string_view message);
};

// Abstract log sink; implementations decide where and how to write.
// Write() is serialised by the Logger.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(const LogRecord& record) = 0;
};

// Human-readable lines on a stream (stderr by default).
//   plain:  2026-01-01T10:00:00.000Z [INFO] [t2] [http] message
//   color:  10:00:00 INFO  t2 [http] message
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(const LogRecord& record) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// JSON lines: {"ts","level","thread","component","message"}.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(const LogRecord& record) override;
private:
    std::ostream& out_;
};

// JSON lines appended to a file the sink owns.
class JsonFileSink : public ILogSink {
public:
    explicit JsonFileSink(const std::string& path);

    [[nodiscard]] bool IsOpen() const { return file_.is_open(); }

    void Write(const LogRecord& record) override;
private:
    std::ofstream file_;
    JsonSink inner_;
};

// ---------------------------------------------------------------------------
// Logger: thread-safe front end over one sink.
//
// The level check is lock-free so filtered debug lines cost nothing on the
// request threads; the sink itself is swapped and written under a mutex.
// ---------------------------------------------------------------------------
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void SetLevel(LogLevel level);
    [[nodiscard]] LogLevel Level() const;
    [[nodiscard]] bool Enabled(LogLevel level) const;

    // Replace the sink; later records go to the new one.
    void SetSink(std::unique_ptr<ILogSink> sink);

    void Log(LogLevel level, std::string_view component, std::string_view message);

    void Debug(std::string_view component, std::string_view message);
    void Info(std::string_view component, std::string_view message);
    void Warn(std::string_view component, std::string_view message);
    void Error(std::string_view component, std::string_view message);

private:
    std::atomic<int> min_level_;
    std::mutex sink_mutex_;
    std::unique_ptr<ILogSink> sink_;
};

// ---------------------------------------------------------------------------
// Global logger: one instance for the process. Discards everything below
// Error until InitGlobalLogger() installs a sink.
// ---------------------------------------------------------------------------

/// Install the process sink and level. Safe while other threads log.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

Logger& GlobalLogger();

/// Convenience free functions that forward to GlobalLogger().
void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace mcp_bridge

#pragma once

#include <dufs_mcp/core/time.hpp>

#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace dufs_mcp {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

/// Upper-case level name ("DEBUG", "INFO", ...).
const char* LogLevelName(LogLevel level);

/// Parse "debug", "info", "warn"/"warning" or "error" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view text);

// ---------------------------------------------------------------------------
// LogRecord: one log line as handed to a sink. The views are only valid
// for the duration of ILogSink::Write.
// ---------------------------------------------------------------------------
struct LogRecord {
    Timestamp time;
    LogLevel level;
    std::string_view component;
    std::string_view message;
};

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(const LogRecord& record) = 0;
};

// Human-readable lines, optionally colored. stdout carries the stdio
// transport, so the default stream is stderr.
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(const LogRecord& record) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// One JSON object per line: {"component","level","message","ts"}.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out = std::cerr);
    void Write(const LogRecord& record) override;
private:
    std::ostream& out_;
};

// ---------------------------------------------------------------------------
// Logger: stamps records with its clock and serialises them into one sink.
// Job workers, HTTP handler threads and the stdio loop share an instance.
// ---------------------------------------------------------------------------
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info,
                    Clock clock = SystemClock());

    void SetLevel(LogLevel level);
    [[nodiscard]] bool Enabled(LogLevel level) const;

    void Log(LogLevel level, std::string_view component,
             std::string_view message);

    void Debug(std::string_view component, std::string_view message);
    void Info(std::string_view component, std::string_view message);
    void Warn(std::string_view component, std::string_view message);
    void Error(std::string_view component, std::string_view message);

private:
    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    Clock clock_;
    mutable std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Global logger: set once at startup, used by all components.
// ---------------------------------------------------------------------------

/// Initialize the global logger. Call before starting any worker thread.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

/// Get the global logger. Returns a no-op logger if not initialized.
Logger& GlobalLogger();

/// True when the global logger would emit `level`; lets hot paths skip
/// building messages nobody reads.
bool LogEnabled(LogLevel level);

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace dufs_mcp

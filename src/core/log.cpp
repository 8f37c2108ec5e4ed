#include <dufs_mcp/core/log.hpp>
#include <dufs_mcp/core/ansi.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>

namespace dufs_mcp {

namespace {

// Local wall time, HH:MM:SS, for the compact colored format.
void WriteLocalClock(std::ostream& out, Timestamp ts) {
    const auto time_t_value = std::chrono::system_clock::to_time_t(ts);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &time_t_value);
#else
    localtime_r(&time_t_value, &local);
#endif
    out << std::put_time(&local, "%H:%M:%S");
}

const char* LevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return ansi::kDim;
        case LogLevel::Info:  return ansi::kCyan;
        case LogLevel::Warn:  return ansi::kYellow;
        case LogLevel::Error: return ansi::kRed;
    }
    return "";
}

class NullSink : public ILogSink {
public:
    void Write(const LogRecord&) override {}
};

std::unique_ptr<Logger>& GlobalLoggerInstance() {
    static auto instance = std::make_unique<Logger>(
        std::make_unique<NullSink>(), LogLevel::Error);
    return instance;
}

} // anonymous namespace

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> ParseLogLevel(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// ColorConsoleSink
// ---------------------------------------------------------------------------
ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(const LogRecord& record) {
    if (!use_color_) {
        // 2024-03-05T14:07:09.123Z [INFO] [jobs] message
        out_ << FormatRfc3339(record.time)
             << " [" << LogLevelName(record.level) << "] "
             << "[" << record.component << "] "
             << record.message << '\n';
        out_.flush();
        return;
    }

    // 14:07:09 INFO  [jobs] message
    const char* color = LevelColor(record.level);
    out_ << ansi::kDim;
    WriteLocalClock(out_, record.time);
    out_ << ansi::kReset << ' '
         << color << std::left << std::setw(5) << LogLevelName(record.level)
         << ansi::kReset << ' '
         << ansi::kDim << '[' << record.component << ']' << ansi::kReset << ' ';
    if (record.level == LogLevel::Error) {
        out_ << color << record.message << ansi::kReset;
    } else {
        out_ << record.message;
    }
    out_ << '\n';
    out_.flush();
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(const LogRecord& record) {
    const nlohmann::json line = {
        {"ts", FormatRfc3339(record.time)},
        {"level", LogLevelName(record.level)},
        {"component", std::string(record.component)},
        {"message", std::string(record.message)},
    };
    // Paths from clients are not guaranteed to be valid UTF-8.
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << '\n';
    out_.flush();
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level, Clock clock)
    : sink_(std::move(sink)), min_level_(min_level), clock_(std::move(clock)) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

bool Logger::Enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(min_level_);
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(min_level_)) {
        return;
    }
    sink_->Write(LogRecord{clock_(), level, component, message});
}

void Logger::Debug(std::string_view component, std::string_view message) {
    Log(LogLevel::Debug, component, message);
}

void Logger::Info(std::string_view component, std::string_view message) {
    Log(LogLevel::Info, component, message);
}

void Logger::Warn(std::string_view component, std::string_view message) {
    Log(LogLevel::Warn, component, message);
}

void Logger::Error(std::string_view component, std::string_view message) {
    Log(LogLevel::Error, component, message);
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLoggerInstance() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalLoggerInstance();
}

bool LogEnabled(LogLevel level) {
    return GlobalLogger().Enabled(level);
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Debug(component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Info(component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Warn(component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Error(component, message);
}

} // namespace dufs_mcp

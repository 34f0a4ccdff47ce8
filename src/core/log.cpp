#include <mcp_bridge/core/log.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

namespace mcp_bridge {

namespace {

namespace ansi {
constexpr const char* kReset  = "\033[0m";
constexpr const char* kGray   = "\033[90m";
constexpr const char* kRed    = "\033[1;31m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kCyan   = "\033[36m";
} // namespace ansi

std::tm ToTm(std::chrono::system_clock::time_point time, bool utc) {
    const auto seconds = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
#ifdef _WIN32
    if (utc) gmtime_s(&tm, &seconds); else localtime_s(&tm, &seconds);
#else
    if (utc) gmtime_r(&seconds, &tm); else localtime_r(&seconds, &tm);
#endif
    return tm;
}

// 2026-01-01T10:00:00.123Z
std::string Iso8601(std::chrono::system_clock::time_point time) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()) % 1000;
    const auto utc = ToTm(time, true);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

// 10:00:00, local time
std::string ClockTime(std::chrono::system_clock::time_point time) {
    const auto local = ToTm(time, false);
    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S");
    return oss.str();
}

const char* LevelAnsi(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return ansi::kGray;
        case LogLevel::Info:  return ansi::kCyan;
        case LogLevel::Warn:  return ansi::kYellow;
        case LogLevel::Error: return ansi::kRed;
    }
    return "";
}

// Fixed-width 5-char level tag (right-padded).
const char* LevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
    }
    return "     ";
}

class NullSink : public ILogSink {
public:
    void Write(const LogRecord&) override {}
};

std::unique_ptr<ILogSink> OrNullSink(std::unique_ptr<ILogSink> sink) {
    if (!sink) {
        return std::make_unique<NullSink>();
    }
    return sink;
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

std::string CurrentThreadTag() {
    static std::atomic<int> next_tag{1};
    thread_local const int tag = next_tag.fetch_add(1);
    return "t" + std::to_string(tag);
}

LogRecord LogRecord::Now(LogLevel level, std::string_view component,
                         std::string_view message) {
    LogRecord record;
    record.level = level;
    record.component = component;
    record.message = message;
    record.thread = CurrentThreadTag();
    record.time = std::chrono::system_clock::now();
    return record;
}

// ---------------------------------------------------------------------------
// ColorConsoleSink
// ---------------------------------------------------------------------------
ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(const LogRecord& record) {
    if (!use_color_) {
        out_ << Iso8601(record.time)
             << " [" << LogLevelName(record.level) << "]"
             << " [" << record.thread << "]"
             << " [" << record.component << "] "
             << record.message << '\n';
        return;
    }

    const auto* level_color = LevelAnsi(record.level);
    out_ << ansi::kGray << ClockTime(record.time) << ansi::kReset << ' '
         << level_color << LevelTag(record.level) << ansi::kReset << ' '
         << ansi::kGray << record.thread << " [" << record.component << ']'
         << ansi::kReset << ' ';
    if (record.level == LogLevel::Error) {
        out_ << level_color << record.message << ansi::kReset;
    } else {
        out_ << record.message;
    }
    out_ << '\n';
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(const LogRecord& record) {
    nlohmann::json line = {
        {"ts", Iso8601(record.time)},
        {"level", LogLevelName(record.level)},
        {"thread", record.thread},
        {"component", std::string(record.component)},
        {"message", std::string(record.message)},
    };
    // Invalid UTF-8 in a message is replaced rather than thrown.
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << '\n';
    out_.flush();
}

// ---------------------------------------------------------------------------
// JsonFileSink
// ---------------------------------------------------------------------------
JsonFileSink::JsonFileSink(const std::string& path)
    : file_(path, std::ios::out | std::ios::app), inner_(file_) {}

void JsonFileSink::Write(const LogRecord& record) {
    if (file_.is_open()) {
        inner_.Write(record);
    }
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : min_level_(static_cast<int>(min_level)),
      sink_(OrNullSink(std::move(sink))) {}

void Logger::SetLevel(LogLevel level) {
    min_level_.store(static_cast<int>(level));
}

LogLevel Logger::Level() const {
    return static_cast<LogLevel>(min_level_.load());
}

bool Logger::Enabled(LogLevel level) const {
    return static_cast<int>(level) >= min_level_.load();
}

void Logger::SetSink(std::unique_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = OrNullSink(std::move(sink));
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    if (!Enabled(level)) {
        return;
    }
    auto record = LogRecord::Now(level, component, message);
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_->Write(record);
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
Logger& GlobalLogger() {
    static Logger instance(std::make_unique<NullSink>(), LogLevel::Error);
    return instance;
}

void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    auto& logger = GlobalLogger();
    logger.SetSink(std::move(sink));
    logger.SetLevel(min_level);
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

} // namespace mcp_bridge

#include <skills_mcp/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace skills_mcp {

namespace {

constexpr const char* kReset  = "\033[0m";
constexpr const char* kDim    = "\033[90m";
constexpr const char* kRed    = "\033[1;31m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kCyan   = "\033[36m";

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

const char* LevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return kDim;
        case LogLevel::Info:  return kCyan;
        case LogLevel::Warn:  return kYellow;
        case LogLevel::Error: return kRed;
    }
    return "";
}

std::tm BrokenDown(std::time_t t, bool utc) {
    std::tm out{};
#ifdef _WIN32
    if (utc) gmtime_s(&out, &t); else localtime_s(&out, &t);
#else
    if (utc) gmtime_r(&t, &out); else localtime_r(&t, &out);
#endif
    return out;
}

std::string Iso8601Now() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    const auto utc = BrokenDown(std::chrono::system_clock::to_time_t(now), true);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string ClockNow() {
    const auto local = BrokenDown(
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()),
        false);
    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S");
    return oss.str();
}

void WritePlain(std::ostream& out, LogLevel level, std::string_view component,
                std::string_view message) {
    out << Iso8601Now() << " [" << LevelName(level) << "] "
        << "[" << component << "] " << message << '\n';
}

} // anonymous namespace

Result<LogLevel, std::string> ParseLogLevel(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return Result<LogLevel, std::string>::Ok(LogLevel::Debug);
    if (lower == "info") return Result<LogLevel, std::string>::Ok(LogLevel::Info);
    if (lower == "warn" || lower == "warning") {
        return Result<LogLevel, std::string>::Ok(LogLevel::Warn);
    }
    if (lower == "error") return Result<LogLevel, std::string>::Ok(LogLevel::Error);
    return Result<LogLevel, std::string>::Err(
        "unknown log level '" + std::string(text) + "' (expected debug, info, warn or error)");
}

// ---------------------------------------------------------------------------
// ColorConsoleSink
// ---------------------------------------------------------------------------
ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(LogLevel level, std::string_view component,
                             std::string_view message) {
    if (!use_color_) {
        WritePlain(out_, level, component, message);
        return;
    }

    // HH:MM:SS LEVEL [component] message
    const auto* color = LevelColor(level);
    std::string tag = LevelName(level);
    tag.resize(5, ' ');

    out_ << kDim << ClockNow() << kReset << ' '
         << color << tag << kReset << ' '
         << kDim << '[' << component << ']' << kReset << ' ';
    if (level == LogLevel::Error) {
        out_ << color << message << kReset;
    } else {
        out_ << message;
    }
    out_ << '\n';
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    nlohmann::json record = {
        {"ts", Iso8601Now()},
        {"level", LevelName(level)},
        {"component", std::string(component)},
        {"message", std::string(message)},
    };
    // Replace invalid UTF-8 rather than throwing out of the logger.
    out_ << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << '\n';
}

// ---------------------------------------------------------------------------
// FileSink
// ---------------------------------------------------------------------------
Result<std::unique_ptr<FileSink>, Error> FileSink::Open(const std::string& path,
                                                        bool json) {
    std::ofstream file(path, std::ios::app);
    if (!file) {
        return Result<std::unique_ptr<FileSink>, Error>::Err(
            Error{"OpenLogFile", "Cannot open log file: " + path,
                  ErrorCategory::Config});
    }
    return Result<std::unique_ptr<FileSink>, Error>::Ok(
        std::make_unique<FileSink>(std::move(file), json));
}

FileSink::FileSink(std::ofstream file, bool json) : file_(std::move(file)) {
    if (json) {
        format_ = std::make_unique<JsonSink>(file_);
    } else {
        format_ = std::make_unique<ColorConsoleSink>(false, file_);
    }
}

void FileSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    format_->Write(level, component, message);
    file_.flush();
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

bool Logger::Enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(min_level_);
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

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) >= static_cast<int>(min_level_)) {
        sink_->Write(level, component, message);
    }
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
namespace {

class NullSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

std::unique_ptr<Logger>& GlobalLoggerInstance() {
    static auto instance = std::make_unique<Logger>(
        std::make_unique<NullSink>(), LogLevel::Error);
    return instance;
}

} // anonymous namespace

void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLoggerInstance() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalLoggerInstance();
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

} // namespace skills_mcp

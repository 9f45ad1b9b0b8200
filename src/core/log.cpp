#include <toolwire/core/log.hpp>

#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

namespace toolwire {

namespace {

constexpr const char* kAnsiReset = "\033[0m";
constexpr const char* kAnsiDim = "\033[90m";

struct LevelStyle {
    const char* name;
    const char* padded;  // fixed 5-char column for the color layout
    const char* color;
};

constexpr std::array<LevelStyle, 4> kLevelStyles = {{
    {"DEBUG", "DEBUG", "\033[90m"},
    {"INFO", "INFO ", "\033[36m"},
    {"WARN", "WARN ", "\033[33m"},
    {"ERROR", "ERROR", "\033[1;31m"},
}};

const LevelStyle& StyleOf(LogLevel level) {
    const auto index = static_cast<std::size_t>(level);
    return kLevelStyles[index < kLevelStyles.size() ? index : kLevelStyles.size() - 1];
}

// ISO-8601 UTC with milliseconds, or local HH:MM:SS for the compact layout.
std::string Timestamp(bool compact) {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);

    std::tm parts{};
#ifdef _WIN32
    if (compact) localtime_s(&parts, &seconds); else gmtime_s(&parts, &seconds);
#else
    if (compact) localtime_r(&seconds, &parts); else gmtime_r(&seconds, &parts);
#endif

    std::ostringstream oss;
    if (compact) {
        oss << std::put_time(&parts, "%H:%M:%S");
        return oss.str();
    }
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;
    oss << std::put_time(&parts, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

// Built as one string so concurrent writers never interleave inside a line.
std::string PlainLine(LogLevel level, std::string_view component,
                      std::string_view message) {
    std::string line = Timestamp(false);
    line.append(" [").append(LogLevelName(level)).append("] [");
    line.append(component).append("] ").append(message);
    line.push_back('\n');
    return line;
}

std::string ColorLine(LogLevel level, std::string_view component,
                      std::string_view message) {
    const auto& style = StyleOf(level);
    std::string line;
    line.append(kAnsiDim).append(Timestamp(true)).append(kAnsiReset).append(" ");
    line.append(style.color).append(style.padded).append(kAnsiReset).append(" ");
    line.append(kAnsiDim).append("[").append(component).append("]")
        .append(kAnsiReset).append(" ");
    if (level == LogLevel::Error) {
        line.append(style.color).append(message).append(kAnsiReset);
    } else {
        line.append(message);
    }
    line.push_back('\n');
    return line;
}

} // anonymous namespace

const char* LogLevelName(LogLevel level) {
    return StyleOf(level).name;
}

bool ParseLogLevel(std::string_view name, LogLevel& out) {
    std::string key;
    key.reserve(name.size());
    for (char c : name) {
        key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (key == "warning") key = "warn";

    for (std::size_t i = 0; i < kLevelStyles.size(); ++i) {
        std::string candidate = kLevelStyles[i].name;
        for (auto& c : candidate) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (candidate == key) {
            out = static_cast<LogLevel>(i);
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// Sinks
// ---------------------------------------------------------------------------
ConsoleSink::ConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ConsoleSink::Write(LogLevel level, std::string_view component,
                        std::string_view message) {
    out_ << (use_color_ ? ColorLine(level, component, message)
                        : PlainLine(level, component, message));
}

JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    const nlohmann::json record = {
        {"ts", Timestamp(false)},
        {"level", LogLevelName(level)},
        {"component", std::string(component)},
        {"message", std::string(message)},
    };
    // Traced protocol lines may carry invalid UTF-8; never throw from a sink.
    out_ << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << '\n';
}

FileSink::FileSink(const std::string& path)
    : file_(path, std::ios::out | std::ios::app) {}

void FileSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    if (!file_.is_open()) return;
    file_ << PlainLine(level, component, message);
    file_.flush();
}

TeeSink::TeeSink(std::unique_ptr<ILogSink> first,
                 std::unique_ptr<ILogSink> second)
    : first_(std::move(first)), second_(std::move(second)) {}

void TeeSink::Write(LogLevel level, std::string_view component,
                    std::string_view message) {
    for (auto* sink : {first_.get(), second_.get()}) {
        if (sink) sink->Write(level, component, message);
    }
}

LevelFilterSink::LevelFilterSink(std::unique_ptr<ILogSink> inner,
                                 LogLevel min_level)
    : inner_(std::move(inner)), min_level_(min_level) {}

void LevelFilterSink::Write(LogLevel level, std::string_view component,
                            std::string_view message) {
    if (inner_ && level >= min_level_) {
        inner_->Write(level, component, message);
    }
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::Reset(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
    min_level_ = min_level;
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

bool Logger::IsEnabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sink_ != nullptr && level >= min_level_;
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
    if (sink_ && level >= min_level_) {
        sink_->Write(level, component, message);
    }
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
Logger& GlobalLogger() {
    // No sink until InitGlobalLogger(): everything is dropped.
    static Logger instance(nullptr, LogLevel::Error);
    return instance;
}

void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLogger().Reset(std::move(sink), min_level);
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

} // namespace toolwire

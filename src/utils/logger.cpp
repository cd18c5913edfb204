#include "certresolver/utils/logger.hpp"
#include "certresolver/types.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <nlohmann/json.hpp>

namespace certresolver {
namespace utils {

namespace {

// 存储搜索的日志消息包含多行 DN，文本格式下必须保持一行
std::string escapeLine(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default: escaped += c;
        }
    }
    return escaped;
}

bool needsQuoting(const std::string& value) {
    if (value.empty()) return true;
    return std::any_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) || c == '=' || c == '"';
    });
}

} // namespace

std::string GetTimeString() {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc;
    gmtime_r(&seconds, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return ss.str();
}

LogLevel ParseLogLevel(const std::string& level) {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    throw ConfigError("unknown log level '" + level + "'");
}

std::string LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

std::string JSONFormatter::Format(const LogEntry& entry) {
    using json = nlohmann::json;

    json j = entry.fields;
    j["level"] = LogLevelToString(entry.level);
    j["time"] = entry.time;
    j["msg"] = entry.message;

    // 证书主题可能含有非 UTF-8 字节
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string TextFormatter::Format(const LogEntry& entry) {
    std::ostringstream ss;
    ss << entry.time << " [" << LogLevelToString(entry.level) << "] " << escapeLine(entry.message);

    for (const auto& [key, value] : entry.fields) {
        std::string escaped = escapeLine(value);
        ss << ' ' << key << '=';
        if (needsQuoting(escaped)) {
            ss << std::quoted(escaped);
        } else {
            ss << escaped;
        }
    }
    return ss.str();
}

void ConsoleOutput::Write(const std::string& message) {
    std::cerr << message << std::endl;
}

FileOutput::FileOutput(const std::string& filename) : file_(filename, std::ios::app) {
    if (!file_.is_open()) {
        throw ConfigError("cannot open log file " + filename);
    }
}

void FileOutput::Write(const std::string& message) {
    file_ << message << std::endl;
}

void StreamOutput::Write(const std::string& message) {
    if (out_) {
        *out_ << message << '\n';
    }
}

void LogContext::WithField(const std::string& key, const std::string& value) {
    fields_[key] = value;
}

void LogContext::WithFlag(const std::string& key, bool value) {
    fields_[key] = value ? "True" : "False";
}

LogContext LogContext::With(const std::string& key, const std::string& value) const {
    LogContext copy = *this;
    copy.WithField(key, value);
    return copy;
}

Logger::Logger() : formatter_(std::make_unique<TextFormatter>()) {
    outputs_.push_back(std::make_unique<ConsoleOutput>());
}

Logger& Logger::GetInstance() {
    static Logger instance;
    return instance;
}

void Logger::Initialize(const std::string& level, const std::string& format, const std::string& output) {
    LogLevel parsed = ParseLogLevel(level);

    std::unique_ptr<LogFormatter> formatter;
    if (format == "json") {
        formatter = std::make_unique<JSONFormatter>();
    } else if (format == "text") {
        formatter = std::make_unique<TextFormatter>();
    } else {
        throw ConfigError("unknown log format '" + format + "'");
    }

    std::unique_ptr<LogOutput> sink;
    if (output.empty()) {
        sink = std::make_unique<ConsoleOutput>();
    } else {
        sink = std::make_unique<FileOutput>(output);
    }

    // 参数全部有效后才替换当前配置
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = parsed;
    formatter_ = std::move(formatter);
    outputs_.clear();
    outputs_.push_back(std::move(sink));
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

void Logger::SetLevel(const std::string& level) {
    SetLevel(ParseLogLevel(level));
}

LogLevel Logger::GetLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::AddOutput(std::unique_ptr<LogOutput> output) {
    std::lock_guard<std::mutex> lock(mutex_);
    outputs_.push_back(std::move(output));
}

void Logger::ClearOutputs() {
    std::lock_guard<std::mutex> lock(mutex_);
    outputs_.clear();
}

void Logger::SetFormatter(std::unique_ptr<LogFormatter> formatter) {
    std::lock_guard<std::mutex> lock(mutex_);
    formatter_ = std::move(formatter);
}

void Logger::Log(LogLevel level, const std::string& message, const LogContext& ctx) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) > static_cast<int>(level_) || !formatter_) {
        return;
    }

    LogEntry entry{level, message, GetTimeString(), ctx.Fields()};
    // insert 不覆盖已有的键
    entry.fields.insert(context_.Fields().begin(), context_.Fields().end());

    std::string formatted = formatter_->Format(entry);
    for (auto& output : outputs_) {
        output->Write(formatted);
    }
}

void Logger::Debug(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Debug, message, ctx);
}

void Logger::Info(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Info, message, ctx);
}

void Logger::Warn(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Warn, message, ctx);
}

void Logger::Error(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Error, message, ctx);
}

Logger& Logger::WithField(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    context_.WithField(key, value);
    return *this;
}

} // namespace utils
} // namespace certresolver

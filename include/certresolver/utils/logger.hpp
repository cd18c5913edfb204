#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <map>
#include <memory>
#include <vector>

namespace certresolver {
namespace utils {

// 日志级别，数值越大越详细
enum class LogLevel : int {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3
};

// UTC 时间，ISO 8601 格式，精确到毫秒，例如 2024-05-01T08:30:00.123Z
std::string GetTimeString();

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string time;
    std::map<std::string, std::string> fields;
};

class LogFormatter {
public:
    virtual ~LogFormatter() = default;
    virtual std::string Format(const LogEntry& entry) = 0;
};

// 每条日志一个 JSON 对象，字段与 level/time/msg 平级
class JSONFormatter : public LogFormatter {
public:
    std::string Format(const LogEntry& entry) override;
};

// 单行文本：<time> [<LEVEL>] <msg> key=value ...
// 换行转义为 \n；含空白、'=' 或引号的值加引号。
class TextFormatter : public LogFormatter {
public:
    std::string Format(const LogEntry& entry) override;
};

class LogOutput {
public:
    virtual ~LogOutput() = default;
    virtual void Write(const std::string& message) = 0;
};

// stderr，stdout 留给命令输出
class ConsoleOutput : public LogOutput {
public:
    void Write(const std::string& message) override;
};

// 追加写入文件，无法打开时抛出 ConfigError
class FileOutput : public LogOutput {
public:
    explicit FileOutput(const std::string& filename);
    void Write(const std::string& message) override;

private:
    std::ofstream file_;
};

// 写入调用方持有的流
class StreamOutput : public LogOutput {
public:
    explicit StreamOutput(std::ostream* out) : out_(out) {}
    void Write(const std::string& message) override;

private:
    std::ostream* out_;
};

// 附加在日志上的键值字段
class LogContext {
public:
    LogContext() = default;
    LogContext(std::map<std::string, std::string> fields) : fields_(std::move(fields)) {}

    const std::map<std::string, std::string>& Fields() const { return fields_; }

    void WithField(const std::string& key, const std::string& value);
    // 布尔字段记录为 "True"/"False"
    void WithFlag(const std::string& key, bool value);

    // 返回加上 key 之后的副本，原上下文不变
    LogContext With(const std::string& key, const std::string& value) const;

private:
    std::map<std::string, std::string> fields_;
};

// 进程内唯一的日志器
class Logger {
public:
    static Logger& GetInstance();

    // level 为 debug/info/warn/error；format 为 "json" 或 "text"；
    // output 为空时写 stderr，否则为日志文件路径。参数无效时抛出 ConfigError。
    void Initialize(const std::string& level, const std::string& format, const std::string& output);

    void SetLevel(LogLevel level);
    void SetLevel(const std::string& level);
    LogLevel GetLevel() const;

    void AddOutput(std::unique_ptr<LogOutput> output);
    void ClearOutputs();
    void SetFormatter(std::unique_ptr<LogFormatter> formatter);

    void Log(LogLevel level, const std::string& message, const LogContext& ctx = LogContext());

    void Debug(const std::string& message, const LogContext& ctx = LogContext());
    void Info(const std::string& message, const LogContext& ctx = LogContext());
    void Warn(const std::string& message, const LogContext& ctx = LogContext());
    void Error(const std::string& message, const LogContext& ctx = LogContext());

    // 全局字段，调用方上下文中的同名字段优先
    Logger& WithField(const std::string& key, const std::string& value);

private:
    Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel level_ = LogLevel::Info;
    std::vector<std::unique_ptr<LogOutput>> outputs_;
    std::unique_ptr<LogFormatter> formatter_;
    LogContext context_;
    mutable std::mutex mutex_;
};

inline Logger& GetLogger() {
    return Logger::GetInstance();
}

// 不区分大小写，接受 warning 作为 warn 的别名；未知级别抛出 ConfigError
LogLevel ParseLogLevel(const std::string& level);

std::string LogLevelToString(LogLevel level);

} // namespace utils
} // namespace certresolver

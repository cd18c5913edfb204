#pragma once

#include <string>
#include "certresolver/utils/logger.hpp"

namespace certresolver {
namespace utils {

// 追踪事件的严重程度
enum class Severity {
    Error,
    Warning,
    Info
};

std::string SeverityToString(Severity severity);

// 追踪接口：接收 (严重程度, 上下文字段, 消息)，不返回值，不抛出异常
class Tracer {
public:
    virtual ~Tracer() = default;

    virtual void Trace(Severity severity, const LogContext& ctx, const std::string& message) noexcept = 0;

    void RelatedError(const LogContext& ctx, const std::string& message) noexcept {
        Trace(Severity::Error, ctx, message);
    }
    void RelatedWarning(const LogContext& ctx, const std::string& message) noexcept {
        Trace(Severity::Warning, ctx, message);
    }
    void RelatedInfo(const LogContext& ctx, const std::string& message) noexcept {
        Trace(Severity::Info, ctx, message);
    }
};

// 转发到全局 Logger
class LoggerTracer : public Tracer {
public:
    LoggerTracer() : logger_(GetLogger()) {}
    explicit LoggerTracer(Logger& logger) : logger_(logger) {}

    void Trace(Severity severity, const LogContext& ctx, const std::string& message) noexcept override;

private:
    Logger& logger_;
};

} // namespace utils
} // namespace certresolver

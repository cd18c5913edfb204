#include "certresolver/utils/tracer.hpp"

namespace certresolver {
namespace utils {

std::string SeverityToString(Severity severity) {
    switch (severity) {
        case Severity::Error:   return "Error";
        case Severity::Warning: return "Warning";
        case Severity::Info:    return "Info";
        default: return "Unknown";
    }
}

void LoggerTracer::Trace(Severity severity, const LogContext& ctx, const std::string& message) noexcept {
    try {
        switch (severity) {
            case Severity::Error:
                logger_.Error(message, ctx);
                break;
            case Severity::Warning:
                logger_.Warn(message, ctx);
                break;
            case Severity::Info:
                logger_.Info(message, ctx);
                break;
        }
    } catch (const std::exception& e) {
        // 日志输出失败不能影响证书解析
        std::cerr << "Failed to write trace event: " << e.what() << std::endl;
    }
}

} // namespace utils
} // namespace certresolver

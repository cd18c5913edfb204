#pragma once

#include <string>
#include <vector>
#include "certresolver/types.hpp"

namespace certresolver {
namespace utils {

// 子进程执行结果
struct ProcessResult {
    int exitCode = -1;
    std::string output;       // stdout
    std::string errorOutput;  // stderr
};

// 运行外部命令（不经过 shell），把 input 写入其 stdin 并收集 stdout/stderr。
// 无法启动进程时返回错误；进程以非0退出码结束不视为错误，由调用方检查 exitCode。
Result<ProcessResult> RunProcess(const std::vector<std::string>& args,
                                 const std::string& input = "",
                                 const std::string& workingDir = "");

} // namespace utils
} // namespace certresolver

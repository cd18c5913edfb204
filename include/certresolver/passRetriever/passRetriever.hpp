#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <iostream>
#include <tuple>
#include "certresolver/types.hpp"

namespace certresolver {
namespace passphrase {

// PassRetriever 函数类型定义
// 参数：证书标识（文件路径）
// 返回值：tuple<password, success, error>
// success 为 false 或 password 为空都表示"没有可用的密码"，调用方不应视为致命错误
using PassRetriever = std::function<std::tuple<std::string, bool, Error>(
    const std::string& identifier
)>;

// 交互式密码获取器，按证书标识缓存已输入的密码
class BoundRetriever {
private:
    std::istream* in_;
    std::ostream* out_;
    std::map<std::string, std::string> passwordCache_;

public:
    BoundRetriever(std::istream* in, std::ostream* out);

    std::tuple<std::string, bool, Error> getPassword(const std::string& identifier);
};

// 工厂函数声明

// 创建提示型密码获取器（stdin 不是终端时总是失败）
PassRetriever PromptRetriever();

// 创建指定输入输出的密码获取器
PassRetriever PromptRetrieverWithInOut(std::istream* in, std::ostream* out);

// 创建常量密码获取器
PassRetriever ConstantRetriever(const std::string& constantPassword);

// 总是失败的密码获取器
PassRetriever FailingRetriever(const std::string& message);

// 通过 `git credential fill` 获取证书密码（protocol=cert, path=<identifier>）
PassRetriever GitCredentialRetriever(const std::string& gitBinary = "git");

// 构造 `git credential fill` 的输入
std::string BuildCredentialRequest(const std::string& identifier);

// 从 `git credential fill` 的输出中取出 password= 的值
std::tuple<std::string, bool> ParseCredentialResponse(const std::string& output);

// 底层密码读取函数
std::tuple<std::string, Error> GetPassword(std::istream* in = nullptr);

// 辅助函数
bool IsTerminal(int fd);
std::string TrimSpace(const std::string& str);

} // namespace passphrase
} // namespace certresolver

#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <stdexcept>

namespace certresolver {

// 错误类型
class Error {
public:
    explicit Error(const std::string& message) : message_(message), isError_(true) {}
    Error() : isError_(false) {}

    const std::string& what() const { return message_; }
    bool ok() const { return !isError_; }
    bool hasError() const { return isError_; }

private:
    std::string message_;
    bool isError_;
};

// 结果类型
template<typename T>
class Result {
public:
    Result() : hasError_(true) {}
    Result(const T& value) : value_(value), hasError_(false) {}
    Result(T&& value) : value_(std::move(value)), hasError_(false) {}
    Result(const Error& error) : error_(error), hasError_(true) {}

    bool ok() const { return !hasError_; }
    const T& value() const & { return value_; }
    T&& value() && { return std::move(value_); }
    const Error& error() const { return error_; }

private:
    T value_;
    Error error_;
    bool hasError_;
};

// 证书加载、解密、解析失败（文件损坏、密码错误等）
class CryptographicError : public std::runtime_error {
public:
    explicit CryptographicError(const std::string& message)
        : std::runtime_error(message) {}
};

// 证书存储无法打开或搜索
class StoreError : public CryptographicError {
public:
    explicit StoreError(const std::string& message)
        : CryptographicError("Certificate store error: " + message) {}
};

// 配置值无法解析
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Config error: " + message) {}
};

// 配置项 -> 按出现顺序排列的所有取值，最后一个值生效
using ConfigSettings = std::map<std::string, std::vector<std::string>>;

} // namespace certresolver

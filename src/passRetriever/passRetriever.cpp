#include "certresolver/passRetriever/passRetriever.hpp"
#include "certresolver/utils/logger.hpp"
#include "certresolver/utils/process.hpp"
#include <iostream>
#include <sstream>
#include <unistd.h>
#include <termios.h>

namespace certresolver {
namespace passphrase {

BoundRetriever::BoundRetriever(std::istream* in, std::ostream* out)
    : in_(in), out_(out) {
    if (!in_) in_ = &std::cin;
    if (!out_) out_ = &std::cerr;
}

std::tuple<std::string, bool, Error> BoundRetriever::getPassword(const std::string& identifier) {
    // 检查缓存
    auto it = passwordCache_.find(identifier);
    if (it != passwordCache_.end()) {
        return std::make_tuple(it->second, true, Error());
    }

    *out_ << "Enter password for certificate " << identifier << ": ";
    out_->flush();

    auto [password, err] = GetPassword(in_);
    *out_ << std::endl;

    if (err.hasError()) {
        return std::make_tuple("", false, err);
    }

    // 密码两端的空白字符保留，证书密码可能包含空格
    if (!password.empty() && password.back() == '\r') {
        password.pop_back();
    }
    if (password.empty()) {
        return std::make_tuple("", false, Error("No password entered"));
    }

    passwordCache_[identifier] = password;
    return std::make_tuple(password, true, Error());
}

// 工厂函数实现

PassRetriever PromptRetriever() {
    if (!IsTerminal(STDIN_FILENO)) {
        return [](const std::string&) -> std::tuple<std::string, bool, Error> {
            return std::make_tuple("", false, Error("No terminal available to prompt for a password"));
        };
    }
    return PromptRetrieverWithInOut(&std::cin, &std::cerr);
}

PassRetriever PromptRetrieverWithInOut(std::istream* in, std::ostream* out) {
    auto bound = std::make_shared<BoundRetriever>(in, out);

    return [bound](const std::string& identifier) -> std::tuple<std::string, bool, Error> {
        return bound->getPassword(identifier);
    };
}

PassRetriever ConstantRetriever(const std::string& constantPassword) {
    return [constantPassword](const std::string&) -> std::tuple<std::string, bool, Error> {
        return std::make_tuple(constantPassword, true, Error());
    };
}

PassRetriever FailingRetriever(const std::string& message) {
    return [message](const std::string&) -> std::tuple<std::string, bool, Error> {
        return std::make_tuple("", false, Error(message));
    };
}

std::string BuildCredentialRequest(const std::string& identifier) {
    std::ostringstream request;
    request << "protocol=cert\n"
            << "path=" << identifier << "\n"
            << "\n";
    return request.str();
}

std::tuple<std::string, bool> ParseCredentialResponse(const std::string& output) {
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const std::string prefix = "password=";
        if (line.compare(0, prefix.size(), prefix) == 0) {
            return std::make_tuple(line.substr(prefix.size()), true);
        }
    }
    return std::make_tuple("", false);
}

PassRetriever GitCredentialRetriever(const std::string& gitBinary) {
    return [gitBinary](const std::string& identifier) -> std::tuple<std::string, bool, Error> {
        auto result = utils::RunProcess({gitBinary, "credential", "fill"},
                                        BuildCredentialRequest(identifier));
        if (!result.ok()) {
            return std::make_tuple("", false, result.error());
        }

        const auto& process = result.value();
        if (process.exitCode != 0) {
            return std::make_tuple("", false,
                Error("git credential fill exited with code " + std::to_string(process.exitCode) +
                      ": " + TrimSpace(process.errorOutput)));
        }

        auto [password, found] = ParseCredentialResponse(process.output);
        if (!found) {
            return std::make_tuple("", false, Error("git credential fill returned no password"));
        }

        utils::GetLogger().Debug("Retrieved certificate password from git credential helper",
            utils::LogContext().With("path", identifier));
        return std::make_tuple(password, true, Error());
    };
}

// 底层密码读取函数
std::tuple<std::string, Error> GetPassword(std::istream* in) {
    if (!in) in = &std::cin;

    std::string password;

    if (in == &std::cin && IsTerminal(STDIN_FILENO)) {
        // 在终端中，禁用回显
        struct termios oldTermios, newTermios;
        tcgetattr(STDIN_FILENO, &oldTermios);
        newTermios = oldTermios;
        newTermios.c_lflag &= ~(ECHO | ECHOE | ECHOK | ECHONL);
        tcsetattr(STDIN_FILENO, TCSANOW, &newTermios);

        std::getline(*in, password);

        // 恢复终端设置
        tcsetattr(STDIN_FILENO, TCSANOW, &oldTermios);
    } else {
        std::getline(*in, password);
    }

    if (in->fail() && !in->eof()) {
        return std::make_tuple("", Error("Failed to read password"));
    }

    return std::make_tuple(password, Error());
}

bool IsTerminal(int fd) {
    return isatty(fd) != 0;
}

std::string TrimSpace(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

} // namespace passphrase
} // namespace certresolver

#pragma once

#include <string>
#include <vector>
#include "certresolver/types.hpp"

namespace certresolver {
namespace config {

// 识别的 git 配置项
const std::string HttpSslCert                  = "http.sslCert";
const std::string HttpSslCertPasswordProtected = "http.sslCertPasswordProtected";
const std::string HttpSslVerify                = "http.sslVerify";

// 按 git 的规则解析布尔值：true/yes/on/1、false/no/off/0（不区分大小写），空值为 false。
// 其他值抛出 ConfigError。
bool ParseGitBool(const std::string& value);

// 返回该配置项的最后一个值；不存在或没有值时返回空字符串
std::string LastValue(const ConfigSettings& settings, const std::string& key);

// 解析 `git config --list` 的输出（每行 key=value）。
// 节名和变量名不区分大小写，已识别的配置项统一为上面的规范写法，其余转为小写。
// 没有 '=' 的行表示值为空的配置项。同一配置项的多个值按出现顺序保存。
ConfigSettings ParseConfigList(const std::string& text);

// 在 workingDir 中运行 `git config --list` 并解析结果，失败抛出 ConfigError
ConfigSettings LoadGitConfig(const std::string& gitBinary = "git",
                             const std::string& workingDir = "");

} // namespace config
} // namespace certresolver

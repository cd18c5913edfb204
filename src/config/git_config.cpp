#include "certresolver/config/git_config.hpp"
#include "certresolver/utils/logger.hpp"
#include "certresolver/utils/process.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace certresolver {
namespace config {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

// section[.subsection].variable：节名和变量名转小写，子节保持原样
std::string normalizeKey(const std::string& key) {
    size_t first = key.find('.');
    size_t last = key.rfind('.');
    if (first == std::string::npos) {
        return toLower(key);
    }

    std::string normalized = toLower(key.substr(0, first)) +
                             key.substr(first, last - first) +
                             toLower(key.substr(last));

    for (const auto* known : {&HttpSslCert, &HttpSslCertPasswordProtected, &HttpSslVerify}) {
        if (normalized == toLower(*known)) {
            return *known;
        }
    }
    return normalized;
}

} // namespace

bool ParseGitBool(const std::string& value) {
    std::string v = toLower(trim(value));
    if (v == "true" || v == "yes" || v == "on" || v == "1") {
        return true;
    }
    if (v.empty() || v == "false" || v == "no" || v == "off" || v == "0") {
        return false;
    }
    throw ConfigError("invalid boolean value '" + value + "'");
}

std::string LastValue(const ConfigSettings& settings, const std::string& key) {
    auto it = settings.find(key);
    if (it == settings.end() || it->second.empty()) {
        return "";
    }
    return it->second.back();
}

ConfigSettings ParseConfigList(const std::string& text) {
    ConfigSettings settings;
    std::istringstream in(text);
    std::string line;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) {
            continue;
        }

        size_t eq = line.find('=');
        std::string key = eq == std::string::npos ? line : line.substr(0, eq);
        std::string value = eq == std::string::npos ? "" : line.substr(eq + 1);

        settings[normalizeKey(trim(key))].push_back(value);
    }

    return settings;
}

ConfigSettings LoadGitConfig(const std::string& gitBinary, const std::string& workingDir) {
    auto result = utils::RunProcess({gitBinary, "config", "--list"}, "", workingDir);
    if (!result.ok()) {
        throw ConfigError("failed to run git config: " + result.error().what());
    }

    const auto& process = result.value();
    if (process.exitCode != 0) {
        throw ConfigError("git config exited with code " + std::to_string(process.exitCode) +
                          ": " + trim(process.errorOutput));
    }

    auto settings = ParseConfigList(process.output);
    utils::GetLogger().Debug("Loaded git config", utils::LogContext()
        .With("entries", std::to_string(settings.size())));
    return settings;
}

} // namespace config
} // namespace certresolver

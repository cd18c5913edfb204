#include <iostream>
#include <fstream>
#include <CLI/CLI.hpp>
#include "certresolver/config/git_config.hpp"
#include "certresolver/crypto/certificate_resolver.hpp"
#include "certresolver/passRetriever/passRetriever.hpp"
#include "certresolver/storage/certificate_store.hpp"
#include "certresolver/utils/logger.hpp"
#include "certresolver/utils/tracer.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

using namespace certresolver;

namespace {

constexpr int EXIT_RESOLVED = 0;
constexpr int EXIT_NOT_FOUND = 1;
constexpr int EXIT_CONFIG_ERROR = 2;

// resolve 命令的选项
struct ResolveOptions {
    std::string cert;
    bool passwordProtected = false;
    bool noVerify = false;
    bool fromGitConfig = false;
    std::string gitBinary = "git";
    std::string repoDir;
    std::vector<std::string> overrides;
    std::string caFile;
    std::string caPath;
    std::string storeDir;
    std::string passwordSource = "git";
    std::string exportPath;
    bool exportKey = false;
};

std::string formatTime(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc;
    gmtime_r(&t, &tm_utc);
    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S UTC");
    return ss.str();
}

// 合并配置：git config -> --config 覆盖项 -> 显式选项，后出现的值生效
ConfigSettings buildSettings(const ResolveOptions& options) {
    ConfigSettings settings;
    if (options.fromGitConfig) {
        settings = config::LoadGitConfig(options.gitBinary, options.repoDir);
    }

    for (const auto& entry : options.overrides) {
        if (entry.find('=') == std::string::npos) {
            throw ConfigError("expected key=value, got '" + entry + "'");
        }
        for (const auto& [key, values] : config::ParseConfigList(entry)) {
            auto& target = settings[key];
            target.insert(target.end(), values.begin(), values.end());
        }
    }

    if (!options.cert.empty()) {
        settings[config::HttpSslCert].push_back(options.cert);
    }
    if (options.passwordProtected) {
        settings[config::HttpSslCertPasswordProtected].push_back("true");
    }
    if (options.noVerify) {
        settings[config::HttpSslVerify].push_back("false");
    }
    return settings;
}

std::shared_ptr<utils::ChainVerifier> buildVerifier(const ResolveOptions& options) {
    if (options.caFile.empty() && options.caPath.empty()) {
        return utils::ChainVerifier::CreateDefault();
    }

    auto verifier = std::make_shared<utils::ChainVerifier>();
    if (!options.caFile.empty()) {
        auto err = verifier->LoadCAFile(options.caFile);
        if (!err.ok()) {
            throw ConfigError(err.what());
        }
    }
    if (!options.caPath.empty()) {
        auto err = verifier->LoadCAPath(options.caPath);
        if (!err.ok()) {
            throw ConfigError(err.what());
        }
    }
    return verifier;
}

passphrase::PassRetriever buildPassRetriever(const ResolveOptions& options) {
    if (options.passwordSource == "prompt") {
        return passphrase::PromptRetriever();
    }
    if (options.passwordSource == "git") {
        return passphrase::GitCredentialRetriever(options.gitBinary);
    }
    return passphrase::FailingRetriever("no password source configured");
}

Error exportCertificate(const utils::Certificate& cert, const std::string& path, bool includeKey) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return Error("Cannot open " + path + " for writing");
    }

    auto pem = cert.ToPEM();
    out.write(reinterpret_cast<const char*>(pem.data()), static_cast<std::streamsize>(pem.size()));

    if (includeKey) {
        auto keyPem = cert.PrivateKeyToPEM();
        if (keyPem.empty()) {
            return Error("Certificate has no private key to export");
        }
        out.write(reinterpret_cast<const char*>(keyPem.data()), static_cast<std::streamsize>(keyPem.size()));
    }

    if (!out) {
        return Error("Failed to write " + path);
    }
    return Error();
}

void printCertificate(const utils::Certificate& cert) {
    std::cout << "Subject:         " << cert.GetSubject() << std::endl;
    std::cout << "Issuer:          " << cert.GetIssuer() << std::endl;
    std::cout << "Thumbprint:      " << cert.GetThumbprint() << std::endl;
    std::cout << "Not before:      " << formatTime(cert.GetNotBefore()) << std::endl;
    std::cout << "Not after:       " << formatTime(cert.GetNotAfter()) << std::endl;
    std::cout << "Has private key: " << (cert.HasPrivateKey() ? "yes" : "no") << std::endl;
}

int runResolve(const ResolveOptions& options) {
    std::unique_ptr<crypto::CertificateResolver> resolver;
    try {
        auto settings = buildSettings(options);
        auto verifier = buildVerifier(options);

        storage::StoreFactory storeFactory;
        if (!options.storeDir.empty()) {
            std::string storeDir = options.storeDir;
            storeFactory = [storeDir, verifier]() -> std::unique_ptr<storage::CertificateStore> {
                return std::make_unique<storage::DirectoryCertificateStore>(storeDir, verifier);
            };
        }

        resolver = std::make_unique<crypto::CertificateResolver>(settings, verifier, storeFactory);
    } catch (const ConfigError& e) {
        utils::GetLogger().Error(e.what());
        return EXIT_CONFIG_ERROR;
    }

    if (!resolver->Config().identifier) {
        std::cout << "No client certificate configured (http.sslCert is not set)." << std::endl;
        return EXIT_NOT_FOUND;
    }

    utils::LoggerTracer tracer;
    auto cert = resolver->Resolve(tracer, buildPassRetriever(options));
    if (!cert) {
        std::cout << "No usable certificate found for " << *resolver->Config().identifier << std::endl;
        return EXIT_NOT_FOUND;
    }

    printCertificate(*cert);

    if (!options.exportPath.empty()) {
        auto err = exportCertificate(*cert, options.exportPath, options.exportKey);
        if (!err.ok()) {
            utils::GetLogger().Error("Error exporting certificate: " + err.what());
            return EXIT_NOT_FOUND;
        }
        std::cout << "Exported to " << options.exportPath << std::endl;
    }

    return EXIT_RESOLVED;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"certresolver - resolve the client certificate git presents over HTTPS"};

    std::string logLevel = "warn";
    std::string logFormat = "text";
    std::string logFile;

    app.add_option("--log-level", logLevel, "Log level (debug, info, warn, error)")
        ->check(CLI::IsMember({"debug", "info", "warn", "warning", "error"}, CLI::ignore_case));
    app.add_option("--log-format", logFormat, "Log format")->check(CLI::IsMember({"json", "text"}));
    app.add_option("--log-file", logFile, "Write logs to this file instead of stderr");
    app.require_subcommand(1);

    ResolveOptions options;
    auto resolve = app.add_subcommand("resolve", "Resolve the configured client certificate");
    resolve->add_option("--cert", options.cert, "Certificate file path or subject common name (http.sslCert)");
    resolve->add_flag("--password-protected", options.passwordProtected,
                      "Certificate file is password protected (http.sslCertPasswordProtected)");
    resolve->add_flag("--no-verify", options.noVerify, "Do not verify the certificate (http.sslVerify=false)");
    resolve->add_flag("--from-git-config", options.fromGitConfig, "Read settings from `git config --list`");
    resolve->add_option("--git", options.gitBinary, "Git executable");
    resolve->add_option("-C,--repo", options.repoDir, "Repository to read git config from");
    resolve->add_option("--config", options.overrides, "Config override key=value (repeatable)");
    resolve->add_option("--ca-file", options.caFile, "Trusted CA bundle used for verification");
    resolve->add_option("--ca-path", options.caPath, "Directory of trusted CA certificates");
    resolve->add_option("--store-dir", options.storeDir, "Certificate store directory");
    resolve->add_option("--password-source", options.passwordSource, "Where to get the certificate password")
        ->check(CLI::IsMember({"prompt", "git", "none"}));
    resolve->add_option("--export", options.exportPath, "Write the resolved certificate as PEM");
    resolve->add_flag("--export-key", options.exportKey, "Also write the unencrypted private key");

    int exitCode = EXIT_RESOLVED;
    resolve->callback([&]() {
        try {
            utils::GetLogger().Initialize(logLevel, logFormat, logFile);
        } catch (const ConfigError& e) {
            std::cerr << e.what() << std::endl;
            exitCode = EXIT_CONFIG_ERROR;
            return;
        }

        try {
            exitCode = runResolve(options);
        } catch (const std::exception& e) {
            utils::GetLogger().Error(std::string("Unexpected error: ") + e.what());
            exitCode = EXIT_NOT_FOUND;
        }
    });

    CLI11_PARSE(app, argc, argv);
    return exitCode;
}

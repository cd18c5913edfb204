#include "certresolver/crypto/certificate_resolver.hpp"
#include "certresolver/config/git_config.hpp"
#include <algorithm>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace certresolver {
namespace crypto {

namespace fs = std::filesystem;

namespace {

std::string subjectLines(const std::vector<std::string>& subjects) {
    std::ostringstream ss;
    for (size_t i = 0; i < subjects.size(); ++i) {
        if (i > 0) ss << "\n";
        ss << subjects[i];
    }
    return ss.str();
}

void logWithAppropriateLevel(utils::Tracer& tracer, const utils::LogContext& ctx,
                             size_t count, const std::string& message) {
    tracer.Trace(SeverityFor(count), ctx, message);
}

} // namespace

// ResolverConfig实现

ResolverConfig ResolverConfig::FromSettings(const ConfigSettings& settings) {
    ResolverConfig config;

    auto cert = settings.find(config::HttpSslCert);
    if (cert != settings.end() && !cert->second.empty()) {
        config.identifier = cert->second.back();
    }

    auto passwordProtected = settings.find(config::HttpSslCertPasswordProtected);
    if (passwordProtected != settings.end() && !passwordProtected->second.empty()) {
        config.passwordProtected = config::ParseGitBool(passwordProtected->second.back());
    }

    auto verify = settings.find(config::HttpSslVerify);
    if (verify != settings.end() && !verify->second.empty()) {
        config.verify = config::ParseGitBool(verify->second.back());
    }

    return config;
}

utils::Severity SeverityFor(size_t count) {
    switch (count) {
        case 0:
            return utils::Severity::Error;
        case 1:
            return utils::Severity::Info;
        default:
            return utils::Severity::Warning;
    }
}

bool HasExactCommonName(const std::vector<std::string>& commonNames, const std::string& identifier) {
    if (identifier.empty()) {
        return false;
    }
    return std::find(commonNames.begin(), commonNames.end(), identifier) != commonNames.end();
}

// CertificateCandidate实现

CertificateCandidate::CertificateCandidate(std::shared_ptr<utils::Certificate> cert,
                                           std::shared_ptr<const utils::ChainVerifier> verifier)
    : cert_(std::move(cert)),
      verifier_(std::move(verifier)),
      hasPrivateKey_(cert_->HasPrivateKey()),
      subjectName_(cert_->GetSubject()),
      commonNames_(cert_->GetCommonNames()),
      notBefore_(cert_->GetNotBefore()),
      notAfter_(cert_->GetNotAfter()) {}

bool CertificateCandidate::IsCurrentlyValid() const {
    if (!isCurrentlyValid_) {
        isCurrentlyValid_ = verifier_ && verifier_->Verify(*cert_);
    }
    return *isCurrentlyValid_;
}

void RankCandidates(std::vector<CertificateCandidate>& candidates) {
    std::stable_sort(candidates.begin(), candidates.end(),
        [](const CertificateCandidate& a, const CertificateCandidate& b) {
            bool aValid = a.IsCurrentlyValid();
            bool bValid = b.IsCurrentlyValid();
            if (aValid != bValid) {
                return aValid;
            }
            if (a.NotBefore() != b.NotBefore()) {
                return a.NotBefore() < b.NotBefore();
            }
            return a.NotAfter() > b.NotAfter();
        });
}

// CertificateResolver实现

CertificateResolver::CertificateResolver(std::shared_ptr<utils::ChainVerifier> verifier,
                                         storage::StoreFactory storeFactory)
    : verifier_(std::move(verifier)), storeFactory_(std::move(storeFactory)) {
    if (!verifier_) {
        verifier_ = utils::ChainVerifier::CreateDefault();
    }
    if (!storeFactory_) {
        auto storeVerifier = verifier_;
        storeFactory_ = [storeVerifier]() -> std::unique_ptr<storage::CertificateStore> {
            return std::make_unique<storage::DirectoryCertificateStore>(
                storage::DirectoryCertificateStore::DefaultLocation(), storeVerifier);
        };
    }
}

CertificateResolver::CertificateResolver(const ConfigSettings& settings,
                                         std::shared_ptr<utils::ChainVerifier> verifier,
                                         storage::StoreFactory storeFactory)
    : CertificateResolver(std::move(verifier), std::move(storeFactory)) {
    config_ = ResolverConfig::FromSettings(settings);
}

std::shared_ptr<utils::Certificate> CertificateResolver::Resolve(
    utils::Tracer& tracer, const passphrase::PassRetriever& passwordProvider) const {

    if (!config_.identifier || config_.identifier->empty()) {
        return nullptr;
    }
    const std::string& identifier = *config_.identifier;

    utils::LogContext ctx;
    ctx.WithField("CertificatePathOrSubjectCommonName", identifier);
    ctx.WithFlag("IsCertificatePasswordProtected", config_.passwordProtected);
    ctx.WithFlag("ShouldVerify", config_.verify);

    auto result = resolveFromFile(tracer, ctx, passwordProvider);
    if (!result) {
        result = resolveFromStore(tracer, ctx);
    }

    if (!result) {
        tracer.RelatedError(ctx, "Certificate " + identifier + " not found");
    }

    return result;
}

std::string CertificateResolver::requestPassword(const passphrase::PassRetriever& passwordProvider) const {
    if (!passwordProvider) {
        return "";
    }

    try {
        auto [password, success, err] = passwordProvider(*config_.identifier);
        if (!success || err.hasError()) {
            utils::GetLogger().Debug("Password provider did not return a password", utils::LogContext()
                .With("error", err.what()));
            return "";
        }
        return password;
    } catch (const std::exception& e) {
        utils::GetLogger().Debug("Password provider failed", utils::LogContext()
            .With("error", e.what()));
        return "";
    }
}

std::shared_ptr<utils::Certificate> CertificateResolver::resolveFromFile(
    utils::Tracer& tracer, utils::LogContext& ctx,
    const passphrase::PassRetriever& passwordProvider) const {

    const std::string& path = *config_.identifier;

    // 密码获取失败时仍用空密码尝试加载，部分受保护的文件依赖系统缓存可以成功打开
    std::string password;
    if (config_.passwordProtected) {
        password = requestPassword(passwordProvider);
        if (password.empty()) {
            tracer.RelatedWarning(ctx,
                "Git config indicates, that certificate is password protected, but retrieved password was null or empty!");
        }
        ctx.WithFlag("isPasswordSpecified", !password.empty());
    }

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return nullptr;
    }

    try {
        auto cert = utils::LoadCertificateFromFile(path, password);

        if (config_.verify) {
            Error err = verifier_->Check(*cert);
            if (err.hasError()) {
                tracer.RelatedWarning(ctx.With("VerificationError", err.what()),
                                      "Certificate was found, but is invalid.");
                return nullptr;
            }
        }

        tracer.RelatedInfo(ctx, "Certificate loaded from file");
        return cert;
    } catch (const CryptographicError& e) {
        tracer.RelatedError(ctx.With("Exception", e.what()), "Error, while loading certificate from disk");
        return nullptr;
    }
}

std::shared_ptr<utils::Certificate> CertificateResolver::resolveFromStore(
    utils::Tracer& tracer, const utils::LogContext& ctx) const {

    const std::string& identifier = *config_.identifier;

    try {
        std::unique_ptr<storage::CertificateStore> store = storeFactory_();
        if (!store) {
            throw StoreError("no certificate store available");
        }

        storage::ScopedStore scoped(*store);
        auto findResults = scoped->FindBySubjectName(identifier, config_.verify);
        if (findResults.empty()) {
            return nullptr;
        }

        std::vector<std::string> foundSubjects;
        for (const auto& cert : findResults) {
            foundSubjects.push_back(cert->GetSubject());
        }
        logWithAppropriateLevel(tracer, ctx, findResults.size(),
            "Found " + std::to_string(findResults.size()) +
            " certificates by provided name. Matching DNs: " + subjectLines(foundSubjects));

        // 只要有私钥且CN完全匹配的证书
        std::vector<CertificateCandidate> candidates;
        for (const auto& cert : findResults) {
            CertificateCandidate candidate(cert, verifier_);
            if (candidate.HasPrivateKey() && HasExactCommonName(candidate.CommonNames(), identifier)) {
                candidates.push_back(std::move(candidate));
            }
        }

        RankCandidates(candidates);

        std::vector<std::string> rankedSubjects;
        for (const auto& candidate : candidates) {
            rankedSubjects.push_back(candidate.SubjectName());
        }
        logWithAppropriateLevel(tracer, ctx, candidates.size(),
            "Found " + std::to_string(candidates.size()) +
            " certificates with a private key and an exact CN match. DNs (sorted by priority, will take first): " +
            subjectLines(rankedSubjects));

        if (candidates.empty()) {
            return nullptr;
        }
        return candidates.front().GetCertificate();
    } catch (const CryptographicError& e) {
        tracer.RelatedError(ctx.With("Exception", e.what()), "Error, while searching for certificate in store");
        return nullptr;
    }
}

} // namespace crypto
} // namespace certresolver

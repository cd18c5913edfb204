#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "certresolver/types.hpp"
#include "certresolver/passRetriever/passRetriever.hpp"
#include "certresolver/storage/certificate_store.hpp"
#include "certresolver/utils/tracer.hpp"
#include "certresolver/utils/x509.hpp"

namespace certresolver {
namespace crypto {

// 客户端证书相关配置，构造后不再修改
struct ResolverConfig {
    // 证书文件路径或证书存储中的主题CN；为空表示不需要客户端证书
    std::optional<std::string> identifier;
    bool passwordProtected = false;
    // 默认验证，与 git 的 http.sslVerify 默认值一致
    bool verify = true;

    // 每个配置项取最后一个值；布尔值无法解析时抛出 ConfigError
    static ResolverConfig FromSettings(const ConfigSettings& settings);
};

// 按数量选择日志级别：0 -> Error，1 -> Info，其他 -> Warning
utils::Severity SeverityFor(size_t count);

// commonNames 中是否有与 identifier 逐字节相同的一项；只比较 CN 字段的值，不解析打印出的DN
bool HasExactCommonName(const std::vector<std::string>& commonNames, const std::string& identifier);

// 存储搜索得到的候选证书及排序所需的属性
class CertificateCandidate {
public:
    CertificateCandidate(std::shared_ptr<utils::Certificate> cert,
                         std::shared_ptr<const utils::ChainVerifier> verifier);

    const std::shared_ptr<utils::Certificate>& GetCertificate() const { return cert_; }
    bool HasPrivateKey() const { return hasPrivateKey_; }
    const std::string& SubjectName() const { return subjectName_; }
    const std::vector<std::string>& CommonNames() const { return commonNames_; }
    std::chrono::system_clock::time_point NotBefore() const { return notBefore_; }
    std::chrono::system_clock::time_point NotAfter() const { return notAfter_; }

    // 链验证开销较大，第一次调用时计算并缓存
    bool IsCurrentlyValid() const;

private:
    std::shared_ptr<utils::Certificate> cert_;
    std::shared_ptr<const utils::ChainVerifier> verifier_;
    bool hasPrivateKey_;
    std::string subjectName_;
    std::vector<std::string> commonNames_;
    std::chrono::system_clock::time_point notBefore_;
    std::chrono::system_clock::time_point notAfter_;
    mutable std::optional<bool> isCurrentlyValid_;
};

// 排序：当前有效的在前；其次 NotBefore 升序（最早签发的优先）；最后 NotAfter 降序。
// 稳定排序，完全相同的候选保持存储中的顺序。
void RankCandidates(std::vector<CertificateCandidate>& candidates);

// 根据配置确定连接时应提供的客户端证书
class CertificateResolver {
public:
    // 没有任何配置：identifier 为空，Resolve 总是返回 nullptr
    explicit CertificateResolver(std::shared_ptr<utils::ChainVerifier> verifier = nullptr,
                                 storage::StoreFactory storeFactory = nullptr);

    // verifier 为空时使用 OpenSSL 默认信任根；storeFactory 为空时使用默认目录存储
    explicit CertificateResolver(const ConfigSettings& settings,
                                 std::shared_ptr<utils::ChainVerifier> verifier = nullptr,
                                 storage::StoreFactory storeFactory = nullptr);

    const ResolverConfig& Config() const { return config_; }

    // 是否验证加载的证书；调用方也用它决定是否验证服务器证书
    bool ShouldVerify() const { return config_.verify; }

    // 先按文件路径查找，再查证书存储；都找不到时返回 nullptr
    std::shared_ptr<utils::Certificate> Resolve(utils::Tracer& tracer,
                                                const passphrase::PassRetriever& passwordProvider) const;

private:
    std::string requestPassword(const passphrase::PassRetriever& passwordProvider) const;

    std::shared_ptr<utils::Certificate> resolveFromFile(utils::Tracer& tracer,
                                                        utils::LogContext& ctx,
                                                        const passphrase::PassRetriever& passwordProvider) const;

    std::shared_ptr<utils::Certificate> resolveFromStore(utils::Tracer& tracer,
                                                         const utils::LogContext& ctx) const;

    ResolverConfig config_;
    std::shared_ptr<utils::ChainVerifier> verifier_;
    storage::StoreFactory storeFactory_;
};

} // namespace crypto
} // namespace certresolver

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <memory>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <openssl/evp.h>
#include "certresolver/types.hpp"

namespace certresolver {
namespace utils {

// X509证书包装类
// 持有叶子证书、可选的私钥以及随证书一起加载的中间证书链。
// 构造函数接管传入指针的引用计数，析构时释放。
class Certificate {
public:
    Certificate() = default;
    explicit Certificate(X509* cert);
    Certificate(X509* cert, EVP_PKEY* privateKey, std::vector<X509*> chain);
    ~Certificate();

    // 禁用拷贝构造和拷贝赋值
    Certificate(const Certificate&) = delete;
    Certificate& operator=(const Certificate&) = delete;

    // 支持移动构造和移动赋值
    Certificate(Certificate&& other) noexcept;
    Certificate& operator=(Certificate&& other) noexcept;

    X509* GetX509() const { return cert_; }
    EVP_PKEY* GetPrivateKey() const { return privateKey_; }
    const std::vector<X509*>& GetChain() const { return chain_; }

    // 主题DN，最具体的字段在前，以 ", " 分隔，例如 "CN=agent, O=Contoso, C=US"
    std::string GetSubject() const;

    // 颁发者DN，格式同 GetSubject
    std::string GetIssuer() const;

    // 获取证书的通用名称(Common Name)，有多个时取第一个
    std::string GetCommonName() const;

    // 主题中全部 CN 字段的值，按证书中的顺序，转换为 UTF-8
    std::vector<std::string> GetCommonNames() const;

    // 有效期（UTC）
    std::chrono::system_clock::time_point GetNotBefore() const;
    std::chrono::system_clock::time_point GetNotAfter() const;

    // 私钥存在且与证书公钥匹配
    bool HasPrivateKey() const;

    // DER编码的SHA-1摘要，大写十六进制
    std::string GetThumbprint() const;

    std::vector<uint8_t> ToPEM() const;
    std::vector<uint8_t> ToDER() const;

    // 未加密的 PKCS#8 PEM；没有私钥时返回空
    std::vector<uint8_t> PrivateKeyToPEM() const;

private:
    void release();

    X509* cert_ = nullptr;
    EVP_PKEY* privateKey_ = nullptr;
    std::vector<X509*> chain_;
};

// 从内存加载证书
// 依次尝试 PEM（证书 + 可选私钥，私钥用 password 解密）、PKCS#12、DER X.509。
// 任何失败（格式无法识别、密码错误、数据损坏）都抛出 CryptographicError。
std::shared_ptr<Certificate> LoadCertificateFromMemory(const std::vector<uint8_t>& data,
                                                       const std::string& password);

// 从文件加载证书，文件句柄只在本次调用内打开
std::shared_ptr<Certificate> LoadCertificateFromFile(const std::string& filename,
                                                     const std::string& password = "");

// 把 ASN1_TIME 转换为 UTC 时间点
std::chrono::system_clock::time_point ASN1TimeToTimePoint(const ASN1_TIME* time);

// 取出并清空 OpenSSL 错误队列，返回可读的错误描述
std::string ConsumeOpenSSLErrors();

// 证书链验证器
// 持有信任根（X509_STORE），验证证书能否链接到受信任的根并且链上每个证书当前都在有效期内。
class ChainVerifier {
public:
    ChainVerifier();
    ~ChainVerifier();

    ChainVerifier(const ChainVerifier&) = delete;
    ChainVerifier& operator=(const ChainVerifier&) = delete;

    // 使用 OpenSSL 默认信任路径（系统 CA 包、SSL_CERT_FILE / SSL_CERT_DIR）
    static std::shared_ptr<ChainVerifier> CreateDefault();

    Error LoadCAFile(const std::string& caFile);
    Error LoadCAPath(const std::string& caPath);
    Error AddTrustedCertificate(const Certificate& cert);

    // 返回失败原因；成功时返回空的 Error
    Error Check(const Certificate& cert) const;

    bool Verify(const Certificate& cert) const { return Check(cert).ok(); }

private:
    X509_STORE* store_ = nullptr;
};

} // namespace utils
} // namespace certresolver

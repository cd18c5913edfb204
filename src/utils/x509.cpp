#include "certresolver/utils/x509.hpp"
#include "certresolver/utils/logger.hpp"
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/pkcs12.h>
#include <algorithm>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace certresolver {
namespace utils {

namespace {

// 把 X509_NAME 格式化为 "CN=..., O=..., C=..." 形式
std::string formatName(X509_NAME* name) {
    if (!name) return "";

    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) return "";

    const unsigned long flags = XN_FLAG_SEP_CPLUS_SPC | XN_FLAG_DN_REV | XN_FLAG_FN_SN |
                                ASN1_STRFLGS_UTF8_CONVERT | ASN1_STRFLGS_ESC_CTRL;
    if (X509_NAME_print_ex(bio, name, 0, flags) < 0) {
        BIO_free(bio);
        return "";
    }

    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    std::string result(data, static_cast<size_t>(len));
    BIO_free(bio);
    return result;
}

// PEM 私钥解密回调，u 指向密码字符串；空密码返回 0 使解密失败
int passwordCallback(char* buf, int size, int /*rwflag*/, void* u) {
    const std::string* password = static_cast<const std::string*>(u);
    if (!password || password->empty()) {
        return 0;
    }
    int len = static_cast<int>(password->size());
    if (len > size) {
        len = size;
    }
    std::memcpy(buf, password->data(), static_cast<size_t>(len));
    return len;
}

bool containsText(const std::vector<uint8_t>& data, const std::string& text) {
    auto it = std::search(data.begin(), data.end(), text.begin(), text.end());
    return it != data.end();
}

bool looksLikePEM(const std::vector<uint8_t>& data) {
    return containsText(data, "-----BEGIN");
}

void freeCerts(std::vector<X509*>& certs) {
    for (X509* c : certs) {
        X509_free(c);
    }
    certs.clear();
}

std::shared_ptr<Certificate> loadFromPEM(const std::vector<uint8_t>& data, const std::string& password) {
    // 第一遍：读取所有证书块
    std::vector<X509*> certs;
    BIO* bio = BIO_new_mem_buf(data.data(), static_cast<int>(data.size()));
    if (!bio) {
        throw CryptographicError("Failed to create memory BIO for PEM data");
    }
    while (X509* cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr)) {
        certs.push_back(cert);
    }
    BIO_free(bio);
    ERR_clear_error();

    if (certs.empty()) {
        throw CryptographicError("No certificate found in PEM data");
    }

    // 第二遍：读取私钥（可能是加密的）
    if (!containsText(data, "PRIVATE KEY-----")) {
        X509* leaf = certs.front();
        std::vector<X509*> chain(certs.begin() + 1, certs.end());
        return std::make_shared<Certificate>(leaf, nullptr, std::move(chain));
    }

    bio = BIO_new_mem_buf(data.data(), static_cast<int>(data.size()));
    if (!bio) {
        freeCerts(certs);
        throw CryptographicError("Failed to create memory BIO for PEM data");
    }
    EVP_PKEY* pkey = PEM_read_bio_PrivateKey(bio, nullptr, passwordCallback,
                                             const_cast<std::string*>(&password));
    BIO_free(bio);

    if (!pkey) {
        std::string detail = ConsumeOpenSSLErrors();
        freeCerts(certs);
        throw CryptographicError("Failed to decrypt private key (wrong password or corrupt key): " + detail);
    }

    // 叶子证书：与私钥匹配的那一个，否则取第一个
    size_t leafIndex = 0;
    for (size_t i = 0; i < certs.size(); ++i) {
        if (X509_check_private_key(certs[i], pkey) == 1) {
            leafIndex = i;
            break;
        }
    }
    ERR_clear_error();

    X509* leaf = certs[leafIndex];
    std::vector<X509*> chain;
    for (size_t i = 0; i < certs.size(); ++i) {
        if (i != leafIndex) {
            chain.push_back(certs[i]);
        }
    }

    return std::make_shared<Certificate>(leaf, pkey, std::move(chain));
}

// 返回 nullptr 表示数据不是 PKCS#12
std::shared_ptr<Certificate> loadFromPKCS12(const std::vector<uint8_t>& data, const std::string& password) {
    const unsigned char* p = data.data();
    PKCS12* p12 = d2i_PKCS12(nullptr, &p, static_cast<long>(data.size()));
    if (!p12) {
        ERR_clear_error();
        return nullptr;
    }

    EVP_PKEY* pkey = nullptr;
    X509* cert = nullptr;
    STACK_OF(X509)* ca = nullptr;

    int ok = PKCS12_parse(p12, password.c_str(), &pkey, &cert, &ca);
    PKCS12_free(p12);

    if (ok != 1) {
        throw CryptographicError("Failed to parse PKCS#12 data (wrong password or corrupt file): " +
                                 ConsumeOpenSSLErrors());
    }

    std::vector<X509*> chain;
    if (ca) {
        for (int i = 0; i < sk_X509_num(ca); ++i) {
            chain.push_back(sk_X509_value(ca, i));
        }
        // 证书的所有权已转移到 chain，这里只释放栈本身
        sk_X509_free(ca);
    }

    if (!cert) {
        EVP_PKEY_free(pkey);
        freeCerts(chain);
        throw CryptographicError("PKCS#12 data contains no certificate");
    }

    return std::make_shared<Certificate>(cert, pkey, std::move(chain));
}

} // namespace

// Certificate类实现

Certificate::Certificate(X509* cert) : cert_(cert) {}

Certificate::Certificate(X509* cert, EVP_PKEY* privateKey, std::vector<X509*> chain)
    : cert_(cert), privateKey_(privateKey), chain_(std::move(chain)) {}

Certificate::~Certificate() {
    release();
}

Certificate::Certificate(Certificate&& other) noexcept
    : cert_(other.cert_), privateKey_(other.privateKey_), chain_(std::move(other.chain_)) {
    other.cert_ = nullptr;
    other.privateKey_ = nullptr;
    other.chain_.clear();
}

Certificate& Certificate::operator=(Certificate&& other) noexcept {
    if (this != &other) {
        release();
        cert_ = other.cert_;
        privateKey_ = other.privateKey_;
        chain_ = std::move(other.chain_);
        other.cert_ = nullptr;
        other.privateKey_ = nullptr;
        other.chain_.clear();
    }
    return *this;
}

void Certificate::release() {
    if (cert_) {
        X509_free(cert_);
        cert_ = nullptr;
    }
    if (privateKey_) {
        EVP_PKEY_free(privateKey_);
        privateKey_ = nullptr;
    }
    freeCerts(chain_);
}

std::string Certificate::GetSubject() const {
    if (!cert_) return "";
    return formatName(X509_get_subject_name(cert_));
}

std::string Certificate::GetIssuer() const {
    if (!cert_) return "";
    return formatName(X509_get_issuer_name(cert_));
}

std::string Certificate::GetCommonName() const {
    auto names = GetCommonNames();
    return names.empty() ? "" : names.front();
}

std::vector<std::string> Certificate::GetCommonNames() const {
    std::vector<std::string> names;
    if (!cert_) return names;

    X509_NAME* subject = X509_get_subject_name(cert_);
    if (!subject) return names;

    int idx = -1;
    while ((idx = X509_NAME_get_index_by_NID(subject, NID_commonName, idx)) >= 0) {
        X509_NAME_ENTRY* entry = X509_NAME_get_entry(subject, idx);
        ASN1_STRING* data = entry ? X509_NAME_ENTRY_get_data(entry) : nullptr;
        if (!data) continue;

        // BMPString 等编码统一转成 UTF-8 后再比较
        unsigned char* utf8 = nullptr;
        int len = ASN1_STRING_to_UTF8(&utf8, data);
        if (len < 0) {
            ConsumeOpenSSLErrors();
            continue;
        }
        names.emplace_back(reinterpret_cast<const char*>(utf8), static_cast<size_t>(len));
        OPENSSL_free(utf8);
    }
    return names;
}

std::chrono::system_clock::time_point Certificate::GetNotBefore() const {
    if (!cert_) return std::chrono::system_clock::time_point{};
    return ASN1TimeToTimePoint(X509_get0_notBefore(cert_));
}

std::chrono::system_clock::time_point Certificate::GetNotAfter() const {
    if (!cert_) return std::chrono::system_clock::time_point{};
    return ASN1TimeToTimePoint(X509_get0_notAfter(cert_));
}

bool Certificate::HasPrivateKey() const {
    if (!cert_ || !privateKey_) return false;

    bool matches = X509_check_private_key(cert_, privateKey_) == 1;
    ERR_clear_error();
    return matches;
}

std::string Certificate::GetThumbprint() const {
    if (!cert_) return "";

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (X509_digest(cert_, EVP_sha1(), md, &len) != 1) {
        ERR_clear_error();
        return "";
    }

    std::stringstream ss;
    ss << std::uppercase << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < len; ++i) {
        ss << std::setw(2) << static_cast<int>(md[i]);
    }
    return ss.str();
}

std::vector<uint8_t> Certificate::ToPEM() const {
    if (!cert_) return {};

    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) return {};

    if (PEM_write_bio_X509(bio, cert_) != 1) {
        BIO_free(bio);
        return {};
    }

    char* pemData;
    long pemLen = BIO_get_mem_data(bio, &pemData);

    std::vector<uint8_t> result(pemData, pemData + pemLen);
    BIO_free(bio);

    return result;
}

std::vector<uint8_t> Certificate::ToDER() const {
    if (!cert_) return {};

    int derLen = i2d_X509(cert_, nullptr);
    if (derLen <= 0) return {};

    std::vector<uint8_t> derData(derLen);
    unsigned char* derPtr = derData.data();

    if (i2d_X509(cert_, &derPtr) != derLen) {
        return {};
    }

    return derData;
}

std::vector<uint8_t> Certificate::PrivateKeyToPEM() const {
    if (!privateKey_) return {};

    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) return {};

    if (PEM_write_bio_PrivateKey(bio, privateKey_, nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        BIO_free(bio);
        return {};
    }

    char* pemData;
    long pemLen = BIO_get_mem_data(bio, &pemData);

    std::vector<uint8_t> result(pemData, pemData + pemLen);
    BIO_free(bio);

    return result;
}

std::shared_ptr<Certificate> LoadCertificateFromMemory(const std::vector<uint8_t>& data,
                                                       const std::string& password) {
    if (data.empty()) {
        throw CryptographicError("Certificate data is empty");
    }

    if (looksLikePEM(data)) {
        return loadFromPEM(data, password);
    }

    auto fromP12 = loadFromPKCS12(data, password);
    if (fromP12) {
        return fromP12;
    }

    const unsigned char* p = data.data();
    X509* cert = d2i_X509(nullptr, &p, static_cast<long>(data.size()));
    if (!cert) {
        throw CryptographicError("Unrecognized certificate format: " + ConsumeOpenSSLErrors());
    }
    return std::make_shared<Certificate>(cert);
}

std::shared_ptr<Certificate> LoadCertificateFromFile(const std::string& filename,
                                                     const std::string& password) {
    std::vector<uint8_t> data;
    {
        std::ifstream file(filename, std::ios::binary);
        if (!file.is_open()) {
            throw CryptographicError("Cannot open file: " + filename);
        }
        data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    GetLogger().Debug("Loading certificate from file", LogContext().With("path", filename));
    return LoadCertificateFromMemory(data, password);
}

std::chrono::system_clock::time_point ASN1TimeToTimePoint(const ASN1_TIME* time) {
    if (!time) return std::chrono::system_clock::time_point{};

    struct tm tm_info = {};
    if (ASN1_TIME_to_tm(time, &tm_info) != 1) {
        return std::chrono::system_clock::time_point{};
    }

    // ASN1 时间为 UTC，使用 timegm 避免本地时区偏移
    time_t t = timegm(&tm_info);
    return std::chrono::system_clock::from_time_t(t);
}

std::string ConsumeOpenSSLErrors() {
    std::string result;
    unsigned long err;
    char buf[256];
    while ((err = ERR_get_error()) != 0) {
        ERR_error_string_n(err, buf, sizeof(buf));
        if (!result.empty()) result += "; ";
        result += buf;
    }
    return result.empty() ? "unknown error" : result;
}

// ChainVerifier实现

ChainVerifier::ChainVerifier() : store_(X509_STORE_new()) {
    if (!store_) {
        throw CryptographicError("Failed to allocate X509 store");
    }
}

ChainVerifier::~ChainVerifier() {
    if (store_) {
        X509_STORE_free(store_);
    }
}

std::shared_ptr<ChainVerifier> ChainVerifier::CreateDefault() {
    auto verifier = std::make_shared<ChainVerifier>();
    if (X509_STORE_set_default_paths(verifier->store_) != 1) {
        // 没有系统信任根时所有证书都验证失败，但不影响运行
        GetLogger().Warn("Failed to load default trust roots: " + ConsumeOpenSSLErrors());
    }
    return verifier;
}

Error ChainVerifier::LoadCAFile(const std::string& caFile) {
    if (X509_STORE_load_file(store_, caFile.c_str()) != 1) {
        return Error("Failed to load CA file " + caFile + ": " + ConsumeOpenSSLErrors());
    }
    return Error();
}

Error ChainVerifier::LoadCAPath(const std::string& caPath) {
    if (X509_STORE_load_path(store_, caPath.c_str()) != 1) {
        return Error("Failed to load CA path " + caPath + ": " + ConsumeOpenSSLErrors());
    }
    return Error();
}

Error ChainVerifier::AddTrustedCertificate(const Certificate& cert) {
    if (!cert.GetX509()) {
        return Error("Certificate is null");
    }
    if (X509_STORE_add_cert(store_, cert.GetX509()) != 1) {
        return Error("Failed to add trusted certificate: " + ConsumeOpenSSLErrors());
    }
    return Error();
}

Error ChainVerifier::Check(const Certificate& cert) const {
    if (!cert.GetX509()) {
        return Error("Certificate is null");
    }

    X509_STORE_CTX* ctx = X509_STORE_CTX_new();
    if (!ctx) {
        return Error("Failed to allocate verification context");
    }

    STACK_OF(X509)* untrusted = sk_X509_new_null();
    if (!untrusted) {
        X509_STORE_CTX_free(ctx);
        return Error("Failed to allocate certificate stack");
    }
    for (X509* c : cert.GetChain()) {
        sk_X509_push(untrusted, c);
    }

    Error result;
    if (X509_STORE_CTX_init(ctx, store_, cert.GetX509(), untrusted) != 1) {
        result = Error("Failed to initialise verification context: " + ConsumeOpenSSLErrors());
    } else if (X509_verify_cert(ctx) != 1) {
        int code = X509_STORE_CTX_get_error(ctx);
        result = Error(X509_verify_cert_error_string(code));
    }

    // 栈中的证书仍归 cert 所有
    sk_X509_free(untrusted);
    X509_STORE_CTX_free(ctx);
    ERR_clear_error();
    return result;
}

} // namespace utils
} // namespace certresolver

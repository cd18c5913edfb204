#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include "certresolver/types.hpp"
#include "certresolver/utils/x509.hpp"

namespace certresolver {
namespace storage {

// 只读证书存储接口
class CertificateStore {
public:
    virtual ~CertificateStore() = default;

    // 以只读、仅打开已存在存储的方式打开，失败抛出 StoreError
    virtual void Open() = 0;
    virtual void Close() = 0;
    virtual bool IsOpen() const = 0;

    // 返回主题包含 name 的全部证书（不区分大小写的子串匹配）。
    // validOnly 为 true 且存储配置了验证器时只返回通过链验证的证书。
    // 存储未打开或读取失败时抛出 StoreError。
    virtual std::vector<std::shared_ptr<utils::Certificate>> FindBySubjectName(
        const std::string& name, bool validOnly) = 0;

    virtual std::string Location() const = 0;
};

// 存储工厂，每次解析创建新的存储对象
using StoreFactory = std::function<std::unique_ptr<CertificateStore>()>;

// 在作用域内保持存储打开，离开作用域（包括异常）时关闭
class ScopedStore {
public:
    explicit ScopedStore(CertificateStore& store);
    ~ScopedStore();

    ScopedStore(const ScopedStore&) = delete;
    ScopedStore& operator=(const ScopedStore&) = delete;

    CertificateStore* operator->() const { return &store_; }
    CertificateStore& get() const { return store_; }

private:
    CertificateStore& store_;
};

// 主题子串匹配，不区分大小写
bool SubjectContains(const std::string& subject, const std::string& name);

// 基于目录的调用者级证书存储
// 目录中的 *.pfx、*.p12、*.pem、*.crt、*.cer 文件各视为一个证书条目。
class DirectoryCertificateStore : public CertificateStore {
public:
    explicit DirectoryCertificateStore(const std::string& directory,
                                       std::shared_ptr<utils::ChainVerifier> verifier = nullptr);

    void Open() override;
    void Close() override;
    bool IsOpen() const override { return open_; }

    std::vector<std::shared_ptr<utils::Certificate>> FindBySubjectName(
        const std::string& name, bool validOnly) override;

    std::string Location() const override { return directory_; }

    // 默认位置：$CERTRESOLVER_STORE_DIR，其次 $XDG_DATA_HOME/certresolver/x509stores/my，
    // 再次 $HOME/.local/share/certresolver/x509stores/my，都未设置时相对当前目录。
    // 当前目录无法获取时抛出 StoreError
    static std::string DefaultLocation();

private:
    std::string directory_;
    std::shared_ptr<utils::ChainVerifier> verifier_;
    bool open_ = false;
    std::vector<std::shared_ptr<utils::Certificate>> certificates_;
};

// 内存证书存储，证书由调用方直接加入
class MemoryCertificateStore : public CertificateStore {
public:
    explicit MemoryCertificateStore(std::shared_ptr<utils::ChainVerifier> verifier = nullptr);

    void Add(std::shared_ptr<utils::Certificate> cert);

    void Open() override { open_ = true; }
    void Close() override { open_ = false; }
    bool IsOpen() const override { return open_; }

    std::vector<std::shared_ptr<utils::Certificate>> FindBySubjectName(
        const std::string& name, bool validOnly) override;

    std::string Location() const override { return "memory"; }

private:
    std::shared_ptr<utils::ChainVerifier> verifier_;
    bool open_ = false;
    std::vector<std::shared_ptr<utils::Certificate>> certificates_;
};

} // namespace storage
} // namespace certresolver

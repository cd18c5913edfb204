#include "certresolver/storage/certificate_store.hpp"
#include "certresolver/utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <set>
#include <system_error>

namespace certresolver {
namespace storage {

namespace fs = std::filesystem;

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::shared_ptr<utils::Certificate>> filterBySubject(
    const std::vector<std::shared_ptr<utils::Certificate>>& certificates,
    const std::string& name,
    bool validOnly,
    const std::shared_ptr<utils::ChainVerifier>& verifier) {

    std::vector<std::shared_ptr<utils::Certificate>> matches;
    for (const auto& cert : certificates) {
        if (!SubjectContains(cert->GetSubject(), name)) {
            continue;
        }
        if (validOnly && verifier && !verifier->Verify(*cert)) {
            continue;
        }
        matches.push_back(cert);
    }
    return matches;
}

} // namespace

ScopedStore::ScopedStore(CertificateStore& store) : store_(store) {
    store_.Open();
}

ScopedStore::~ScopedStore() {
    store_.Close();
}

bool SubjectContains(const std::string& subject, const std::string& name) {
    if (name.empty()) {
        return false;
    }
    return toLower(subject).find(toLower(name)) != std::string::npos;
}

// DirectoryCertificateStore实现

DirectoryCertificateStore::DirectoryCertificateStore(const std::string& directory,
                                                     std::shared_ptr<utils::ChainVerifier> verifier)
    : directory_(directory), verifier_(std::move(verifier)) {}

void DirectoryCertificateStore::Open() {
    if (open_) {
        return;
    }

    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        throw StoreError("store does not exist: " + directory_);
    }

    static const std::set<std::string> extensions = {".pfx", ".p12", ".pem", ".crt", ".cer"};

    std::vector<fs::path> entries;
    fs::directory_iterator it(directory_, ec);
    if (ec) {
        throw StoreError("cannot read " + directory_ + ": " + ec.message());
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw StoreError("cannot read " + directory_ + ": " + ec.message());
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }
        if (extensions.count(toLower(it->path().extension().string())) > 0) {
            entries.push_back(it->path());
        }
    }
    if (ec) {
        throw StoreError("cannot read " + directory_ + ": " + ec.message());
    }

    // 按文件名排序，保证多次搜索结果顺序一致
    std::sort(entries.begin(), entries.end());

    std::vector<std::shared_ptr<utils::Certificate>> loaded;
    for (const auto& path : entries) {
        try {
            loaded.push_back(utils::LoadCertificateFromFile(path.string()));
        } catch (const CryptographicError& e) {
            // 受密码保护或损坏的条目不影响其他条目
            utils::GetLogger().Debug("Skipping unreadable store entry", utils::LogContext()
                .With("path", path.string())
                .With("error", e.what()));
        }
    }

    certificates_ = std::move(loaded);
    open_ = true;
}

void DirectoryCertificateStore::Close() {
    certificates_.clear();
    open_ = false;
}

std::vector<std::shared_ptr<utils::Certificate>> DirectoryCertificateStore::FindBySubjectName(
    const std::string& name, bool validOnly) {
    if (!open_) {
        throw StoreError("store is not open: " + directory_);
    }
    return filterBySubject(certificates_, name, validOnly, verifier_);
}

std::string DirectoryCertificateStore::DefaultLocation() {
    if (const char* dir = std::getenv("CERTRESOLVER_STORE_DIR")) {
        if (*dir) return dir;
    }

    fs::path base;
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = fs::path(home) / ".local" / "share";
    } else {
        std::error_code ec;
        base = fs::current_path(ec);
        if (ec) {
            throw StoreError("cannot determine default store location: " + ec.message());
        }
    }
    return (base / "certresolver" / "x509stores" / "my").string();
}

// MemoryCertificateStore实现

MemoryCertificateStore::MemoryCertificateStore(std::shared_ptr<utils::ChainVerifier> verifier)
    : verifier_(std::move(verifier)) {}

void MemoryCertificateStore::Add(std::shared_ptr<utils::Certificate> cert) {
    if (cert) {
        certificates_.push_back(std::move(cert));
    }
}

std::vector<std::shared_ptr<utils::Certificate>> MemoryCertificateStore::FindBySubjectName(
    const std::string& name, bool validOnly) {
    if (!open_) {
        throw StoreError("store is not open: memory");
    }
    return filterBySubject(certificates_, name, validOnly, verifier_);
}

} // namespace storage
} // namespace certresolver

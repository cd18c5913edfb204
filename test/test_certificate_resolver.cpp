#include <catch2/catch_test_macros.hpp>
#include "certresolver/crypto/certificate_resolver.hpp"
#include "certresolver/config/git_config.hpp"
#include "test_helpers.hpp"

using namespace certresolver;
using namespace certresolver::crypto;
using certresolver::test::RecordingTracer;
using certresolver::test::ScopedCurrentPath;
using certresolver::test::ScopedEnv;
using certresolver::test::TempDir;
using certresolver::test::TestPKI;
using certresolver::utils::Severity;

namespace {

using CertList = std::vector<std::shared_ptr<utils::Certificate>>;

// 每次解析创建一个新的内存存储，内容相同
storage::StoreFactory memoryStore(CertList certs, std::shared_ptr<utils::ChainVerifier> verifier) {
    return [certs, verifier]() -> std::unique_ptr<storage::CertificateStore> {
        auto store = std::make_unique<storage::MemoryCertificateStore>(verifier);
        for (const auto& cert : certs) {
            store->Add(cert);
        }
        return store;
    };
}

storage::StoreFactory emptyStore() {
    return memoryStore({}, nullptr);
}

// 记录打开/关闭次数，搜索时抛出异常
class FailingSearchStore : public storage::CertificateStore {
public:
    explicit FailingSearchStore(int* closeCount) : closeCount_(closeCount) {}

    void Open() override { open_ = true; }
    void Close() override {
        open_ = false;
        ++*closeCount_;
    }
    bool IsOpen() const override { return open_; }

    CertList FindBySubjectName(const std::string&, bool) override {
        throw StoreError("search failed");
    }

    std::string Location() const override { return "failing"; }

private:
    int* closeCount_;
    bool open_ = false;
};

ConfigSettings settingsFor(const std::string& identifier,
                           const std::string& verify = "",
                           const std::string& passwordProtected = "") {
    ConfigSettings settings;
    settings[config::HttpSslCert].push_back(identifier);
    if (!verify.empty()) {
        settings[config::HttpSslVerify].push_back(verify);
    }
    if (!passwordProtected.empty()) {
        settings[config::HttpSslCertPasswordProtected].push_back(passwordProtected);
    }
    return settings;
}

passphrase::PassRetriever noPassword() {
    return passphrase::FailingRetriever("no password");
}

} // namespace

TEST_CASE("SeverityFor - maps counts to severities", "[resolver]") {
    REQUIRE(SeverityFor(0) == Severity::Error);
    REQUIRE(SeverityFor(1) == Severity::Info);
    REQUIRE(SeverityFor(2) == Severity::Warning);
    REQUIRE(SeverityFor(17) == Severity::Warning);
}

TEST_CASE("HasExactCommonName - compares CN values", "[resolver]") {
    SECTION("Any entry may match") {
        REQUIRE(HasExactCommonName({"agent"}, "agent"));
        REQUIRE(HasExactCommonName({"first", "agent"}, "agent"));
        REQUIRE_FALSE(HasExactCommonName({}, "agent"));
    }

    SECTION("Rejects prefixes and suffixes") {
        REQUIRE_FALSE(HasExactCommonName({"foobar"}, "foo"));
        REQUIRE_FALSE(HasExactCommonName({"barfoo"}, "foo"));
        REQUIRE_FALSE(HasExactCommonName({"Foo"}, "foo"));
    }

    SECTION("Separators inside a value do not split it") {
        REQUIRE_FALSE(HasExactCommonName({"bar, CN=foo"}, "foo"));
        REQUIRE_FALSE(HasExactCommonName({"foo, O=x"}, "foo"));
        REQUIRE(HasExactCommonName({"bar, CN=foo"}, "bar, CN=foo"));
    }

    SECTION("Identifier is taken literally") {
        REQUIRE(HasExactCommonName({"a.b"}, "a.b"));
        REQUIRE_FALSE(HasExactCommonName({"axb"}, "a.b"));
        REQUIRE(HasExactCommonName({"svc (prod)"}, "svc (prod)"));
        REQUIRE_FALSE(HasExactCommonName({"agent"}, ".*"));
    }

    SECTION("Empty identifier never matches") {
        REQUIRE_FALSE(HasExactCommonName({""}, ""));
    }
}

TEST_CASE("ResolverConfig - reads last value of each key", "[resolver]") {
    SECTION("Defaults") {
        auto config = ResolverConfig::FromSettings({});
        REQUIRE_FALSE(config.identifier.has_value());
        REQUIRE_FALSE(config.passwordProtected);
        REQUIRE(config.verify);
    }

    SECTION("Last value wins") {
        ConfigSettings settings;
        settings[config::HttpSslCert] = {"first.pfx", "second.pfx"};
        settings[config::HttpSslVerify] = {"false", "true", "no"};
        settings[config::HttpSslCertPasswordProtected] = {"off", "yes"};

        auto config = ResolverConfig::FromSettings(settings);
        REQUIRE(config.identifier == std::string("second.pfx"));
        REQUIRE(config.passwordProtected);
        REQUIRE_FALSE(config.verify);
    }

    SECTION("Invalid boolean fails at construction") {
        ConfigSettings settings;
        settings[config::HttpSslVerify] = {"maybe"};
        REQUIRE_THROWS_AS(CertificateResolver(settings, std::make_shared<utils::ChainVerifier>(), emptyStore()),
                          ConfigError);
    }
}

TEST_CASE("CertificateResolver - no identifier", "[resolver]") {
    RecordingTracer tracer;

    SECTION("Absent setting") {
        CertificateResolver resolver(std::make_shared<utils::ChainVerifier>(), emptyStore());
        REQUIRE(resolver.Resolve(tracer, noPassword()) == nullptr);
    }

    SECTION("Empty value") {
        CertificateResolver resolver(settingsFor(""), std::make_shared<utils::ChainVerifier>(), emptyStore());
        REQUIRE(resolver.Resolve(tracer, noPassword()) == nullptr);
    }

    REQUIRE(tracer.events.empty());
}

TEST_CASE("CertificateResolver - file based resolution", "[resolver]") {
    TempDir dir;
    TestPKI pki;
    RecordingTracer tracer;

    SECTION("Trusted PEM file loads with one info event") {
        auto cert = pki.Issue("agent");
        std::string path = dir.File("agent.pem");
        test::WritePem(path, *cert);

        CertificateResolver resolver(settingsFor(path), pki.Verifier(), emptyStore());
        auto result = resolver.Resolve(tracer, noPassword());

        REQUIRE(result != nullptr);
        REQUIRE(result->GetThumbprint() == cert->GetThumbprint());
        REQUIRE(result->HasPrivateKey());
        REQUIRE(tracer.events.size() == 1);
        REQUIRE(tracer.events[0].severity == Severity::Info);
        REQUIRE(tracer.events[0].message == "Certificate loaded from file");
        REQUIRE(tracer.events[0].fields.at("CertificatePathOrSubjectCommonName") == path);
        REQUIRE(tracer.events[0].fields.at("IsCertificatePasswordProtected") == "False");
        REQUIRE(tracer.events[0].fields.at("ShouldVerify") == "True");
    }

    SECTION("Untrusted file is returned when verification is off") {
        auto cert = pki.SelfSigned("agent");
        std::string path = dir.File("self.pem");
        test::WritePem(path, *cert);

        CertificateResolver resolver(settingsFor(path, "false"), pki.Verifier(), emptyStore());
        auto result = resolver.Resolve(tracer, noPassword());

        REQUIRE(result != nullptr);
        REQUIRE(result->GetThumbprint() == cert->GetThumbprint());
        REQUIRE(tracer.Count(Severity::Warning) == 0);
        REQUIRE(tracer.Count(Severity::Error) == 0);
        REQUIRE(tracer.events.back().fields.at("ShouldVerify") == "False");
    }

    SECTION("Untrusted file is rejected when verification is on") {
        auto cert = pki.SelfSigned("agent");
        std::string path = dir.File("self.pem");
        test::WritePem(path, *cert);

        CertificateResolver resolver(settingsFor(path), pki.Verifier(), emptyStore());
        REQUIRE(resolver.Resolve(tracer, noPassword()) == nullptr);

        REQUIRE(tracer.events.size() == 2);
        REQUIRE(tracer.events[0].severity == Severity::Warning);
        REQUIRE(tracer.events[0].message == "Certificate was found, but is invalid.");
        REQUIRE(tracer.events[0].fields.count("VerificationError") == 1);
        REQUIRE(tracer.events[1].severity == Severity::Error);
        REQUIRE(tracer.events[1].message == "Certificate " + path + " not found");
        REQUIRE(tracer.events[1].fields.count("VerificationError") == 0);
    }

    SECTION("Expired file is rejected when verification is on") {
        auto cert = pki.Issue("agent", -400, -1);
        std::string path = dir.File("expired.pem");
        test::WritePem(path, *cert);

        CertificateResolver resolver(settingsFor(path), pki.Verifier(), emptyStore());
        REQUIRE(resolver.Resolve(tracer, noPassword()) == nullptr);
        REQUIRE(tracer.events.front().message == "Certificate was found, but is invalid.");
    }

    SECTION("Protected PKCS#12 file with password") {
        auto cert = pki.Issue("agent");
        std::string path = dir.File("agent.pfx");
        test::WritePkcs12(path, *cert, "s3cret");

        CertificateResolver resolver(settingsFor(path, "", "true"), pki.Verifier(), emptyStore());
        auto result = resolver.Resolve(tracer, passphrase::ConstantRetriever("s3cret"));

        REQUIRE(result != nullptr);
        REQUIRE(result->HasPrivateKey());
        REQUIRE(tracer.events.size() == 1);
        REQUIRE(tracer.events[0].severity == Severity::Info);
        REQUIRE(tracer.events[0].fields.at("IsCertificatePasswordProtected") == "True");
        REQUIRE(tracer.events[0].fields.at("isPasswordSpecified") == "True");
    }

    SECTION("Protected file with failing provider") {
        auto cert = pki.Issue("agent");
        std::string path = dir.File("agent.pem");
        test::WritePem(path, *cert, "s3cret");

        CertificateResolver resolver(settingsFor(path, "", "true"), pki.Verifier(), emptyStore());
        REQUIRE(resolver.Resolve(tracer, noPassword()) == nullptr);

        REQUIRE(tracer.events.size() == 3);
        REQUIRE(tracer.events[0].severity == Severity::Warning);
        REQUIRE(tracer.events[0].message ==
                "Git config indicates, that certificate is password protected, but retrieved password was null or empty!");
        REQUIRE(tracer.events[1].severity == Severity::Error);
        REQUIRE(tracer.events[1].message == "Error, while loading certificate from disk");
        REQUIRE(tracer.events[1].fields.count("Exception") == 1);
        REQUIRE(tracer.events[1].fields.at("isPasswordSpecified") == "False");
        REQUIRE(tracer.events[2].severity == Severity::Error);
        REQUIRE(tracer.events[2].fields.count("Exception") == 0);
    }

    SECTION("Provider returning an empty password counts as no password") {
        auto cert = pki.Issue("agent");
        std::string path = dir.File("agent.pem");
        test::WritePem(path, *cert);

        CertificateResolver resolver(settingsFor(path, "", "true"), pki.Verifier(), emptyStore());
        auto result = resolver.Resolve(tracer, passphrase::ConstantRetriever(""));

        // 私钥未加密，空密码仍能加载
        REQUIRE(result != nullptr);
        REQUIRE(tracer.events.size() == 2);
        REQUIRE(tracer.events[0].severity == Severity::Warning);
        REQUIRE(tracer.events[1].severity == Severity::Info);
    }

    SECTION("Throwing provider counts as no password") {
        auto cert = pki.Issue("agent");
        std::string path = dir.File("agent.pem");
        test::WritePem(path, *cert);

        passphrase::PassRetriever throwing = [](const std::string&) -> std::tuple<std::string, bool, Error> {
            throw std::runtime_error("provider crashed");
        };

        CertificateResolver resolver(settingsFor(path, "", "true"), pki.Verifier(), emptyStore());
        REQUIRE(resolver.Resolve(tracer, throwing) != nullptr);
        REQUIRE(tracer.events[0].severity == Severity::Warning);
    }

    SECTION("Corrupt file logs an error") {
        std::string path = dir.File("garbage.pfx");
        test::WriteBytes(path, {0x30, 0x03, 0x02, 0x01, 0x05, 0xde, 0xad});

        CertificateResolver resolver(settingsFor(path), pki.Verifier(), emptyStore());
        REQUIRE(resolver.Resolve(tracer, noPassword()) == nullptr);

        REQUIRE(tracer.events.size() == 2);
        REQUIRE(tracer.events[0].message == "Error, while loading certificate from disk");
        REQUIRE(tracer.events[1].message == "Certificate " + path + " not found");
    }

    SECTION("Directory path is not treated as a file") {
        CertificateResolver resolver(settingsFor(dir.Path().string()), pki.Verifier(), emptyStore());
        REQUIRE(resolver.Resolve(tracer, noPassword()) == nullptr);
        REQUIRE(tracer.events.size() == 1);
        REQUIRE(tracer.events[0].severity == Severity::Error);
    }
}

TEST_CASE("CertificateResolver - store based resolution", "[resolver]") {
    TestPKI pki;
    RecordingTracer tracer;
    auto verifier = pki.Verifier();

    SECTION("Single match") {
        auto cert = pki.Issue("agent");
        CertificateResolver resolver(settingsFor("agent"), verifier, memoryStore({cert}, verifier));

        auto result = resolver.Resolve(tracer, noPassword());
        REQUIRE(result == cert);
        REQUIRE(tracer.events.size() == 2);
        REQUIRE(tracer.events[0].severity == Severity::Info);
        REQUIRE(tracer.events[0].message ==
                "Found 1 certificates by provided name. Matching DNs: CN=agent, O=Contoso");
        REQUIRE(tracer.events[1].severity == Severity::Info);
        REQUIRE(tracer.events[1].message ==
                "Found 1 certificates with a private key and an exact CN match. "
                "DNs (sorted by priority, will take first): CN=agent, O=Contoso");
    }

    SECTION("Substring match is not an exact CN match") {
        auto cert = pki.Issue("foobar");
        CertificateResolver resolver(settingsFor("foo"), verifier, memoryStore({cert}, verifier));

        REQUIRE(resolver.Resolve(tracer, noPassword()) == nullptr);
        REQUIRE(tracer.events.size() == 3);
        REQUIRE(tracer.events[0].severity == Severity::Info);
        REQUIRE(tracer.events[1].severity == Severity::Error);
        REQUIRE(tracer.events[1].message.find("Found 0 certificates with a private key") == 0);
        REQUIRE(tracer.events[2].message == "Certificate foo not found");
    }

    SECTION("CN value containing another CN component is not a match") {
        auto cert = pki.SelfSigned("bar, CN=foo");
        REQUIRE(cert->GetSubject() == "CN=bar, CN=foo, O=Self");
        CertificateResolver resolver(settingsFor("foo", "false"), verifier, memoryStore({cert}, verifier));

        REQUIRE(resolver.Resolve(tracer, noPassword()) == nullptr);
        REQUIRE(tracer.events.size() == 3);
        REQUIRE(tracer.events[0].severity == Severity::Info);
        REQUIRE(tracer.events[1].severity == Severity::Error);
        REQUIRE(tracer.events[1].message.find("Found 0 certificates with a private key") == 0);
        REQUIRE(tracer.events[2].message == "Certificate foo not found");
    }

    SECTION("Identifier equal to the whole CN value matches") {
        auto cert = pki.SelfSigned("bar, CN=foo");
        CertificateResolver resolver(settingsFor("bar, CN=foo", "false"), verifier,
                                     memoryStore({cert}, verifier));

        REQUIRE(resolver.Resolve(tracer, noPassword()) == cert);
    }

    SECTION("Certificates without a private key are skipped") {
        auto withoutKey = pki.Issue("agent", -9, 90, false);
        auto withKey = pki.Issue("agent", -2, 30);
        CertificateResolver resolver(settingsFor("agent"), verifier,
                                     memoryStore({withoutKey, withKey}, verifier));

        REQUIRE(resolver.Resolve(tracer, noPassword()) == withKey);
        REQUIRE(tracer.events[0].severity == Severity::Warning);
        REQUIRE(tracer.events[1].severity == Severity::Info);
    }

    SECTION("No matches at all") {
        auto cert = pki.Issue("other");
        CertificateResolver resolver(settingsFor("agent"), verifier, memoryStore({cert}, verifier));

        REQUIRE(resolver.Resolve(tracer, noPassword()) == nullptr);
        REQUIRE(tracer.events.size() == 1);
        REQUIRE(tracer.events[0].message == "Certificate agent not found");
    }

    SECTION("Missing store directory logs an error") {
        TempDir dir;
        std::string missing = (dir.Path() / "does-not-exist").string();
        storage::StoreFactory factory = [missing, verifier]() -> std::unique_ptr<storage::CertificateStore> {
            return std::make_unique<storage::DirectoryCertificateStore>(missing, verifier);
        };
        CertificateResolver resolver(settingsFor("agent"), verifier, factory);

        REQUIRE(resolver.Resolve(tracer, noPassword()) == nullptr);
        REQUIRE(tracer.events.size() == 2);
        REQUIRE(tracer.events[0].severity == Severity::Error);
        REQUIRE(tracer.events[0].message == "Error, while searching for certificate in store");
        REQUIRE(tracer.events[0].fields.count("Exception") == 1);
        REQUIRE(tracer.events[1].message == "Certificate agent not found");
    }

    SECTION("Unresolvable default store location logs an error") {
        TempDir dir;
        auto gone = dir.Path() / "gone";
        std::filesystem::create_directory(gone);
        ScopedEnv store("CERTRESOLVER_STORE_DIR", nullptr);
        ScopedEnv xdg("XDG_DATA_HOME", nullptr);
        ScopedEnv home("HOME", nullptr);
        ScopedCurrentPath cwd(gone);
        std::filesystem::remove(gone);

        CertificateResolver resolver(settingsFor("agent"), verifier);

        std::shared_ptr<utils::Certificate> result;
        REQUIRE_NOTHROW(result = resolver.Resolve(tracer, noPassword()));
        REQUIRE(result == nullptr);
        REQUIRE(tracer.events.size() == 2);
        REQUIRE(tracer.events[0].message == "Error, while searching for certificate in store");
        REQUIRE(tracer.events[0].fields.at("Exception").find("default store location") != std::string::npos);
        REQUIRE(tracer.events[1].message == "Certificate agent not found");
    }

    SECTION("Store is closed when the search throws") {
        int closeCount = 0;
        storage::StoreFactory factory = [&closeCount]() -> std::unique_ptr<storage::CertificateStore> {
            return std::make_unique<FailingSearchStore>(&closeCount);
        };
        CertificateResolver resolver(settingsFor("agent"), verifier, factory);

        REQUIRE(resolver.Resolve(tracer, noPassword()) == nullptr);
        REQUIRE(closeCount == 1);
        REQUIRE(tracer.events[0].message == "Error, while searching for certificate in store");
    }
}

TEST_CASE("CertificateResolver - ranking", "[resolver]") {
    TestPKI pki;
    auto verifier = pki.Verifier();

    // 今天是第 10 天：dayOne 在第 1 天签发，dayFive 在第 5 天签发，expired 已过期
    auto dayOne = pki.Issue("agent", -9, 90);
    auto dayFive = pki.Issue("agent", -5, 80);
    auto expired = pki.Issue("agent", -400, -1);
    CertList certs = {dayFive, expired, dayOne};

    SECTION("Verification on picks the earliest valid certificate") {
        RecordingTracer tracer;
        CertificateResolver resolver(settingsFor("agent"), verifier, memoryStore(certs, verifier));

        REQUIRE(resolver.Resolve(tracer, noPassword()) == dayOne);
        // 存储只返回有效证书
        REQUIRE(tracer.events[0].message.find("Found 2 certificates by provided name") == 0);
        REQUIRE(tracer.events[1].severity == Severity::Warning);
    }

    SECTION("Verification off still prefers valid certificates") {
        RecordingTracer tracer;
        CertificateResolver resolver(settingsFor("agent", "false"), verifier, memoryStore(certs, verifier));

        REQUIRE(resolver.Resolve(tracer, noPassword()) == dayOne);
        REQUIRE(tracer.events[0].message.find("Found 3 certificates by provided name") == 0);
        REQUIRE(tracer.events[1].message.find("Found 3 certificates with a private key") == 0);
    }

    SECTION("Valid certificate beats an older untrusted one") {
        RecordingTracer tracer;
        auto untrusted = pki.SelfSigned("agent", -20, 365);
        auto recent = pki.Issue("agent", -2, 30);
        CertificateResolver resolver(settingsFor("agent", "false"), verifier,
                                     memoryStore({untrusted, recent}, verifier));

        REQUIRE(resolver.Resolve(tracer, noPassword()) == recent);
    }

    SECTION("Same start date prefers the later expiry") {
        RecordingTracer tracer;
        auto longer = pki.Issue("agent", -3, 100);
        auto shorter = pki.Issue("agent", -3, 50);
        CertificateResolver resolver(settingsFor("agent"), verifier,
                                     memoryStore({shorter, longer}, verifier));

        REQUIRE(resolver.Resolve(tracer, noPassword()) == longer);
    }

    SECTION("Repeated resolution is idempotent") {
        RecordingTracer first;
        RecordingTracer second;
        CertificateResolver resolver(settingsFor("agent", "false"), verifier, memoryStore(certs, verifier));

        auto a = resolver.Resolve(first, noPassword());
        auto b = resolver.Resolve(second, noPassword());

        REQUIRE(a == b);
        REQUIRE(first.events == second.events);
    }
}

TEST_CASE("RankCandidates - ordering rules", "[resolver]") {
    TestPKI pki;
    auto verifier = pki.Verifier();

    auto dayOne = pki.Issue("agent", -9, 90);
    auto dayFive = pki.Issue("agent", -5, 80);
    auto untrusted = pki.SelfSigned("agent", -30, 365);

    std::vector<CertificateCandidate> candidates;
    candidates.emplace_back(untrusted, verifier);
    candidates.emplace_back(dayFive, verifier);
    candidates.emplace_back(dayOne, verifier);

    RankCandidates(candidates);

    REQUIRE(candidates[0].GetCertificate() == dayOne);
    REQUIRE(candidates[1].GetCertificate() == dayFive);
    REQUIRE(candidates[2].GetCertificate() == untrusted);
    REQUIRE(candidates[0].IsCurrentlyValid());
    REQUIRE_FALSE(candidates[2].IsCurrentlyValid());
}

TEST_CASE("CertificateResolver - ShouldVerify", "[resolver]") {
    auto verifier = std::make_shared<utils::ChainVerifier>();
    REQUIRE(CertificateResolver(settingsFor("x"), verifier, emptyStore()).ShouldVerify());
    REQUIRE_FALSE(CertificateResolver(settingsFor("x", "off"), verifier, emptyStore()).ShouldVerify());
}

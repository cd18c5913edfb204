#include "certresolver/tls/client_context.hpp"
#include "certresolver/utils/logger.hpp"
#include <openssl/err.h>

namespace certresolver {
namespace tls {

SslCtxPtr NewClientContext() {
    SslCtxPtr ctx(SSL_CTX_new(TLS_client_method()), &SSL_CTX_free);
    if (!ctx) {
        utils::GetLogger().Error("Failed to create SSL context: " + utils::ConsumeOpenSSLErrors());
        return SslCtxPtr(nullptr, &SSL_CTX_free);
    }

    if (SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION) != 1) {
        utils::GetLogger().Error("Failed to set minimum TLS version: " + utils::ConsumeOpenSSLErrors());
        return SslCtxPtr(nullptr, &SSL_CTX_free);
    }

    if (SSL_CTX_set_default_verify_paths(ctx.get()) != 1) {
        utils::GetLogger().Warn("Failed to load default trust roots: " + utils::ConsumeOpenSSLErrors());
    }

    return ctx;
}

Error ConfigureClientContext(SSL_CTX* ctx, const utils::Certificate* cert, bool verifyServer) {
    if (!ctx) {
        return Error("SSL context is null");
    }

    SSL_CTX_set_verify(ctx, verifyServer ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);

    if (!cert) {
        return Error();
    }

    if (!cert->GetX509()) {
        return Error("Certificate is empty");
    }
    if (!cert->GetPrivateKey()) {
        return Error("Certificate has no private key");
    }

    if (SSL_CTX_use_certificate(ctx, cert->GetX509()) != 1) {
        return Error("Failed to use certificate: " + utils::ConsumeOpenSSLErrors());
    }

    if (SSL_CTX_use_PrivateKey(ctx, cert->GetPrivateKey()) != 1) {
        return Error("Failed to use private key: " + utils::ConsumeOpenSSLErrors());
    }

    if (SSL_CTX_check_private_key(ctx) != 1) {
        return Error("Private key does not match certificate: " + utils::ConsumeOpenSSLErrors());
    }

    // add1 增加引用计数，证书仍归 cert 所有
    for (X509* intermediate : cert->GetChain()) {
        if (SSL_CTX_add1_chain_cert(ctx, intermediate) != 1) {
            return Error("Failed to add chain certificate: " + utils::ConsumeOpenSSLErrors());
        }
    }

    utils::GetLogger().Debug("Client certificate installed", utils::LogContext()
        .With("subject", cert->GetSubject())
        .With("thumbprint", cert->GetThumbprint()));
    return Error();
}

} // namespace tls
} // namespace certresolver

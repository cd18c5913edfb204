#pragma once

#include <memory>
#include <openssl/ssl.h>
#include "certresolver/types.hpp"
#include "certresolver/utils/x509.hpp"

namespace certresolver {
namespace tls {

using SslCtxPtr = std::unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)>;

// 创建客户端 SSL_CTX：TLS 1.2 起步，加载默认信任根。失败时返回空指针。
SslCtxPtr NewClientContext();

// 把解析得到的客户端证书（含私钥和中间证书）装入 ctx，并按 verifyServer 设置服务器证书验证。
// cert 为空时只设置验证模式，连接不提供客户端证书。
Error ConfigureClientContext(SSL_CTX* ctx, const utils::Certificate* cert, bool verifyServer);

} // namespace tls
} // namespace certresolver

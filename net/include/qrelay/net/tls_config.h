#pragma once

#include <string>
#include <variant>
#include <vector>

#include <openssl/ssl.h>

#include "qrelay/common/defs.h"

namespace qrelay {

using SslCtxPtr = UniquePtr<SSL_CTX, &SSL_CTX_free>;
using SslPtr = UniquePtr<SSL, &SSL_free>;

/**
 * TLS material for the upstream connections
 */
struct TlsClientConfig {
    /** Server name for SNI and certificate verification. If empty, the upstream host is used. */
    std::string server_name;
    /** Application layer protocols */
    std::vector<std::string> alpn;
    /** Skip certificate verification */
    bool insecure = false;
};

/**
 * TLS material for a listener
 */
struct TlsServerConfig {
    /** Path to a PEM file with the certificate chain, leaf first */
    std::string cert_chain_file;
    /** Path to a PEM file with the private key */
    std::string private_key_file;
    /** Application layer protocols offered to clients, in order of preference */
    std::vector<std::string> alpn;

    /**
     * @return True if the certificate and the key are set
     */
    [[nodiscard]] bool has_material() const {
        return !cert_chain_file.empty() && !private_key_file.empty();
    }
};

using MakeSslCtxResult = std::variant<SslCtxPtr, std::string>;

/**
 * Create a server side SSL context: load the certificate chain and the private key,
 * and install the ALPN selection over `config.alpn`.
 * The context is kept alive by the SSL objects created from it.
 * @return the context, or an error description
 */
MakeSslCtxResult make_server_ssl_ctx(const TlsServerConfig &config);

/**
 * Serialize protocols to the ALPN wire format
 */
Uint8Vector make_alpn(const std::vector<std::string> &protos);

} // namespace qrelay

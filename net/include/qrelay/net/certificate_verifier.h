#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <openssl/ssl.h>

#include "qrelay/common/defs.h"

namespace qrelay {

/**
 * Checks the certificate chain presented by a TLS upstream
 */
class CertificateVerifier {
public:
    CertificateVerifier() = default;
    virtual ~CertificateVerifier() = default;

    CertificateVerifier(const CertificateVerifier &) = delete;
    CertificateVerifier &operator=(const CertificateVerifier &) = delete;

    /**
     * @param ctx the chain as received from the peer
     * @param server_name the name the upstream was dialed with
     * @return the reason of the failure, none if the chain is trusted
     */
    virtual std::optional<std::string> verify(X509_STORE_CTX *ctx, std::string_view server_name) const = 0;
};

/**
 * Trusts the chains issued by the system CA store and matching the server name
 */
class DefaultVerifier : public CertificateVerifier {
public:
    DefaultVerifier();

    std::optional<std::string> verify(X509_STORE_CTX *ctx, std::string_view server_name) const override;

private:
    UniquePtr<X509_STORE, &X509_STORE_free> m_ca_store;
};

/**
 * Check that the certificate was issued for `server_name`, either a host name or an IP address
 * @return the error, none if the name matches
 */
std::optional<std::string> check_server_name(X509 *certificate, std::string_view server_name);

} // namespace qrelay

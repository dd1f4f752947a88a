#include <openssl/x509v3.h>

#include "qrelay/net/certificate_verifier.h"
#include "qrelay/common/utils.h"

namespace qrelay {

std::optional<std::string> check_server_name(X509 *certificate, std::string_view server_name) {
    if (certificate == nullptr) {
        return "Peer sent no certificate";
    }
    std::string name(server_name);
    uint32_t flags = X509_CHECK_FLAG_ALWAYS_CHECK_SUBJECT;
    if (X509_check_host(certificate, name.data(), name.size(), flags, nullptr) == 1
            || X509_check_ip_asc(certificate, name.c_str(), flags) == 1) {
        return std::nullopt;
    }
    return QRELAY_FMT("Certificate is not valid for {}", server_name);
}

DefaultVerifier::DefaultVerifier()
        : m_ca_store(X509_STORE_new()) {
    if (m_ca_store != nullptr && X509_STORE_set_default_paths(m_ca_store.get()) != 1) {
        m_ca_store.reset();
    }
}

std::optional<std::string> DefaultVerifier::verify(X509_STORE_CTX *peer_ctx, std::string_view server_name) const {
    if (m_ca_store == nullptr) {
        return "System CA store is unavailable";
    }

    X509 *leaf = X509_STORE_CTX_get0_cert(peer_ctx);
    if (auto err = check_server_name(leaf, server_name); err.has_value()) {
        return err;
    }

    UniquePtr<X509_STORE_CTX, &X509_STORE_CTX_free> ctx{X509_STORE_CTX_new()};
    if (ctx == nullptr
            || X509_STORE_CTX_init(ctx.get(), m_ca_store.get(), leaf, X509_STORE_CTX_get0_untrusted(peer_ctx)) != 1) {
        return "Failed to set up chain verification";
    }
    if (X509_STORE_CTX_set_purpose(ctx.get(), X509_PURPOSE_SSL_SERVER) != 1) {
        return "Failed to set up chain verification purpose";
    }
    if (X509_verify_cert(ctx.get()) != 1) {
        return QRELAY_FMT("Untrusted chain: {}", X509_verify_cert_error_string(X509_STORE_CTX_get_error(ctx.get())));
    }
    return std::nullopt;
}

} // namespace qrelay

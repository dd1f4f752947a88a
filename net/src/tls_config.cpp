#include <numeric>

#include <openssl/err.h>

#include "qrelay/common/utils.h"
#include "qrelay/net/tls_config.h"

namespace qrelay {

Uint8Vector make_alpn(const std::vector<std::string> &protos) {
    Uint8Vector alpn;
    alpn.reserve(protos.size() + std::accumulate(protos.begin(), protos.end(), size_t(0), [](size_t acc, const std::string &p) {
        return acc + p.length();
    }));

    for (const std::string &p : protos) {
        alpn.push_back((uint8_t) p.length());
        alpn.insert(alpn.end(), p.data(), p.data() + p.length());
    }

    return alpn;
}

static std::string ssl_error_string() {
    char buf[256] = "Unknown error";
    if (unsigned long err = ERR_get_error(); err != 0) {
        ERR_error_string_n(err, buf, sizeof(buf));
    }
    ERR_clear_error();
    return buf;
}

static void free_alpn_list(void *, void *ptr, CRYPTO_EX_DATA *, int, long, void *) {
    delete (std::vector<std::string> *) ptr;
}

static int alpn_ex_data_index() {
    static const int index = SSL_CTX_get_ex_new_index(0, nullptr, nullptr, nullptr, free_alpn_list);
    return index;
}

// Picks the first of our protocols that the client offers
static int select_alpn(SSL *ssl, const uint8_t **out, uint8_t *out_len, const uint8_t *in, unsigned in_len, void *) {
    const auto *ours = (const std::vector<std::string> *) SSL_CTX_get_ex_data(SSL_get_SSL_CTX(ssl), alpn_ex_data_index());
    if (ours == nullptr) {
        return SSL_TLSEXT_ERR_NOACK;
    }
    for (const std::string &proto : *ours) {
        for (unsigned pos = 0; pos < in_len;) {
            uint8_t len = in[pos];
            if (pos + 1 + len > in_len) {
                break;
            }
            if (len == proto.size() && 0 == proto.compare(0, len, (const char *) &in[pos + 1], len)) {
                *out = &in[pos + 1];
                *out_len = len;
                return SSL_TLSEXT_ERR_OK;
            }
            pos += 1 + len;
        }
    }
    return SSL_TLSEXT_ERR_ALERT_FATAL;
}

MakeSslCtxResult make_server_ssl_ctx(const TlsServerConfig &config) {
    if (!config.has_material()) {
        return std::string{"Certificate chain and private key must be set"};
    }

    SslCtxPtr ctx{SSL_CTX_new(TLS_method())};
    if (ctx == nullptr) {
        return QRELAY_FMT("Failed to create SSL context: {}", ssl_error_string());
    }

    if (1 != SSL_CTX_use_certificate_chain_file(ctx.get(), config.cert_chain_file.c_str())) {
        return QRELAY_FMT("Failed to load certificate chain from {}: {}", config.cert_chain_file, ssl_error_string());
    }
    if (1 != SSL_CTX_use_PrivateKey_file(ctx.get(), config.private_key_file.c_str(), SSL_FILETYPE_PEM)) {
        return QRELAY_FMT("Failed to load private key from {}: {}", config.private_key_file, ssl_error_string());
    }
    if (1 != SSL_CTX_check_private_key(ctx.get())) {
        return QRELAY_FMT("Private key does not match the certificate: {}", ssl_error_string());
    }

    if (!config.alpn.empty()) {
        SSL_CTX_set_ex_data(ctx.get(), alpn_ex_data_index(), new std::vector<std::string>(config.alpn));
        SSL_CTX_set_alpn_select_cb(ctx.get(), select_alpn, nullptr);
    }

    return std::move(ctx);
}

} // namespace qrelay

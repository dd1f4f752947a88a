#include "qrelay/common/socket_address.h"
#include "qrelay/common/utils.h"

#include "tls_codec.h"

namespace qrelay {

static constexpr size_t PLAINTEXT_CHUNK = 2 * 1024;

TlsCodec::TlsCodec(const CertificateVerifier *cert_verifier)
        : m_cert_verifier(cert_verifier)
        , m_log(__func__) {
}

std::optional<TlsCodec::Error> TlsCodec::start(const TlsClientConfig &config) {
    SslCtxPtr ctx{SSL_CTX_new(TLS_client_method())};
    if (ctx == nullptr) {
        return Error{"SSL_CTX_new failed"};
    }
    if (SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION) != 1) {
        return Error{"Failed to restrict TLS versions"};
    }
    if (m_cert_verifier != nullptr) {
        SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_cert_verify_callback(ctx.get(), verify_chain, this);
    } else {
        SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);
    }

    m_ssl.reset(SSL_new(ctx.get()));
    if (m_ssl == nullptr) {
        return Error{"SSL_new failed"};
    }

    m_server_name = config.server_name;
    bool ip_literal = SocketAddress(m_server_name, 0).valid();
    if (!m_server_name.empty() && !ip_literal && SSL_set_tlsext_host_name(m_ssl.get(), m_server_name.c_str()) != 1) {
        return Error{QRELAY_FMT("Failed to set SNI: {}", m_server_name)};
    }

    if (!config.alpn.empty()) {
        Uint8Vector protos = make_alpn(config.alpn);
        // Unlike most of the API, 0 means success here
        if (SSL_set_alpn_protos(m_ssl.get(), protos.data(), protos.size()) != 0) {
            return Error{"Failed to set ALPN"};
        }
    }

    BIO *rbio = BIO_new(BIO_s_mem());
    BIO *wbio = BIO_new(BIO_s_mem());
    if (rbio == nullptr || wbio == nullptr) {
        BIO_free(rbio);
        BIO_free(wbio);
        return Error{"Failed to allocate memory BIOs"};
    }
    SSL_set_bio(m_ssl.get(), rbio, wbio);
    SSL_set_connect_state(m_ssl.get());

    return this->continue_handshake();
}

bool TlsCodec::handshake_done() const {
    return m_ssl != nullptr && SSL_is_init_finished(m_ssl.get());
}

std::optional<TlsCodec::Error> TlsCodec::feed(Uint8View ciphertext) {
    if (m_ssl == nullptr) {
        return Error{"Session is not started"};
    }
    if (BIO_write(SSL_get_rbio(m_ssl.get()), ciphertext.data(), (int) ciphertext.size()) != (int) ciphertext.size()) {
        return Error{"Failed to buffer received data"};
    }
    return this->handshake_done() ? std::nullopt : this->continue_handshake();
}

TlsCodec::Output TlsCodec::take_outgoing() {
    if (m_ssl == nullptr) {
        return Error{"Session is not started"};
    }
    BIO *wbio = SSL_get_wbio(m_ssl.get());
    Uint8Vector out(BIO_pending(wbio));
    if (!out.empty() && BIO_read(wbio, out.data(), (int) out.size()) != (int) out.size()) {
        return Error{"Failed to drain outgoing data"};
    }
    return out;
}

TlsCodec::Output TlsCodec::read() {
    if (!this->handshake_done()) {
        return Error{"Handshake is not complete"};
    }

    Uint8Vector out;
    for (;;) {
        size_t offset = out.size();
        out.resize(offset + PLAINTEXT_CHUNK);
        int r = SSL_read(m_ssl.get(), out.data() + offset, PLAINTEXT_CHUNK);
        if (r > 0) {
            out.resize(offset + r);
            continue;
        }
        out.resize(offset);
        switch (int err = SSL_get_error(m_ssl.get(), r)) {
        case SSL_ERROR_WANT_READ:
        case SSL_ERROR_WANT_WRITE:
            return out;
        case SSL_ERROR_ZERO_RETURN:
            if (!out.empty()) {
                // Deliver what was decrypted, the next call reports the closure
                return out;
            }
            return Error{"Peer closed TLS session", true};
        default:
            return Error{QRELAY_FMT("SSL_read failed: {}", err)};
        }
    }
}

std::optional<TlsCodec::Error> TlsCodec::write(Uint8View plaintext) {
    if (!this->handshake_done()) {
        return Error{"Handshake is not complete"};
    }
    while (!plaintext.empty()) {
        int r = SSL_write(m_ssl.get(), plaintext.data(), (int) plaintext.size());
        if (r <= 0) {
            int err = SSL_get_error(m_ssl.get(), r);
            if (err == SSL_ERROR_ZERO_RETURN) {
                return Error{"Peer closed TLS session", true};
            }
            return Error{QRELAY_FMT("SSL_write failed: {}", err)};
        }
        plaintext.remove_prefix(r);
    }
    return std::nullopt;
}

int TlsCodec::verify_chain(X509_STORE_CTX *ctx, void *arg) {
    auto *self = (TlsCodec *) arg;
    if (std::optional<std::string> err = self->m_cert_verifier->verify(ctx, self->m_server_name); err.has_value()) {
        dbglog(self->m_log, "{}: {}", self->m_server_name, err.value());
        X509_STORE_CTX_set_error(ctx, X509_V_ERR_APPLICATION_VERIFICATION);
        return 0;
    }
    tracelog(self->m_log, "{}: certificate verified", self->m_server_name);
    return 1;
}

std::optional<TlsCodec::Error> TlsCodec::continue_handshake() {
    int r = SSL_do_handshake(m_ssl.get());
    if (r == 1) {
        return std::nullopt;
    }
    int err = SSL_get_error(m_ssl.get(), r);
    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        return std::nullopt;
    }
    long verify_result = SSL_get_verify_result(m_ssl.get());
    if (verify_result != X509_V_OK) {
        return Error{QRELAY_FMT("Certificate rejected: {}", X509_verify_cert_error_string(verify_result))};
    }
    return Error{QRELAY_FMT("Handshake failed: {}", err)};
}

} // namespace qrelay

#pragma once

#include <optional>
#include <string>
#include <variant>

#include <openssl/ssl.h>

#include "qrelay/common/defs.h"
#include "qrelay/common/logger.h"
#include "qrelay/net/certificate_verifier.h"
#include "qrelay/net/tls_config.h"

namespace qrelay {

/**
 * TLS client session over memory BIOs. The owner moves the ciphertext between
 * the codec and the transport.
 */
class TlsCodec {
public:
    struct Error {
        std::string description;
        /** Set if the peer sent close_notify */
        bool closed = false;
    };

    using Output = std::variant<Uint8Vector, Error>;

    /**
     * @param cert_verifier null skips the certificate check
     */
    explicit TlsCodec(const CertificateVerifier *cert_verifier);

    TlsCodec(const TlsCodec &) = delete;
    TlsCodec &operator=(const TlsCodec &) = delete;
    TlsCodec(TlsCodec &&) = delete;
    TlsCodec &operator=(TlsCodec &&) = delete;

    /**
     * Create the session and queue the ClientHello.
     * SNI is not sent for IP literals, the name is still checked against the certificate.
     */
    std::optional<Error> start(const TlsClientConfig &config);

    [[nodiscard]] bool handshake_done() const;

    /** Feed ciphertext received from the peer, advancing the handshake if it is in progress */
    std::optional<Error> feed(Uint8View ciphertext);

    /** Drain the ciphertext that must be sent to the peer. Empty if there is none. */
    Output take_outgoing();

    /** Drain the decrypted application data. Empty if there is none yet. */
    Output read();

    /** Encrypt the whole `plaintext`, the result is picked up by `take_outgoing` */
    std::optional<Error> write(Uint8View plaintext);

private:
    const CertificateVerifier *m_cert_verifier;
    std::string m_server_name;
    SslPtr m_ssl;
    Logger m_log;

    static int verify_chain(X509_STORE_CTX *ctx, void *arg);
    std::optional<Error> continue_handshake();
};

} // namespace qrelay

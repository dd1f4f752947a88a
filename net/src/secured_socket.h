#pragma once

#include <mutex>
#include <optional>

#include "qrelay/common/defs.h"
#include "qrelay/common/logger.h"
#include "qrelay/net/certificate_verifier.h"
#include "qrelay/net/socket.h"
#include "qrelay/net/tls_config.h"

#include "tls_codec.h"

namespace qrelay {

/**
 * Socket that runs a TLS session over another socket
 */
class SecuredSocket : public Socket {
public:
    /**
     * @param cert_verifier null disables the certificate check
     */
    SecuredSocket(SocketPtr underlying_socket, const CertificateVerifier *cert_verifier, TlsClientConfig config);
    ~SecuredSocket() override = default;

    SecuredSocket(SecuredSocket &&) = delete;
    SecuredSocket &operator=(SecuredSocket &&) = delete;
    SecuredSocket(const SecuredSocket &) = delete;
    SecuredSocket &operator=(const SecuredSocket &) = delete;

private:
    enum State : int;

    State m_state;
    WithMtx<Callbacks> m_callbacks;
    SocketPtr m_underlying_socket;
    TlsCodec m_codec;
    TlsClientConfig m_config;

    [[nodiscard]] std::optional<evutil_socket_t> get_fd() const override;
    [[nodiscard]] std::optional<Error> connect(ConnectParameters params) override;
    [[nodiscard]] std::optional<Error> send(Uint8View data) override;
    [[nodiscard]] std::optional<Error> send_dns_packet(Uint8View data) override;
    [[nodiscard]] bool set_timeout(Micros timeout) override;
    [[nodiscard]] bool set_write_timeout(std::optional<Micros> timeout) override;
    [[nodiscard]] size_t pending_output() const override;
    [[nodiscard]] std::optional<Error> set_callbacks(Callbacks cbx) override;

    static void on_connected(void *arg);
    static void on_read(void *arg, Uint8View data);
    static void on_close(void *arg, std::optional<Error> error);
    static void on_flushed(void *arg);

    [[nodiscard]] ConnectParameters make_underlying_connect_parameters(ConnectParameters &params) const;
    Callbacks get_callbacks();
    std::optional<Error> follow_read_interest(const Callbacks &cbx);
    void raise_close(std::optional<Error> error);
    std::optional<Error> flush_outgoing();
    void deliver_plaintext();
};

} // namespace qrelay

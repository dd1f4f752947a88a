#pragma once

#include <memory>

#include "qrelay/common/utils.h"
#include "qrelay/net/certificate_verifier.h"
#include "qrelay/net/socket.h"
#include "qrelay/net/tls_config.h"

namespace qrelay {

/**
 * Creates the sockets the upstream dialer connects with.
 * The factory must outlive every socket it made.
 */
class SocketFactory {
public:
    struct Parameters {
        /** Verifier for the TLS upstreams. `DefaultVerifier` if null. */
        std::unique_ptr<CertificateVerifier> verifier;
    };

    explicit SocketFactory(Parameters parameters);
    ~SocketFactory();

    SocketFactory(SocketFactory &&) = delete;
    SocketFactory &operator=(SocketFactory &&) = delete;
    SocketFactory(const SocketFactory &) = delete;
    SocketFactory &operator=(const SocketFactory &) = delete;

    /** Plain UDP or TCP socket */
    [[nodiscard]] SocketPtr make_socket(utils::TransportProtocol protocol) const;

    /**
     * TCP socket running a TLS client session.
     * `config.server_name` must be filled, it is used for SNI and the certificate check.
     */
    [[nodiscard]] SocketPtr make_tls_socket(TlsClientConfig config) const;

private:
    Parameters m_parameters;
};

} // namespace qrelay

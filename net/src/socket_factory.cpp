#include "qrelay/net/socket_factory.h"

#include "secured_socket.h"
#include "tcp_stream.h"
#include "udp_socket.h"

namespace qrelay {

SocketFactory::SocketFactory(Parameters parameters)
        : m_parameters(std::move(parameters)) {
    if (m_parameters.verifier == nullptr) {
        m_parameters.verifier = std::make_unique<DefaultVerifier>();
    }
}

SocketFactory::~SocketFactory() = default;

SocketPtr SocketFactory::make_socket(utils::TransportProtocol protocol) const {
    if (protocol == utils::TP_TCP) {
        return std::make_unique<TcpStream>();
    }
    return std::make_unique<UdpSocket>();
}

SocketPtr SocketFactory::make_tls_socket(TlsClientConfig config) const {
    const CertificateVerifier *verifier = config.insecure ? nullptr : m_parameters.verifier.get();
    return std::make_unique<SecuredSocket>(this->make_socket(utils::TP_TCP), verifier, std::move(config));
}

} // namespace qrelay

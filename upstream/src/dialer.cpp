#include <utility>

#include "qrelay/common/net_utils.h"
#include "qrelay/common/utils.h"
#include "qrelay/net/blocking_socket.h"
#include "qrelay/net/scion_address.h"
#include "qrelay/upstream/dialer.h"
#include "qrelay/upstream/upstream_utils.h"
#include "socket_dns_connection.h"

namespace qrelay {

SocketDialer::SocketDialer(SocketFactory::Parameters parameters)
        : m_log(__func__)
        , m_factory(std::move(parameters)) {
}

DialResult SocketDialer::dial(std::string_view address, UpstreamProtocol protocol, Micros timeout,
                              const TlsClientConfig *tls) {
    auto [scheme, host_port] = upstream_utils::split_scheme(address);
    if (is_scion_address(host_port)) {
        return {nullptr, false, ExchangeError{DnsError::AE_DIAL_ERROR,
                QRELAY_FMT("SCION address is not supported by socket dialer: {}", host_port)}};
    }

    uint16_t default_port = (protocol == UpstreamProtocol::TCP_TLS)
            ? upstream_utils::DEFAULT_TLS_PORT
            : upstream_utils::DEFAULT_PLAIN_PORT;
    SocketAddress peer = utils::str_to_socket_address(host_port, default_port);
    if (!peer.valid()) {
        return {nullptr, false, ExchangeError{DnsError::AE_DIAL_ERROR,
                QRELAY_FMT("Upstream address is not a valid IP address: {}", host_port)}};
    }

    SocketPtr socket;
    switch (protocol) {
    case UpstreamProtocol::UDP:
        socket = m_factory.make_socket(utils::TP_UDP);
        break;
    case UpstreamProtocol::TCP:
        socket = m_factory.make_socket(utils::TP_TCP);
        break;
    case UpstreamProtocol::TCP_TLS: {
        TlsClientConfig config = (tls != nullptr) ? *tls : TlsClientConfig{};
        if (config.server_name.empty()) {
            config.server_name = std::string(utils::split_host_port(host_port).first);
        }
        socket = m_factory.make_tls_socket(std::move(config));
        break;
    }
    }

    auto blocking = std::make_unique<BlockingSocket>(std::move(socket));
    if (!*blocking) {
        return {nullptr, false, ExchangeError{DnsError::AE_DIAL_ERROR, "Can't initialize blocking socket wrapper"}};
    }

    dbglog(m_log, "Dialing {} over {} with timeout {}", peer.str(), upstream_protocol_name(protocol),
            std::chrono::duration_cast<Millis>(timeout));
    if (auto e = blocking->connect(peer, timeout); e.has_value()) {
        dbglog(m_log, "Failed to connect to {}: {} ({})", peer.str(), e->description, e->code);
        return {nullptr, false, ExchangeError{DnsError::AE_DIAL_ERROR,
                QRELAY_FMT("Failed to connect to {}: {}", peer.str(), e->description)}};
    }

    return {std::make_unique<SocketDnsConnection>(std::move(blocking), protocol), false, std::nullopt};
}

} // namespace qrelay

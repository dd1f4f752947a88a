#include <atomic>
#include <cerrno>
#include <utility>

#include "qrelay/common/net_utils.h"
#include "qrelay/common/utils.h"
#include "socket_dns_connection.h"

#define log_conn(c_, lvl_, fmt_, ...) lvl_##log((c_)->m_log, "[id={}] {}(): " fmt_, (c_)->m_id, __func__, ##__VA_ARGS__)

namespace qrelay {

static std::atomic_size_t next_id = {0};

ConnectionError make_connection_error(Socket::Error error) {
    switch (error.code) {
    case Socket::SOCKET_EOF:
    case EPIPE:
    case ECONNRESET:
        return {ConnectionError::CE_EOF, std::move(error.description)};
    case utils::QRELAY_ETIMEDOUT:
        return {ConnectionError::CE_TIMED_OUT, std::move(error.description)};
    default:
        return {ConnectionError::CE_NETWORK, std::move(error.description)};
    }
}

SocketDnsConnection::SocketDnsConnection(std::unique_ptr<BlockingSocket> socket, UpstreamProtocol protocol)
        : m_log(__func__)
        , m_id(next_id.fetch_add(1, std::memory_order_relaxed))
        , m_socket(std::move(socket))
        , m_protocol(protocol) {
    log_conn(this, trace, "{}", upstream_protocol_name(m_protocol));
}

SocketDnsConnection::~SocketDnsConnection() {
    log_conn(this, trace, "Destroyed");
}

UpstreamProtocol SocketDnsConnection::protocol() const {
    return m_protocol;
}

std::optional<ConnectionError> SocketDnsConnection::write_msg(Uint8View wire, Micros timeout) {
    if (m_socket == nullptr) {
        return ConnectionError{ConnectionError::CE_EOF, "Connection is closed"};
    }
    if (timeout.count() <= 0) {
        return ConnectionError{ConnectionError::CE_TIMED_OUT, "Write deadline exceeded"};
    }
    if (auto e = m_socket->send_dns_packet(wire, timeout); e.has_value()) {
        log_conn(this, dbg, "{} ({})", e->description, e->code);
        return make_connection_error(std::move(e.value()));
    }
    return std::nullopt;
}

DnsConnection::ReadResult SocketDnsConnection::read_msg(Micros timeout) {
    if (m_socket == nullptr) {
        return ConnectionError{ConnectionError::CE_EOF, "Connection is closed"};
    }

    auto r = m_socket->receive_dns_packet(timeout);
    if (auto *e = std::get_if<Socket::Error>(&r); e != nullptr) {
        log_conn(this, dbg, "{} ({})", e->description, e->code);
        return make_connection_error(std::move(*e));
    }

    auto &reply = std::get<Uint8Vector>(r);
    if (m_protocol == UpstreamProtocol::UDP && (reply.size() < DNS_HEADER_SIZE || reply.size() > m_udp_size)) {
        log_conn(this, dbg, "Malformed datagram of size {}", reply.size());
        return ConnectionError{ConnectionError::CE_MALFORMED,
                QRELAY_FMT("Datagram size {} is out of bounds [{}, {}]", reply.size(), DNS_HEADER_SIZE, m_udp_size)};
    }
    return std::move(reply);
}

void SocketDnsConnection::set_udp_size(uint16_t size) {
    m_udp_size = size;
}

void SocketDnsConnection::close() {
    log_conn(this, trace, "...");
    m_socket.reset();
}

} // namespace qrelay

#pragma once

#include <memory>
#include <optional>

#include "qrelay/common/logger.h"
#include "qrelay/net/blocking_socket.h"
#include "qrelay/upstream/connection.h"

namespace qrelay {

/**
 * `DnsConnection` over a connected `BlockingSocket`.
 * Every datagram is one message on UDP, stream protocols use the length prefix.
 */
class SocketDnsConnection : public DnsConnection {
public:
    SocketDnsConnection(std::unique_ptr<BlockingSocket> socket, UpstreamProtocol protocol);
    ~SocketDnsConnection() override;

    [[nodiscard]] UpstreamProtocol protocol() const override;
    [[nodiscard]] std::optional<ConnectionError> write_msg(Uint8View wire, Micros timeout) override;
    [[nodiscard]] ReadResult read_msg(Micros timeout) override;
    void set_udp_size(uint16_t size) override;
    void close() override;

private:
    Logger m_log;
    size_t m_id;
    std::unique_ptr<BlockingSocket> m_socket;
    UpstreamProtocol m_protocol;
    uint16_t m_udp_size = DEFAULT_UDP_PAYLOAD_SIZE;
};

/**
 * Classify a socket error
 */
ConnectionError make_connection_error(Socket::Error error);

} // namespace qrelay

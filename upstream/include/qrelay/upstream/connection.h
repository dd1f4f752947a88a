#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "qrelay/common/defs.h"
#include "qrelay/dns/dns_defs.h"

namespace qrelay {

/**
 * Concrete protocol of an upstream connection
 */
enum class UpstreamProtocol {
    UDP,
    TCP,
    TCP_TLS,
};

/**
 * @return "udp", "tcp" or "tcp-tls"
 */
std::string_view upstream_protocol_name(UpstreamProtocol protocol);

/**
 * I/O failure on a pooled connection
 */
struct ConnectionError {
    enum Kind {
        /** The peer closed the connection */
        CE_EOF,
        /** The deadline expired */
        CE_TIMED_OUT,
        /** Any other network-level failure */
        CE_NETWORK,
        /** Data arrived but it is not a DNS message (datagram transports only) */
        CE_MALFORMED,
    };

    Kind kind;
    std::string description;
};

/**
 * Connection to an upstream server.
 * Owned by one relay operation at a time: it is either held by a caller or sits in a transport's idle cache.
 */
class DnsConnection {
public:
    using ReadResult = std::variant<Uint8Vector, ConnectionError>;

    DnsConnection() = default;
    virtual ~DnsConnection() = default;

    DnsConnection(const DnsConnection &) = delete;
    DnsConnection &operator=(const DnsConnection &) = delete;
    DnsConnection(DnsConnection &&) = delete;
    DnsConnection &operator=(DnsConnection &&) = delete;

    [[nodiscard]] virtual UpstreamProtocol protocol() const = 0;

    /**
     * Send one DNS message. Stream connections add the length prefix.
     * @param wire the message in the wire format
     * @param timeout write deadline
     * @return some error if failed
     */
    [[nodiscard]] virtual std::optional<ConnectionError> write_msg(Uint8View wire, Micros timeout) = 0;

    /**
     * Read one DNS message
     * @param timeout read deadline
     * @return the message bytes or an error
     */
    [[nodiscard]] virtual ReadResult read_msg(Micros timeout) = 0;

    /**
     * Set the largest datagram the connection accepts
     */
    virtual void set_udp_size(uint16_t size) = 0;

    /**
     * Close the connection. It must not be used afterwards.
     */
    virtual void close() = 0;
};

using DnsConnectionPtr = std::unique_ptr<DnsConnection>;

struct DialResult {
    /** Connection, null on error */
    DnsConnectionPtr connection;
    /** True if the connection was taken from the idle cache */
    bool cached = false;
    /** Dial error */
    std::optional<ExchangeError> error;
};

} // namespace qrelay

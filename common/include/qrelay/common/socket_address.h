#pragma once

#include <string>
#include <string_view>

#include <event2/util.h>
#include <netinet/in.h>

#include "qrelay/common/defs.h"

namespace qrelay {

/**
 * IPv4 or IPv6 endpoint. A default constructed address is not `valid()`.
 */
class SocketAddress {
public:
    SocketAddress();

    /**
     * @param numeric_host IP address literal, without brackets for IPv6
     */
    SocketAddress(std::string_view numeric_host, uint16_t port);

    /**
     * Copy an address filled by the system, e.g. by `recvfrom`
     */
    explicit SocketAddress(const sockaddr *addr);

    bool operator==(const SocketAddress &other) const;

    [[nodiscard]] const sockaddr *c_sockaddr() const;
    [[nodiscard]] ev_socklen_t c_socklen() const;

    [[nodiscard]] uint16_t port() const;

    /** Address without the port */
    [[nodiscard]] std::string host_str() const;

    /** `host:port`, IPv6 hosts are bracketed */
    [[nodiscard]] std::string str() const;

    [[nodiscard]] bool valid() const;
    [[nodiscard]] bool is_ipv4() const;
    [[nodiscard]] bool is_ipv6() const;

private:
    sockaddr_storage m_ss;
};

} // namespace qrelay

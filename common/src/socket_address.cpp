#include <cstring>

#include <arpa/inet.h>

#include "qrelay/common/socket_address.h"

namespace qrelay {

static ev_socklen_t family_socklen(sa_family_t family) {
    switch (family) {
    case AF_INET:
        return sizeof(sockaddr_in);
    case AF_INET6:
        return sizeof(sockaddr_in6);
    default:
        return 0;
    }
}

SocketAddress::SocketAddress()
        : m_ss{} {
}

SocketAddress::SocketAddress(const sockaddr *addr)
        : m_ss{} {
    if (addr != nullptr) {
        std::memcpy(&m_ss, addr, family_socklen(addr->sa_family));
    }
}

SocketAddress::SocketAddress(std::string_view numeric_host, uint16_t port)
        : m_ss{} {
    char host[INET6_ADDRSTRLEN] = {};
    if (numeric_host.empty() || numeric_host.size() >= sizeof(host)) {
        return;
    }
    std::memcpy(host, numeric_host.data(), numeric_host.size());

    auto *sin = (sockaddr_in *) &m_ss;
    auto *sin6 = (sockaddr_in6 *) &m_ss;
    if (evutil_inet_pton(AF_INET, host, &sin->sin_addr) == 1) {
        sin->sin_family = AF_INET;
        sin->sin_port = htons(port);
    } else if (evutil_inet_pton(AF_INET6, host, &sin6->sin6_addr) == 1) {
        sin6->sin6_family = AF_INET6;
        sin6->sin6_port = htons(port);
    } else {
        m_ss = {};
    }
}

bool SocketAddress::operator==(const SocketAddress &other) const {
    ev_socklen_t len = this->c_socklen();
    return len == other.c_socklen() && std::memcmp(&m_ss, &other.m_ss, len) == 0;
}

const sockaddr *SocketAddress::c_sockaddr() const {
    return (const sockaddr *) &m_ss;
}

ev_socklen_t SocketAddress::c_socklen() const {
    return family_socklen(m_ss.ss_family);
}

uint16_t SocketAddress::port() const {
    if (this->is_ipv4()) {
        return ntohs(((const sockaddr_in *) &m_ss)->sin_port);
    }
    if (this->is_ipv6()) {
        return ntohs(((const sockaddr_in6 *) &m_ss)->sin6_port);
    }
    return 0;
}

std::string SocketAddress::host_str() const {
    char buf[INET6_ADDRSTRLEN] = {};
    const void *src = nullptr;
    if (this->is_ipv4()) {
        src = &((const sockaddr_in *) &m_ss)->sin_addr;
    } else if (this->is_ipv6()) {
        src = &((const sockaddr_in6 *) &m_ss)->sin6_addr;
    }
    if (src == nullptr || evutil_inet_ntop(m_ss.ss_family, src, buf, sizeof(buf)) == nullptr) {
        return {};
    }
    return buf;
}

std::string SocketAddress::str() const {
    if (this->is_ipv6()) {
        return "[" + this->host_str() + "]:" + std::to_string(this->port());
    }
    return this->host_str() + ":" + std::to_string(this->port());
}

bool SocketAddress::valid() const {
    return this->is_ipv4() || this->is_ipv6();
}

bool SocketAddress::is_ipv4() const {
    return m_ss.ss_family == AF_INET;
}

bool SocketAddress::is_ipv6() const {
    return m_ss.ss_family == AF_INET6;
}

} // namespace qrelay

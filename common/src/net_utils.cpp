#include <cstdlib>
#include <string>

#include <sys/socket.h>

#include "qrelay/common/net_utils.h"
#include "qrelay/common/utils.h"

std::pair<std::string_view, std::string_view> qrelay::utils::split_host_port(std::string_view address_string) {
    if (!address_string.empty() && address_string.front() == '[') {
        if (auto pos = address_string.find("]:"); pos != std::string_view::npos) {
            return {address_string.substr(1, pos - 1), address_string.substr(pos + 2)};
        }
        if (address_string.back() == ']') {
            return {address_string.substr(1, address_string.size() - 2), {}};
        }
        return {address_string, {}};
    }
    auto pos = address_string.find(':');
    if (pos != std::string_view::npos && pos == address_string.rfind(':')) {
        return {address_string.substr(0, pos), address_string.substr(pos + 1)};
    }
    // No port, or an IPv6 address without brackets
    return {address_string, {}};
}

timeval qrelay::utils::duration_to_timeval(Micros usecs) {
    static constexpr intmax_t DENOM = Micros::period::den;
    timeval tv{};
    tv.tv_sec = static_cast<decltype(timeval::tv_sec)>(usecs.count() / DENOM);
    tv.tv_usec = static_cast<decltype(timeval::tv_usec)>(usecs.count() % DENOM);
    return tv;
}

qrelay::SocketAddress qrelay::utils::str_to_socket_address(std::string_view address, uint16_t default_port) {
    auto [host, port_str] = split_host_port(address);
    if (port_str.empty()) {
        return SocketAddress{host, default_port};
    }

    auto port = to_integer<uint16_t>(port_str);
    if (!port.has_value()) {
        return {};
    }

    return SocketAddress{host, port.value()};
}

bool qrelay::utils::socket_error_is_eagain(int err) {
    return err == EAGAIN || err == EWOULDBLOCK;
}

std::optional<qrelay::SocketAddress> qrelay::utils::get_local_address(evutil_socket_t fd) {
    sockaddr_storage addr = {};
    socklen_t addrlen = sizeof(addr);
    if (::getsockname(fd, (sockaddr *) &addr, &addrlen) != 0) {
        return std::nullopt;
    }
    return SocketAddress((sockaddr *) &addr);
}

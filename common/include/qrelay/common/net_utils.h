#pragma once

#include <cerrno>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <event2/util.h>

#include "qrelay/common/defs.h"
#include "qrelay/common/socket_address.h"

namespace qrelay::utils {

static constexpr auto QRELAY_ETIMEDOUT = ETIMEDOUT;
static constexpr auto QRELAY_ECONNREFUSED = ECONNREFUSED;

/**
 * Split address string to host and port
 * @param address_string Address string (`host`, `host:port`, `[ipv6]` or `[ipv6]:port`)
 * @return Host and port (port is empty if not specified)
 */
std::pair<std::string_view, std::string_view> split_host_port(std::string_view address_string);

/**
 * Converts duration (microsecond resolution) to timeval structure
 */
timeval duration_to_timeval(Micros usecs);

/**
 * @param address a numeric IP address, with an optional port number
 * @param default_port port to use if the address has none
 * @return a socket address parsed from the address string, invalid if the string is not numeric
 */
SocketAddress str_to_socket_address(std::string_view address, uint16_t default_port = 0);

/**
 * @param err Socket error
 * @return True if socket error is EAGAIN/EWOULDBLOCK
 */
bool socket_error_is_eagain(int err);

/**
 * Get the current address to which the socket is bound
 */
std::optional<SocketAddress> get_local_address(evutil_socket_t fd);

} // namespace qrelay::utils

#pragma once

#include <optional>
#include <string_view>
#include <utility>

#include "qrelay/upstream/connection.h"

namespace qrelay::upstream_utils {

static constexpr uint16_t DEFAULT_PLAIN_PORT = 53;
static constexpr uint16_t DEFAULT_TLS_PORT = 853;

/**
 * Split off the `scheme://` part of an upstream address
 * @return the scheme (empty if none) and the rest of the address
 */
std::pair<std::string_view, std::string_view> split_scheme(std::string_view address);

/**
 * Map an upstream address scheme to a protocol.
 * `udp` and `dns` are UDP, `tcp` is TCP, `tls` is TCP_TLS.
 * @return none for an empty or unknown scheme
 */
std::optional<UpstreamProtocol> protocol_from_scheme(std::string_view scheme);

} // namespace qrelay::upstream_utils

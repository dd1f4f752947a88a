#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "qrelay/common/socket_address.h"

namespace qrelay {

/**
 * SCION host address: `ISD-AS,IP:port` or `ISD-AS,[IPv6]:port`.
 * The AS number is either decimal (BGP-style) or three colon-separated hex groups (`ff00:0:110`).
 */
struct ScionAddress {
    /** Isolation domain */
    uint16_t isd = 0;
    /** Autonomous system number, 48 bits */
    uint64_t as = 0;
    /** Underlay host address */
    SocketAddress host;

    /**
     * @return `ISD-AS` part in the canonical textual form
     */
    [[nodiscard]] std::string ia_str() const;

    [[nodiscard]] std::string str() const;
};

/**
 * Parse a SCION host address
 * @param address string like `1-ff00:0:110,10.0.0.1:53`
 * @return none if the string is not a valid SCION address (the port is mandatory)
 */
std::optional<ScionAddress> parse_scion_address(std::string_view address);

/**
 * @return true if `address` is a valid SCION host address
 */
inline bool is_scion_address(std::string_view address) {
    return parse_scion_address(address).has_value();
}

} // namespace qrelay

#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "qrelay/common/defs.h"
#include "qrelay/net/scion_address.h"

namespace qrelay {

/** Path types of the SCION common header */
enum ScionPathType : uint8_t {
    SPT_EMPTY = 0,
    SPT_SCION = 1,
    SPT_ONE_HOP = 2,
    SPT_EPIC = 3,
    SPT_COLIBRI = 4,
};

struct ScionPath {
    uint8_t type = SPT_EMPTY;
    /** Path header as carried on the wire, empty for `SPT_EMPTY` */
    Uint8Vector raw;
};

/**
 * Addressing of a SCION/UDP datagram. The host parts carry the SCION/UDP ports.
 */
struct ScionUdpHeader {
    ScionAddress src;
    ScionAddress dst;
    ScionPath path;
};

struct ScionUdpPacket {
    ScionUdpHeader header;
    /** Points into the decoded buffer */
    Uint8View payload;
};

using ScionDecodeResult = std::variant<ScionUdpPacket, std::string>;
using ScionEncodeResult = std::variant<Uint8Vector, std::string>;

/**
 * Parse a SCION packet carrying a SCION/UDP datagram and verify the datagram checksum.
 * Only IPv4 and IPv6 host addresses are supported.
 */
ScionDecodeResult decode_scion_udp(Uint8View packet);

/**
 * Build a SCION packet carrying `payload` in a SCION/UDP datagram
 */
ScionEncodeResult encode_scion_udp(const ScionUdpHeader &header, Uint8View payload);

} // namespace qrelay

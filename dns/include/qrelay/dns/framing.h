#pragma once

#include <optional>

#include "qrelay/common/defs.h"
#include "qrelay/dns/dns_defs.h"

namespace qrelay::dns {

/**
 * Prepend the 2-byte big-endian length prefix used on stream transports.
 * The payload size is not checked here, the caller passes a message that already fits the wire.
 */
Uint8Vector frame(Uint8View payload);

struct UnframeResult {
    /** The message without its prefix, points into the input */
    Uint8View payload;
    /** False if the input is not exactly one framed message */
    bool ok = false;
};

/**
 * Strip the length prefix from a complete framed message.
 * Fails if the input is shorter than `MIN_DNS_PACKET_SIZE` or if the declared length
 * differs from the number of bytes following the prefix.
 */
UnframeResult unframe(Uint8View bytes);

/**
 * @return The length declared by the prefix, or nothing if the prefix is incomplete
 */
std::optional<uint16_t> framed_length(Uint8View bytes);

} // namespace qrelay::dns

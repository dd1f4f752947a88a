#include <algorithm>

#include "qrelay/dns/framing.h"

namespace qrelay::dns {

Uint8Vector frame(Uint8View payload) {
    Uint8Vector out(DNS_LENGTH_PREFIX_SIZE + payload.size());
    out[0] = (uint8_t) ((payload.size() >> 8) & 0xff);
    out[1] = (uint8_t) (payload.size() & 0xff);
    std::copy(payload.begin(), payload.end(), out.begin() + DNS_LENGTH_PREFIX_SIZE);
    return out;
}

std::optional<uint16_t> framed_length(Uint8View bytes) {
    if (bytes.size() < DNS_LENGTH_PREFIX_SIZE) {
        return std::nullopt;
    }
    return (uint16_t) ((bytes[0] << 8) | bytes[1]);
}

UnframeResult unframe(Uint8View bytes) {
    if (bytes.size() < MIN_DNS_PACKET_SIZE) {
        return {};
    }
    std::optional<uint16_t> length = framed_length(bytes);
    if (!length.has_value() || *length != bytes.size() - DNS_LENGTH_PREFIX_SIZE) {
        return {};
    }
    return {bytes.substr(DNS_LENGTH_PREFIX_SIZE), true};
}

} // namespace qrelay::dns

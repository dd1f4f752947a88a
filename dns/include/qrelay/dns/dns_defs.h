#pragma once

#include <string>

#include <ldns/ldns.h>

#include "qrelay/common/defs.h"

namespace qrelay {

using ldns_pkt_ptr = UniquePtr<ldns_pkt, &ldns_pkt_free>;
using ldns_buffer_ptr = UniquePtr<ldns_buffer, &ldns_buffer_free>;

/** Size of the DNS message header */
static constexpr size_t DNS_HEADER_SIZE = 12;
/** Smallest stream read that may hold a framed DNS message (header plus minimal record framing) */
static constexpr size_t MIN_DNS_PACKET_SIZE = DNS_HEADER_SIZE + 5;
/** Size of the length prefix on stream transports */
static constexpr size_t DNS_LENGTH_PREFIX_SIZE = 2;
/** Largest DNS message that fits a length prefix */
static constexpr size_t MAX_DNS_MESSAGE_SIZE = UINT16_MAX;
/** UDP payload size a client gets without EDNS */
static constexpr uint16_t DEFAULT_UDP_PAYLOAD_SIZE = 512;
/** edns-tcp-keepalive option code (RFC 7828) */
static constexpr uint16_t EDNS_TCP_KEEPALIVE_OPTION = 11;

/**
 * DNS exchange error codes
 */
enum class DnsError {
    /** Failed to obtain a connection to the upstream */
    AE_DIAL_ERROR,
    /** A connection taken from the idle cache turned out to be closed by the peer */
    AE_CACHED_CONNECTION_CLOSED,
    /** Network I/O failed */
    AE_SOCKET_ERROR,
    /** No matching reply arrived before the read deadline */
    AE_TIMED_OUT,
    /** Failed to serialize a DNS message */
    AE_ENCODE_ERROR,
    /** Failed to parse a DNS message */
    AE_DECODE_ERROR,
    /** Invalid arguments or broken internal state */
    AE_INTERNAL_ERROR,
};

/**
 * @return Human-readable name of the error code
 */
const char *dns_error_to_string(DnsError code);

struct ExchangeError {
    DnsError code;
    std::string description;

    [[nodiscard]] std::string str() const;
};

} // namespace qrelay

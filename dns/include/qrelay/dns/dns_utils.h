#pragma once

#include <string>
#include <variant>

#include "qrelay/common/defs.h"
#include "qrelay/dns/dns_defs.h"

namespace qrelay::dns {

using EncodeResult = std::variant<Uint8Vector, ExchangeError>;
using DecodeResult = std::variant<ldns_pkt_ptr, ExchangeError>;

/**
 * Serialize a message to the wire format
 */
EncodeResult encode_pkt(const ldns_pkt *pkt);

/**
 * Parse a message from the wire format
 */
DecodeResult decode_pkt(Uint8View wire);

/**
 * @return Message ID of a wire-format message, or 0 if the buffer is shorter than the ID field
 */
uint16_t wire_id(Uint8View wire);

/**
 * Check if the OPT record of the message carries the EDNS option `code`
 */
bool has_edns_option(const ldns_pkt *pkt, uint16_t code);

/**
 * @return UDP payload size the sender of the message advertised, 512 without EDNS
 */
uint16_t advertised_udp_size(const ldns_pkt *pkt);

/**
 * @return Mnemonic of the response code (e.g. "NOERROR"), or its decimal value if unknown
 */
std::string rcode_to_string(int rcode);

/**
 * @return Textual name of the first question, or an empty string
 */
std::string question_name(const ldns_pkt *pkt);

/**
 * Create a SERVFAIL response echoing the ID and the question of `request`
 */
ldns_pkt_ptr make_servfail_response(const ldns_pkt *request);

} // namespace qrelay::dns

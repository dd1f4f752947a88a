#include <cstdint>
#include <cstdlib>

#include "qrelay/dns/dns_utils.h"
#include "qrelay/common/utils.h"

namespace qrelay::dns {

// An ldns_buffer grows automatically.
// We set the initial capacity so that most messages will fit without reallocations.
static constexpr size_t BUFFER_INITIAL_CAPACITY = 512;

// Size of the ID field in the message header
static constexpr size_t ID_SIZE = 2;

EncodeResult encode_pkt(const ldns_pkt *pkt) {
    if (pkt == nullptr) {
        return ExchangeError{DnsError::AE_INTERNAL_ERROR, "Null message"};
    }
    ldns_buffer_ptr buffer{ldns_buffer_new(BUFFER_INITIAL_CAPACITY)};
    if (buffer == nullptr) {
        return ExchangeError{DnsError::AE_INTERNAL_ERROR, "Failed to allocate buffer"};
    }
    ldns_status status = ldns_pkt2buffer_wire(buffer.get(), pkt);
    if (status != LDNS_STATUS_OK) {
        return ExchangeError{DnsError::AE_ENCODE_ERROR, ldns_get_errorstr_by_id(status)};
    }
    // Stream transports frame a message with a 16-bit length
    if (ldns_buffer_position(buffer.get()) > UINT16_MAX) {
        return ExchangeError{DnsError::AE_ENCODE_ERROR,
                QRELAY_FMT("Message too large: {} bytes", ldns_buffer_position(buffer.get()))};
    }
    const auto *begin = (const uint8_t *) ldns_buffer_begin(buffer.get());
    return Uint8Vector{begin, begin + ldns_buffer_position(buffer.get())};
}

DecodeResult decode_pkt(Uint8View wire) {
    ldns_pkt *pkt = nullptr;
    ldns_status status = ldns_wire2pkt(&pkt, wire.data(), wire.size());
    if (status != LDNS_STATUS_OK) {
        return ExchangeError{DnsError::AE_DECODE_ERROR, ldns_get_errorstr_by_id(status)};
    }
    return ldns_pkt_ptr{pkt};
}

uint16_t wire_id(Uint8View wire) {
    if (wire.size() < ID_SIZE) {
        return 0;
    }
    return (uint16_t) ((wire[0] << 8) | wire[1]);
}

bool has_edns_option(const ldns_pkt *pkt, uint16_t code) {
    // ldns keeps the OPT RDATA as is: a sequence of {code, length, data} entries
    const ldns_rdf *data = ldns_pkt_edns_data(pkt);
    if (data == nullptr) {
        return false;
    }
    Uint8View options{ldns_rdf_data(data), ldns_rdf_size(data)};
    while (options.size() >= 4) {
        uint16_t option_code = (options[0] << 8) | options[1];
        uint16_t option_len = (options[2] << 8) | options[3];
        if (option_code == code) {
            return true;
        }
        if (options.size() < 4u + option_len) {
            break;
        }
        options.remove_prefix(4u + option_len);
    }
    return false;
}

uint16_t advertised_udp_size(const ldns_pkt *pkt) {
    uint16_t size = ldns_pkt_edns_udp_size(pkt);
    return size != 0 ? size : DEFAULT_UDP_PAYLOAD_SIZE;
}

std::string rcode_to_string(int rcode) {
    if (const ldns_lookup_table *entry = ldns_lookup_by_id(ldns_rcodes, rcode); entry != nullptr) {
        return entry->name;
    }
    return std::to_string(rcode);
}

std::string question_name(const ldns_pkt *pkt) {
    const ldns_rr *question = ldns_rr_list_rr(ldns_pkt_question(pkt), 0);
    if (question == nullptr) {
        return {};
    }
    UniquePtr<char, &free> name{ldns_rdf2str(ldns_rr_owner(question))};
    return name != nullptr ? std::string{name.get()} : std::string{};
}

ldns_pkt_ptr make_servfail_response(const ldns_pkt *request) {
    ldns_pkt_ptr response{ldns_pkt_new()};
    if (response == nullptr) {
        return nullptr;
    }
    ldns_pkt_set_id(response.get(), ldns_pkt_id(request));
    ldns_pkt_set_qr(response.get(), true);
    ldns_pkt_set_rd(response.get(), ldns_pkt_rd(request));
    ldns_pkt_set_ra(response.get(), true);
    ldns_pkt_set_opcode(response.get(), ldns_pkt_get_opcode(request));
    ldns_pkt_set_rcode(response.get(), LDNS_RCODE_SERVFAIL);
    ldns_rr_list_deep_free(ldns_pkt_question(response.get()));
    ldns_pkt_set_question(response.get(), ldns_pkt_get_section_clone(request, LDNS_SECTION_QUESTION));
    ldns_pkt_set_qdcount(response.get(), ldns_pkt_section_count(request, LDNS_SECTION_QUESTION));
    return response;
}

} // namespace qrelay::dns

#include <string>

#include <gtest/gtest.h>

#include "qrelay/dns/dns_utils.h"

namespace qrelay::test {

static ldns_pkt_ptr make_query(const char *name, uint16_t id) {
    ldns_pkt_ptr pkt{ldns_pkt_query_new(
            ldns_dname_new_frm_str(name), LDNS_RR_TYPE_A, LDNS_RR_CLASS_IN, LDNS_RD)};
    ldns_pkt_set_id(pkt.get(), id);
    return pkt;
}

static void set_edns_options(ldns_pkt *pkt, const Uint8Vector &options) {
    ldns_pkt_set_edns_udp_size(pkt, 4096);
    ldns_pkt_set_edns_data(pkt, ldns_rdf_new_frm_data(LDNS_RDF_TYPE_UNKNOWN, options.size(), options.data()));
}

static ldns_pkt_ptr reparse(const ldns_pkt *pkt) {
    auto encoded = dns::encode_pkt(pkt);
    if (!std::holds_alternative<Uint8Vector>(encoded)) {
        return nullptr;
    }
    auto &wire = std::get<Uint8Vector>(encoded);
    auto decoded = dns::decode_pkt({wire.data(), wire.size()});
    if (!std::holds_alternative<ldns_pkt_ptr>(decoded)) {
        return nullptr;
    }
    return std::move(std::get<ldns_pkt_ptr>(decoded));
}

TEST(DnsUtils, EncodeRejectsOversizedMessage) {
    ldns_pkt_ptr query = make_query("example.org.", 1);
    std::string record = "pad.example. 60 IN TXT \"" + std::string(250, 'a') + "\"";
    for (int i = 0; i < 300; ++i) {
        ldns_rr *rr = nullptr;
        ASSERT_EQ(LDNS_STATUS_OK, ldns_rr_new_frm_str(&rr, record.c_str(), 0, nullptr, nullptr));
        ldns_pkt_push_rr(query.get(), LDNS_SECTION_ADDITIONAL, rr);
    }
    auto encoded = dns::encode_pkt(query.get());
    ASSERT_TRUE(std::holds_alternative<ExchangeError>(encoded));
    ASSERT_EQ(DnsError::AE_ENCODE_ERROR, std::get<ExchangeError>(encoded).code);
}

TEST(DnsUtils, EncodeDecode) {
    ldns_pkt_ptr query = make_query("example.org.", 0xbeef);
    auto encoded = dns::encode_pkt(query.get());
    ASSERT_TRUE(std::holds_alternative<Uint8Vector>(encoded));
    auto &wire = std::get<Uint8Vector>(encoded);
    ASSERT_EQ(0xbeef, dns::wire_id({wire.data(), wire.size()}));

    ldns_pkt_set_id(query.get(), 0x0102);
    auto reencoded = dns::encode_pkt(query.get());
    ASSERT_TRUE(std::holds_alternative<Uint8Vector>(reencoded));
    auto &rewire = std::get<Uint8Vector>(reencoded);
    auto decoded = dns::decode_pkt({rewire.data(), rewire.size()});
    ASSERT_TRUE(std::holds_alternative<ldns_pkt_ptr>(decoded));
    const ldns_pkt *pkt = std::get<ldns_pkt_ptr>(decoded).get();
    ASSERT_EQ(0x0102, ldns_pkt_id(pkt));
    ASSERT_EQ("example.org.", dns::question_name(pkt));
}

TEST(DnsUtils, DecodeGarbage) {
    Uint8Vector garbage(20, 0xff);
    auto decoded = dns::decode_pkt({garbage.data(), garbage.size()});
    ASSERT_TRUE(std::holds_alternative<ExchangeError>(decoded));
    ASSERT_EQ(DnsError::AE_DECODE_ERROR, std::get<ExchangeError>(decoded).code);
}

TEST(DnsUtils, DetectsKeepaliveOption) {
    ldns_pkt_ptr query = make_query("example.org.", 1);
    ASSERT_FALSE(dns::has_edns_option(query.get(), EDNS_TCP_KEEPALIVE_OPTION));

    // Padding (12) with 2 bytes, then edns-tcp-keepalive (11) with no data
    set_edns_options(query.get(), {0, 12, 0, 2, 0, 0, 0, 11, 0, 0});
    ldns_pkt_ptr parsed = reparse(query.get());
    ASSERT_NE(nullptr, parsed);
    ASSERT_TRUE(dns::has_edns_option(parsed.get(), EDNS_TCP_KEEPALIVE_OPTION));
    ASSERT_TRUE(dns::has_edns_option(parsed.get(), 12));
    ASSERT_FALSE(dns::has_edns_option(parsed.get(), 10));
}

TEST(DnsUtils, IgnoresOtherOptions) {
    ldns_pkt_ptr query = make_query("example.org.", 1);
    // Cookie (10) with 8 bytes whose contents look like a keepalive option
    set_edns_options(query.get(), {0, 10, 0, 8, 0, 11, 0, 0, 0, 11, 0, 0});
    ldns_pkt_ptr parsed = reparse(query.get());
    ASSERT_NE(nullptr, parsed);
    ASSERT_FALSE(dns::has_edns_option(parsed.get(), EDNS_TCP_KEEPALIVE_OPTION));
    ASSERT_TRUE(dns::has_edns_option(parsed.get(), 10));
}

TEST(DnsUtils, AdvertisedUdpSize) {
    ldns_pkt_ptr query = make_query("example.org.", 1);
    ASSERT_EQ(512, dns::advertised_udp_size(query.get()));
    ldns_pkt_set_edns_udp_size(query.get(), 1232);
    ASSERT_EQ(1232, dns::advertised_udp_size(query.get()));
}

TEST(DnsUtils, RcodeToString) {
    ASSERT_EQ("NOERROR", dns::rcode_to_string(LDNS_RCODE_NOERROR));
    ASSERT_EQ("SERVFAIL", dns::rcode_to_string(LDNS_RCODE_SERVFAIL));
    ASSERT_EQ("NXDOMAIN", dns::rcode_to_string(LDNS_RCODE_NXDOMAIN));
    ASSERT_EQ("3841", dns::rcode_to_string(3841));
}

TEST(DnsUtils, ServfailEchoesQuestion) {
    ldns_pkt_ptr query = make_query("example.org.", 0x4242);
    ldns_pkt_ptr response = dns::make_servfail_response(query.get());
    ASSERT_NE(nullptr, response);
    ASSERT_EQ(0x4242, ldns_pkt_id(response.get()));
    ASSERT_TRUE(ldns_pkt_qr(response.get()));
    ASSERT_EQ(LDNS_RCODE_SERVFAIL, ldns_pkt_get_rcode(response.get()));
    ASSERT_EQ("example.org.", dns::question_name(response.get()));
}

TEST(DnsUtils, ErrorStrings) {
    ExchangeError err{DnsError::AE_TIMED_OUT, "no reply"};
    ASSERT_EQ("Timed out: no reply", err.str());
    ASSERT_STREQ("Cached connection closed", dns_error_to_string(DnsError::AE_CACHED_CONNECTION_CLOSED));
}

} // namespace qrelay::test

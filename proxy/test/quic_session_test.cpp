#include <atomic>
#include <cstdlib>
#include <future>
#include <memory>
#include <string>
#include <variant>

#include <gtest/gtest.h>

#include "qrelay/dns/dns_utils.h"
#include "qrelay/dns/framing.h"
#include "qrelay/proxy/quic_listener.h"

#include "doq_test_client.h"
#include "test_certificate.h"
#include "test_utils.h"

namespace qrelay::test {

/** Application error codes from RFC 9250 */
static constexpr uint64_t DOQ_INTERNAL_ERROR = 0x1;
static constexpr uint64_t DOQ_PROTOCOL_ERROR = 0x2;

static Uint8Vector framed_query(const char *name, uint16_t id, bool keepalive = false) {
    ldns_pkt_ptr query = make_query(name, id);
    if (keepalive) {
        set_edns_options(query.get(), 1232, {0x00, 0x0b, 0x00, 0x00});
    }
    Uint8Vector wire = encode(query.get());
    return dns::frame({wire.data(), wire.size()});
}

static ldns_pkt_ptr decode_answer(const Uint8Vector &framed) {
    dns::UnframeResult unframed = dns::unframe({framed.data(), framed.size()});
    if (!unframed.ok) {
        return nullptr;
    }
    dns::DecodeResult decoded = dns::decode_pkt(unframed.payload);
    if (!std::holds_alternative<ldns_pkt_ptr>(decoded)) {
        return nullptr;
    }
    return std::move(std::get<ldns_pkt_ptr>(decoded));
}

static std::string qname(const ldns_pkt *pkt) {
    const ldns_rr *question = ldns_rr_list_rr(ldns_pkt_question(pkt), 0);
    UniquePtr<char, &free> str{ldns_rdf2str(ldns_rr_owner(question))};
    return str.get();
}

/**
 * Handler that answers most names, and misbehaves on some:
 * `slow.` waits until released, `silent.` writes nothing, `boom.` throws something that is not std::exception
 */
class ScenarioHandler : public DnsHandler {
public:
    void serve_dns(const DnsContext &ctx, ResponseWriter &writer, const ldns_pkt *request) override {
        ++calls;
        std::string name = qname(request);
        if (name == "slow.example.") {
            ++slow_started;
            m_release.wait();
            ++slow_finished;
        } else if (name == "silent.example.") {
            return;
        } else if (name == "boom.example.") {
            throw 42;
        }
        m_echo->serve_dns(ctx, writer, request);
    }

    void release() {
        m_release_promise.set_value();
    }

    std::atomic_int calls{0};
    std::atomic_int slow_started{0};
    std::atomic_int slow_finished{0};

private:
    std::shared_ptr<LambdaHandler> m_echo = make_echo_handler();
    std::promise<void> m_release_promise;
    std::shared_future<void> m_release = m_release_promise.get_future().share();
};

class QuicSessionTest : public ::testing::Test {
protected:
    TestCertificate certificate;
    UdpPacketConnProvider provider;
    std::shared_ptr<ScenarioHandler> handler = std::make_shared<ScenarioHandler>();
    std::unique_ptr<QuicListener> listener;
    bool released = false;

    void TearDown() override {
        release_slow();
        if (listener != nullptr) {
            listener->stop();
        }
    }

    void release_slow() {
        if (!released) {
            released = true;
            handler->release();
        }
    }

    QuicListenerSettings make_settings() {
        QuicListenerSettings settings = QuicListenerSettings::get_default();
        settings.address = "127.0.0.1:0";
        settings.server_name = "dns.example";
        settings.tls.cert_chain_file = certificate.cert_file;
        settings.tls.private_key_file = certificate.key_file;
        return settings;
    }

    void start(PacketConnProvider &conn_provider, QuicListenerSettings settings) {
        listener = std::make_unique<QuicListener>(std::move(settings), handler);
        ErrString error = listener->listen(conn_provider);
        ASSERT_FALSE(error.has_value()) << error.value();
    }

    void start() {
        start(provider, make_settings());
    }
};

TEST_F(QuicSessionTest, AnswerIsFollowedByFin) {
    ASSERT_NO_FATAL_FAILURE(start());
    DoqTestClient client(listener->local_address());
    ASSERT_TRUE(client.connect()) << client.error().value_or("");

    Uint8Vector query = framed_query("example.org.", 0);
    std::optional<int64_t> id = client.send({query.data(), query.size()});
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(client.wait_stream(*id));

    const DoqTestClient::Stream &stream = client.stream(*id);
    ASSERT_TRUE(stream.fin);
    ASSERT_FALSE(stream.reset_code.has_value());
    ldns_pkt_ptr answer = decode_answer(stream.data);
    ASSERT_NE(nullptr, answer);
    ASSERT_EQ(0, ldns_pkt_id(answer.get()));
    ASSERT_TRUE(ldns_pkt_qr(answer.get()));
    ASSERT_EQ("example.org.", qname(answer.get()));

    // Several streams on the same session
    Uint8Vector second = framed_query("example.net.", 0);
    std::optional<int64_t> second_id = client.send({second.data(), second.size()});
    ASSERT_TRUE(second_id.has_value());
    ASSERT_TRUE(client.wait_stream(*second_id));
    answer = decode_answer(client.stream(*second_id).data);
    ASSERT_NE(nullptr, answer);
    ASSERT_EQ("example.net.", qname(answer.get()));

    ASSERT_EQ(1u, listener->sessions());
    ASSERT_EQ(2u, listener->exchanges());
}

TEST_F(QuicSessionTest, NoResponseGivesEmptyFin) {
    ASSERT_NO_FATAL_FAILURE(start());
    DoqTestClient client(listener->local_address());
    ASSERT_TRUE(client.connect()) << client.error().value_or("");

    Uint8Vector query = framed_query("silent.example.", 0);
    std::optional<int64_t> id = client.send({query.data(), query.size()});
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(client.wait_stream(*id));
    ASSERT_TRUE(client.stream(*id).fin);
    ASSERT_TRUE(client.stream(*id).data.empty());
    ASSERT_FALSE(client.stream(*id).reset_code.has_value());
    ASSERT_EQ(1, handler->calls.load());
    ASSERT_FALSE(client.closed());
}

TEST_F(QuicSessionTest, ShortReadGivesEmptyFin) {
    ASSERT_NO_FATAL_FAILURE(start());
    DoqTestClient client(listener->local_address());
    ASSERT_TRUE(client.connect()) << client.error().value_or("");

    Uint8Vector junk{0x00, 0x01, 0x00};
    std::optional<int64_t> id = client.send({junk.data(), junk.size()});
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(client.wait_stream(*id));
    ASSERT_TRUE(client.stream(*id).fin);
    ASSERT_TRUE(client.stream(*id).data.empty());
    ASSERT_EQ(0, handler->calls.load());
    ASSERT_EQ(1u, listener->dropped_short_reads());

    // The session is still usable
    Uint8Vector query = framed_query("example.org.", 0);
    id = client.send({query.data(), query.size()});
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(client.wait_stream(*id));
    ASSERT_NE(nullptr, decode_answer(client.stream(*id).data));
}

TEST_F(QuicSessionTest, KeepaliveQueryClosesSession) {
    ASSERT_NO_FATAL_FAILURE(start());
    DoqTestClient client(listener->local_address());
    ASSERT_TRUE(client.connect()) << client.error().value_or("");

    Uint8Vector slow = framed_query("slow.example.", 0);
    std::optional<int64_t> slow_id = client.send({slow.data(), slow.size()});
    ASSERT_TRUE(slow_id.has_value());
    ASSERT_TRUE(client.run_until(
            [this] {
                return handler->slow_started.load() == 1;
            },
            Millis{3000}));

    Uint8Vector keepalive = framed_query("example.org.", 0, true);
    std::optional<int64_t> keepalive_id = client.send({keepalive.data(), keepalive.size()});
    ASSERT_TRUE(keepalive_id.has_value());
    ASSERT_TRUE(client.run_until(
            [&client] {
                return client.closed();
            },
            Millis{3000}));

    ASSERT_EQ(NGTCP2_CCERR_TYPE_APPLICATION, client.close_error().type);
    ASSERT_EQ(DOQ_PROTOCOL_ERROR, client.close_error().error_code);
    ASSERT_EQ(1u, listener->sessions_aborted());
    ASSERT_FALSE(client.stream(*keepalive_id).fin);
    ASSERT_TRUE(client.stream(*keepalive_id).data.empty());
    Uint8Vector later = framed_query("example.net.", 0);
    ASSERT_FALSE(client.send({later.data(), later.size()}).has_value());

    // The query that was already in flight finishes after the session is gone
    release_slow();
    ASSERT_TRUE(client.run_until(
            [this] {
                return handler->slow_finished.load() == 1;
            },
            Millis{3000}));
    client.run_until(
            [] {
                return false;
            },
            Millis{200});
    ASSERT_FALSE(client.stream(*slow_id).fin);
    ASSERT_TRUE(client.stream(*slow_id).data.empty());
    // The keepalive query never reaches the handler
    ASSERT_EQ(1, handler->calls.load());
}

TEST_F(QuicSessionTest, ThrowingHandlerResetsStream) {
    ASSERT_NO_FATAL_FAILURE(start());
    DoqTestClient client(listener->local_address());
    ASSERT_TRUE(client.connect()) << client.error().value_or("");

    Uint8Vector query = framed_query("boom.example.", 0);
    std::optional<int64_t> id = client.send({query.data(), query.size()});
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(client.wait_stream(*id));
    ASSERT_EQ(DOQ_INTERNAL_ERROR, client.stream(*id).reset_code.value_or(0));
    ASSERT_FALSE(client.stream(*id).fin);
    ASSERT_EQ(1u, listener->dropped_exchanges());

    query = framed_query("example.org.", 0);
    id = client.send({query.data(), query.size()});
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(client.wait_stream(*id));
    ASSERT_NE(nullptr, decode_answer(client.stream(*id).data));
}

TEST_F(QuicSessionTest, StreamsAboveInFlightLimitAreReset) {
    QuicListenerSettings settings = make_settings();
    settings.max_exchanges_in_flight = 1;
    ASSERT_NO_FATAL_FAILURE(start(provider, settings));
    DoqTestClient client(listener->local_address());
    ASSERT_TRUE(client.connect()) << client.error().value_or("");

    Uint8Vector slow = framed_query("slow.example.", 0);
    std::optional<int64_t> slow_id = client.send({slow.data(), slow.size()});
    ASSERT_TRUE(slow_id.has_value());
    ASSERT_TRUE(client.run_until(
            [this] {
                return handler->slow_started.load() == 1;
            },
            Millis{3000}));

    Uint8Vector query = framed_query("example.org.", 0);
    std::optional<int64_t> rejected_id = client.send({query.data(), query.size()});
    ASSERT_TRUE(rejected_id.has_value());
    ASSERT_TRUE(client.wait_stream(*rejected_id));
    ASSERT_EQ(DOQ_INTERNAL_ERROR, client.stream(*rejected_id).reset_code.value_or(0));
    ASSERT_EQ(1u, listener->dropped_exchanges());
    ASSERT_EQ(1, handler->calls.load());

    release_slow();
    ASSERT_TRUE(client.wait_stream(*slow_id));
    ldns_pkt_ptr answer = decode_answer(client.stream(*slow_id).data);
    ASSERT_NE(nullptr, answer);
    ASSERT_EQ("slow.example.", qname(answer.get()));

    // The slot is free again
    std::optional<int64_t> id = client.send({query.data(), query.size()});
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(client.wait_stream(*id));
    ASSERT_NE(nullptr, decode_answer(client.stream(*id).data));
}

/**
 * Packet connection that scrambles every datagram with a one-byte XOR key on top of plain UDP
 */
class XorPacketConn : public PacketConn {
public:
    XorPacketConn(PacketConnPtr underlay, uint8_t key)
            : m_underlay(std::move(underlay))
            , m_key(key) {
    }

    [[nodiscard]] evutil_socket_t fd() const override {
        return m_underlay->fd();
    }

    [[nodiscard]] const SocketAddress &local_address() const override {
        return m_underlay->local_address();
    }

    ReadResult read_from(uint8_t *buf, size_t size) override {
        ReadResult r = m_underlay->read_from(buf, size);
        for (size_t i = 0; r.status == PCR_DATAGRAM && i < r.length; ++i) {
            buf[i] ^= m_key;
        }
        return r;
    }

    ErrString write_to(Uint8View data, const SocketAddress &to) override {
        Uint8Vector scrambled(data.begin(), data.end());
        for (uint8_t &b : scrambled) {
            b ^= m_key;
        }
        return m_underlay->write_to({scrambled.data(), scrambled.size()}, to);
    }

private:
    PacketConnPtr m_underlay;
    uint8_t m_key;
};

class XorPacketConnProvider : public PacketConnProvider {
public:
    static constexpr uint8_t KEY = 0x5a;

    PacketConnResult listen(std::string_view address) override {
        PacketConnResult r = m_udp.listen(address);
        if (r.conn != nullptr) {
            r.conn = std::make_unique<XorPacketConn>(std::move(r.conn), KEY);
        }
        return r;
    }

    [[nodiscard]] std::string_view scheme() const override {
        return "xquic";
    }

private:
    UdpPacketConnProvider m_udp;
};

static bool xor_datagram(Uint8Vector &datagram) {
    for (uint8_t &b : datagram) {
        b ^= XorPacketConnProvider::KEY;
    }
    return true;
}

TEST_F(QuicSessionTest, ListenerReadsThroughPacketConn) {
    XorPacketConnProvider xor_provider;
    ASSERT_NO_FATAL_FAILURE(start(xor_provider, make_settings()));

    // Without the transformation the server sees only garbage
    {
        DoqTestClient plain(listener->local_address());
        ASSERT_FALSE(plain.connect(Millis{500}));
        ASSERT_EQ(0u, listener->sessions());
    }

    DoqTestClient client(listener->local_address(), xor_datagram, xor_datagram);
    ASSERT_TRUE(client.connect()) << client.error().value_or("");
    Uint8Vector query = framed_query("example.org.", 0);
    std::optional<int64_t> id = client.send({query.data(), query.size()});
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(client.wait_stream(*id));
    ASSERT_NE(nullptr, decode_answer(client.stream(*id).data));
    ASSERT_EQ(1u, listener->sessions());
}

TEST_F(QuicSessionTest, ScionSession) {
    ScionPacketConnProvider scion_provider;
    QuicListenerSettings settings = make_settings();
    settings.address = "1-ff00:0:110,127.0.0.1:0";
    ASSERT_NO_FATAL_FAILURE(start(scion_provider, settings));

    ScionAddress server = parse_scion_address(
            QRELAY_FMT("1-ff00:0:110,{}", listener->local_address().str())).value();
    ScionAddress self;
    std::atomic_int unwrapped{0};
    auto wrap = [&](Uint8Vector &datagram) {
        ScionEncodeResult encoded = encode_scion_udp({self, server, {}}, {datagram.data(), datagram.size()});
        if (!std::holds_alternative<Uint8Vector>(encoded)) {
            ADD_FAILURE() << std::get<std::string>(encoded);
            return false;
        }
        datagram = std::move(std::get<Uint8Vector>(encoded));
        return true;
    };
    auto unwrap = [&](Uint8Vector &datagram) {
        ScionDecodeResult decoded = decode_scion_udp({datagram.data(), datagram.size()});
        if (!std::holds_alternative<ScionUdpPacket>(decoded)) {
            ADD_FAILURE() << std::get<std::string>(decoded);
            return false;
        }
        const ScionUdpPacket &packet = std::get<ScionUdpPacket>(decoded);
        EXPECT_EQ("1-ff00:0:110", packet.header.src.ia_str());
        EXPECT_EQ(self.host, packet.header.dst.host);
        ++unwrapped;
        datagram = Uint8Vector(packet.payload.begin(), packet.payload.end());
        return true;
    };

    DoqTestClient client(listener->local_address(), wrap, unwrap);
    self = parse_scion_address(QRELAY_FMT("1-ff00:0:111,{}", client.local_address().str())).value();
    ASSERT_TRUE(client.connect()) << client.error().value_or("");

    Uint8Vector query = framed_query("example.org.", 0);
    std::optional<int64_t> id = client.send({query.data(), query.size()});
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(client.wait_stream(*id));
    ldns_pkt_ptr answer = decode_answer(client.stream(*id).data);
    ASSERT_NE(nullptr, answer);
    ASSERT_EQ("example.org.", qname(answer.get()));
    ASSERT_GT(unwrapped.load(), 0);
    ASSERT_EQ(1u, listener->sessions());
}

} // namespace qrelay::test

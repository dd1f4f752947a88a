#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "qrelay/upstream/transport.h"

namespace qrelay::test {

class FakeConnection : public DnsConnection {
public:
    FakeConnection(UpstreamProtocol protocol, std::atomic_int &closed)
            : m_protocol(protocol)
            , m_closed(closed) {
    }

    UpstreamProtocol protocol() const override {
        return m_protocol;
    }
    std::optional<ConnectionError> write_msg(Uint8View, Micros) override {
        return std::nullopt;
    }
    ReadResult read_msg(Micros) override {
        return ConnectionError{ConnectionError::CE_TIMED_OUT, "no data"};
    }
    void set_udp_size(uint16_t) override {
    }
    void close() override {
        ++m_closed;
    }

private:
    UpstreamProtocol m_protocol;
    std::atomic_int &m_closed;
};

class FakeDialer : public Dialer {
public:
    DialResult dial(std::string_view address, UpstreamProtocol protocol, Micros timeout,
                    const TlsClientConfig *tls) override {
        std::scoped_lock l(m_mtx);
        last_address = address;
        last_protocol = protocol;
        last_timeout = timeout;
        last_tls = tls != nullptr;
        ++dials;
        if (fail) {
            return {nullptr, false, ExchangeError{DnsError::AE_DIAL_ERROR, "connection refused"}};
        }
        return {std::make_unique<FakeConnection>(protocol, closed), false, std::nullopt};
    }

    std::mutex m_mtx;
    std::string last_address;
    UpstreamProtocol last_protocol = UpstreamProtocol::UDP;
    Micros last_timeout{0};
    bool last_tls = false;
    bool fail = false;
    int dials = 0;
    std::atomic_int closed{0};
};

class TransportTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeDialer> dialer = std::make_shared<FakeDialer>();
};

TEST_F(TransportTest, MissThenHit) {
    Transport transport("tcp://127.0.0.1:53", dialer);

    DialResult first = transport.dial(UpstreamProtocol::TCP);
    ASSERT_FALSE(first.error.has_value());
    ASSERT_FALSE(first.cached);
    ASSERT_EQ("tcp://127.0.0.1:53", dialer->last_address);
    DnsConnection *raw = first.connection.get();
    transport.yield(std::move(first.connection));
    ASSERT_EQ(1u, transport.idle_count(UpstreamProtocol::TCP));

    // Another protocol does not see it
    DialResult udp = transport.dial(UpstreamProtocol::UDP);
    ASSERT_FALSE(udp.cached);

    DialResult second = transport.dial(UpstreamProtocol::TCP);
    ASSERT_TRUE(second.cached);
    ASSERT_EQ(raw, second.connection.get());
    ASSERT_EQ(0u, transport.idle_count(UpstreamProtocol::TCP));

    ASSERT_EQ(1u, transport.cache_hits(UpstreamProtocol::TCP));
    ASSERT_EQ(1u, transport.cache_misses(UpstreamProtocol::TCP));
    ASSERT_EQ(1u, transport.cache_misses(UpstreamProtocol::UDP));
    ASSERT_EQ(2, dialer->dials);
}

TEST_F(TransportTest, MostRecentlyYieldedFirst) {
    Transport transport("127.0.0.1", dialer);
    DialResult a = transport.dial(UpstreamProtocol::UDP);
    DialResult b = transport.dial(UpstreamProtocol::UDP);
    DnsConnection *raw_b = b.connection.get();
    transport.yield(std::move(a.connection));
    transport.yield(std::move(b.connection));
    ASSERT_EQ(raw_b, transport.dial(UpstreamProtocol::UDP).connection.get());
}

TEST_F(TransportTest, BypassCacheDialsNew) {
    Transport transport("127.0.0.1", dialer);
    DialResult first = transport.dial(UpstreamProtocol::TCP);
    transport.yield(std::move(first.connection));

    DialResult fresh = transport.dial(UpstreamProtocol::TCP, /*bypass_cache*/ true);
    ASSERT_FALSE(fresh.cached);
    ASSERT_EQ(2, dialer->dials);
    ASSERT_EQ(1u, transport.idle_count(UpstreamProtocol::TCP));
}

TEST_F(TransportTest, TlsForcesProtocol) {
    TransportSettings settings;
    settings.tls = TlsClientConfig{"dns.example", {}, false};
    Transport transport("127.0.0.1", dialer, settings);

    DialResult r = transport.dial(UpstreamProtocol::UDP);
    ASSERT_FALSE(r.error.has_value());
    ASSERT_EQ(UpstreamProtocol::TCP_TLS, dialer->last_protocol);
    ASSERT_TRUE(dialer->last_tls);
    ASSERT_EQ(UpstreamProtocol::TCP_TLS, r.connection->protocol());
    ASSERT_EQ(1u, transport.cache_misses(UpstreamProtocol::TCP_TLS));
}

TEST_F(TransportTest, DialErrorIsPropagated) {
    dialer->fail = true;
    Transport transport("127.0.0.1", dialer);
    DialResult r = transport.dial(UpstreamProtocol::TCP);
    ASSERT_TRUE(r.error.has_value());
    ASSERT_EQ(DnsError::AE_DIAL_ERROR, r.error->code);
    ASSERT_EQ("connection refused", r.error->description);
    ASSERT_EQ(nullptr, r.connection);
}

TEST_F(TransportTest, ExpiredConnectionsAreClosed) {
    TransportSettings settings;
    settings.expire = Millis{50};
    Transport transport("127.0.0.1", dialer, settings);

    transport.yield(transport.dial(UpstreamProtocol::UDP).connection);
    std::this_thread::sleep_for(Millis{120});

    DialResult r = transport.dial(UpstreamProtocol::UDP);
    ASSERT_FALSE(r.cached);
    ASSERT_EQ(1, dialer->closed.load());
}

TEST_F(TransportTest, CleanupTaskClosesExpired) {
    TransportSettings settings;
    settings.expire = Millis{30};
    Transport transport("127.0.0.1", dialer, settings);

    transport.yield(transport.dial(UpstreamProtocol::TCP).connection);
    ASSERT_EQ(1u, transport.idle_count(UpstreamProtocol::TCP));
    for (int i = 0; i < 100 && transport.idle_count(UpstreamProtocol::TCP) != 0; ++i) {
        std::this_thread::sleep_for(Millis{10});
    }
    ASSERT_EQ(0u, transport.idle_count(UpstreamProtocol::TCP));
    ASSERT_EQ(1, dialer->closed.load());
}

TEST_F(TransportTest, IdleCacheIsBounded) {
    TransportSettings settings;
    settings.max_idle_conns = 2;
    Transport transport("127.0.0.1", dialer, settings);

    std::vector<DnsConnectionPtr> conns;
    for (int i = 0; i < 3; ++i) {
        conns.emplace_back(transport.dial(UpstreamProtocol::TCP).connection);
    }
    for (auto &c : conns) {
        transport.yield(std::move(c));
    }
    ASSERT_EQ(2u, transport.idle_count(UpstreamProtocol::TCP));
    ASSERT_EQ(1, dialer->closed.load());
}

TEST_F(TransportTest, StopClosesIdle) {
    Transport transport("127.0.0.1", dialer);
    transport.yield(transport.dial(UpstreamProtocol::TCP).connection);
    transport.yield(transport.dial(UpstreamProtocol::UDP).connection);
    transport.stop();
    ASSERT_EQ(2, dialer->closed.load());
    ASSERT_TRUE(transport.dial(UpstreamProtocol::TCP).error.has_value());
}

TEST_F(TransportTest, ConnectionIsNeverSharedBetweenHolders) {
    Transport transport("127.0.0.1", dialer);
    constexpr int THREADS = 8;
    constexpr int ROUNDS = 200;

    std::mutex mtx;
    std::set<DnsConnection *> held;
    std::atomic_bool shared{false};

    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < ROUNDS; ++i) {
                DialResult r = transport.dial(UpstreamProtocol::TCP);
                if (r.connection == nullptr) {
                    continue;
                }
                {
                    std::scoped_lock l(mtx);
                    if (!held.insert(r.connection.get()).second) {
                        shared = true;
                    }
                }
                std::this_thread::yield();
                {
                    std::scoped_lock l(mtx);
                    held.erase(r.connection.get());
                }
                transport.yield(std::move(r.connection));
            }
        });
    }
    for (auto &w : workers) {
        w.join();
    }

    ASSERT_FALSE(shared);
    ASSERT_EQ((size_t) THREADS * ROUNDS,
            transport.cache_hits(UpstreamProtocol::TCP) + transport.cache_misses(UpstreamProtocol::TCP));
    ASSERT_LE(transport.idle_count(UpstreamProtocol::TCP), (size_t) THREADS);
}

TEST(AdaptiveTimeout, FirstDialUsesCeiling) {
    auto dialer = std::make_shared<FakeDialer>();
    Transport transport("127.0.0.1", dialer);
    ASSERT_EQ(Micros{Secs{30}}, transport.dial_timeout());
    transport.dial(UpstreamProtocol::UDP);
    ASSERT_EQ(Micros{Secs{30}}, dialer->last_timeout);
}

TEST(AdaptiveTimeout, ConvergesToDoubleLatency) {
    std::atomic<int64_t> avg{std::chrono::duration_cast<Nanos>(Secs{15}).count()};
    const Nanos latency = Millis{2000};
    for (int i = 0; i < 100; ++i) {
        average_timeout(avg, latency, 4);
    }
    Micros timeout = limit_timeout(avg, Secs{1}, Secs{30});
    ASSERT_NEAR(4000.0, (double) std::chrono::duration_cast<Millis>(timeout).count(), 5.0);
}

TEST(AdaptiveTimeout, ClampedToFloor) {
    std::atomic<int64_t> avg{std::chrono::duration_cast<Nanos>(Secs{15}).count()};
    for (int i = 0; i < 100; ++i) {
        average_timeout(avg, Millis{10}, 4);
    }
    ASSERT_EQ(Micros{Secs{1}}, limit_timeout(avg, Secs{1}, Secs{30}));
}

TEST(AdaptiveTimeout, ClampedToCeiling) {
    std::atomic<int64_t> avg{std::chrono::duration_cast<Nanos>(Millis{500}).count()};
    ASSERT_EQ(Micros{Secs{1}}, limit_timeout(avg, Secs{1}, Secs{30}));

    // Average reaches half of the ceiling
    avg = std::chrono::duration_cast<Nanos>(Secs{15}).count();
    ASSERT_EQ(Micros{Secs{30}}, limit_timeout(avg, Secs{1}, Secs{30}));

    avg = std::chrono::duration_cast<Nanos>(Secs{2}).count();
    average_timeout(avg, Secs{120}, 1);
    ASSERT_EQ(Micros{Secs{30}}, limit_timeout(avg, Secs{1}, Secs{30}));
}

TEST(AdaptiveTimeout, TransportFoldsObservedLatency) {
    auto dialer = std::make_shared<FakeDialer>();
    TransportSettings settings;
    settings.avg_weight = 1;
    Transport transport("127.0.0.1", dialer, settings);
    transport.update_dial_timeout(Millis{3000});
    ASSERT_EQ(Micros{Millis{6000}}, transport.dial_timeout());
    transport.update_dial_timeout(Millis{100});
    ASSERT_EQ(Micros{Secs{1}}, transport.dial_timeout());
}

} // namespace qrelay::test

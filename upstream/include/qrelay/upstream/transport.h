#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "qrelay/common/defs.h"
#include "qrelay/common/event_loop.h"
#include "qrelay/common/logger.h"
#include "qrelay/net/tls_config.h"
#include "qrelay/upstream/connection.h"
#include "qrelay/upstream/dialer.h"

namespace qrelay {

struct TransportSettings {
    /** Lower bound of the adaptive dial timeout */
    Micros dial_timeout_floor = Secs{1};
    /** Upper bound of the adaptive dial timeout */
    Micros dial_timeout_ceiling = Secs{30};
    /** Weight of the dial latency moving average */
    int64_t avg_weight = 4;
    /** How long a connection may stay idle in the cache */
    Micros expire = Secs{10};
    /** Maximum number of idle connections per protocol */
    size_t max_idle_conns = 64;
    /** If set, every connection is TCP+TLS with this material */
    std::optional<TlsClientConfig> tls;

    static const TransportSettings &get_default();
};

/**
 * Compute the next dial timeout from the average dial latency
 * @param avg average latency in nanoseconds
 * @param floor lower bound
 * @param ceiling upper bound
 * @return floor if `avg < floor`, `2 * avg` if `avg < ceiling / 2`, ceiling otherwise
 */
Micros limit_timeout(const std::atomic<int64_t> &avg, Micros floor, Micros ceiling);

/**
 * Move the average latency towards the observed one: `avg += (observed - avg) / weight`
 */
void average_timeout(std::atomic<int64_t> &avg, Nanos observed, int64_t weight);

/**
 * Cache of idle connections to one upstream.
 * A connection is handed to at most one caller at a time.
 * The caller gives it back via `yield()` after a successful exchange, or closes it otherwise.
 */
class Transport {
public:
    Transport(std::string address, std::shared_ptr<Dialer> dialer,
              TransportSettings settings = TransportSettings::get_default());
    ~Transport();

    Transport(const Transport &) = delete;
    Transport &operator=(const Transport &) = delete;
    Transport(Transport &&) = delete;
    Transport &operator=(Transport &&) = delete;

    /**
     * Get a connection: the most recently yielded one if any is cached, a new one otherwise.
     * The protocol is forced to TCP_TLS if TLS material is configured.
     * @param protocol requested protocol
     * @param bypass_cache if true, a new connection is dialed even if a cached one exists
     */
    DialResult dial(UpstreamProtocol protocol, bool bypass_cache = false);

    /**
     * Return a connection to the idle cache
     */
    void yield(DnsConnectionPtr connection);

    /**
     * @return timeout for the next dial
     */
    [[nodiscard]] Micros dial_timeout() const;

    /**
     * Fold an observed dial latency into the average
     */
    void update_dial_timeout(Nanos observed);

    [[nodiscard]] size_t cache_hits(UpstreamProtocol protocol) const;
    [[nodiscard]] size_t cache_misses(UpstreamProtocol protocol) const;
    [[nodiscard]] size_t idle_count(UpstreamProtocol protocol) const;

    [[nodiscard]] const std::string &address() const {
        return m_address;
    }

    /**
     * Close all the idle connections and stop caching new ones
     */
    void stop();

private:
    static constexpr size_t PROTOCOLS_NUM = 3;

    struct IdleConnection {
        DnsConnectionPtr connection;
        std::chrono::steady_clock::time_point idle_since;
    };

    struct Cache {
        std::array<std::vector<IdleConnection>, PROTOCOLS_NUM> idle;
        bool stopped = false;
    };

    Logger m_log;
    std::string m_address;
    std::shared_ptr<Dialer> m_dialer;
    TransportSettings m_settings;
    std::atomic<int64_t> m_avg_dial_time;
    mutable WithMtx<Cache> m_cache;
    std::array<std::atomic_size_t, PROTOCOLS_NUM> m_hits{};
    std::array<std::atomic_size_t, PROTOCOLS_NUM> m_misses{};
    EventLoopPtr m_loop;

    void schedule_cleanup();
    std::vector<DnsConnectionPtr> take_expired(std::chrono::steady_clock::time_point now);
};

} // namespace qrelay

#include <algorithm>
#include <utility>

#include "qrelay/common/utils.h"
#include "qrelay/upstream/transport.h"

namespace qrelay {

using std::chrono::steady_clock;

const TransportSettings &TransportSettings::get_default() {
    static const TransportSettings settings{};
    return settings;
}

Micros limit_timeout(const std::atomic<int64_t> &avg, Micros floor, Micros ceiling) {
    Nanos rt{avg.load()};
    if (rt < floor) {
        return floor;
    }
    if (rt < ceiling / 2) {
        return std::chrono::duration_cast<Micros>(2 * rt);
    }
    return ceiling;
}

void average_timeout(std::atomic<int64_t> &avg, Nanos observed, int64_t weight) {
    int64_t dt = avg.load();
    avg.fetch_add((observed.count() - dt) / weight);
}

Transport::Transport(std::string address, std::shared_ptr<Dialer> dialer, TransportSettings settings)
        : m_log(QRELAY_FMT("Transport {}", address))
        , m_address(std::move(address))
        , m_dialer(std::move(dialer))
        , m_settings(std::move(settings))
        , m_avg_dial_time(std::chrono::duration_cast<Nanos>(m_settings.dial_timeout_ceiling / 2).count())
        , m_loop(EventLoop::create()) {
    if (m_loop == nullptr) {
        warnlog(m_log, "Failed to create event loop, idle connections are only cleaned up on dial");
    } else {
        schedule_cleanup();
    }
}

Transport::~Transport() {
    stop();
    m_loop.reset();
}

DialResult Transport::dial(UpstreamProtocol protocol, bool bypass_cache) {
    if (m_settings.tls.has_value()) {
        protocol = UpstreamProtocol::TCP_TLS;
    }
    auto idx = (size_t) protocol;

    DnsConnectionPtr connection;
    std::vector<DnsConnectionPtr> expired = take_expired(steady_clock::now());
    {
        std::scoped_lock l(m_cache.mtx);
        if (m_cache.val.stopped) {
            return {nullptr, false, ExchangeError{DnsError::AE_DIAL_ERROR, "Transport is stopped"}};
        }
        auto &idle = m_cache.val.idle[idx];
        if (!bypass_cache && !idle.empty()) {
            connection = std::move(idle.back().connection);
            idle.pop_back();
        }
    }
    for (auto &c : expired) {
        c->close();
    }

    if (connection != nullptr) {
        m_hits[idx].fetch_add(1, std::memory_order_relaxed);
        tracelog(m_log, "Reusing cached {} connection", upstream_protocol_name(protocol));
        return {std::move(connection), true, std::nullopt};
    }
    m_misses[idx].fetch_add(1, std::memory_order_relaxed);

    Micros timeout = dial_timeout();
    utils::Timer timer;
    const TlsClientConfig *tls = m_settings.tls.has_value() ? &m_settings.tls.value() : nullptr;
    DialResult result = m_dialer->dial(m_address, protocol, timeout, tls);
    update_dial_timeout(timer.elapsed<Nanos>());
    result.cached = false;
    if (result.error.has_value()) {
        dbglog(m_log, "Dial failed: {}", result.error->str());
    } else if (result.connection == nullptr) {
        return {nullptr, false, ExchangeError{DnsError::AE_DIAL_ERROR, "Dialer returned no connection"}};
    }
    return result;
}

void Transport::yield(DnsConnectionPtr connection) {
    if (connection == nullptr) {
        return;
    }
    auto idx = (size_t) connection->protocol();
    {
        std::scoped_lock l(m_cache.mtx);
        auto &idle = m_cache.val.idle[idx];
        if (!m_cache.val.stopped && idle.size() < m_settings.max_idle_conns) {
            idle.push_back({std::move(connection), steady_clock::now()});
            return;
        }
    }
    tracelog(m_log, "Idle cache is full or stopped, closing {} connection", upstream_protocol_name(connection->protocol()));
    connection->close();
}

Micros Transport::dial_timeout() const {
    return limit_timeout(m_avg_dial_time, m_settings.dial_timeout_floor, m_settings.dial_timeout_ceiling);
}

void Transport::update_dial_timeout(Nanos observed) {
    average_timeout(m_avg_dial_time, observed, m_settings.avg_weight);
}

size_t Transport::cache_hits(UpstreamProtocol protocol) const {
    return m_hits[(size_t) protocol].load(std::memory_order_relaxed);
}

size_t Transport::cache_misses(UpstreamProtocol protocol) const {
    return m_misses[(size_t) protocol].load(std::memory_order_relaxed);
}

size_t Transport::idle_count(UpstreamProtocol protocol) const {
    std::scoped_lock l(m_cache.mtx);
    return m_cache.val.idle[(size_t) protocol].size();
}

void Transport::stop() {
    std::vector<DnsConnectionPtr> all;
    {
        std::scoped_lock l(m_cache.mtx);
        m_cache.val.stopped = true;
        for (auto &idle : m_cache.val.idle) {
            for (auto &entry : idle) {
                all.emplace_back(std::move(entry.connection));
            }
            idle.clear();
        }
    }
    if (!all.empty()) {
        dbglog(m_log, "Closing {} idle connections", all.size());
    }
    for (auto &c : all) {
        c->close();
    }
    if (m_loop != nullptr) {
        m_loop->stop();
        m_loop->join();
    }
}

void Transport::schedule_cleanup() {
    m_loop->schedule(m_settings.expire, [this] {
        std::vector<DnsConnectionPtr> expired = take_expired(steady_clock::now());
        if (!expired.empty()) {
            tracelog(m_log, "Closing {} expired connections", expired.size());
        }
        for (auto &c : expired) {
            c->close();
        }
        schedule_cleanup();
    });
}

std::vector<DnsConnectionPtr> Transport::take_expired(steady_clock::time_point now) {
    std::vector<DnsConnectionPtr> expired;
    std::scoped_lock l(m_cache.mtx);
    for (auto &idle : m_cache.val.idle) {
        // Entries are ordered by the time they were yielded
        auto alive = std::find_if(idle.begin(), idle.end(), [&](const IdleConnection &entry) {
            return now - entry.idle_since < m_settings.expire;
        });
        for (auto it = idle.begin(); it != alive; ++it) {
            expired.emplace_back(std::move(it->connection));
        }
        idle.erase(idle.begin(), alive);
    }
    return expired;
}

} // namespace qrelay

#include <algorithm>
#include <utility>

#include <openssl/rand.h>

#include "qrelay/common/utils.h"
#include "qrelay/dns/dns_utils.h"
#include "qrelay/net/scion_address.h"
#include "qrelay/proxy/relay.h"
#include "qrelay/upstream/upstream_utils.h"

#define tracelog_id(l_, id_, fmt_, ...) tracelog((l_), "[{}] " fmt_, (id_), ##__VA_ARGS__)
#define dbglog_id(l_, id_, fmt_, ...) dbglog((l_), "[{}] " fmt_, (id_), ##__VA_ARGS__)

namespace qrelay {

static constexpr std::string_view CACHED_CLOSED_STR = "Cached connection was closed by peer";

const RelaySettings &RelaySettings::get_default() {
    static const RelaySettings settings{};
    return settings;
}

uint16_t generate_query_id() {
    uint16_t id = 0;
    if (1 != RAND_bytes((uint8_t *) &id, sizeof(id))) {
        // ldns seeds its own generator from the system
        id = ldns_get_random();
    }
    return id;
}

static ExchangeError make_io_error(ConnectionError error, bool cached) {
    switch (error.kind) {
    case ConnectionError::CE_EOF:
        if (cached) {
            return {DnsError::AE_CACHED_CONNECTION_CLOSED, std::string(CACHED_CLOSED_STR)};
        }
        break;
    case ConnectionError::CE_TIMED_OUT:
        return {DnsError::AE_TIMED_OUT, std::move(error.description)};
    case ConnectionError::CE_NETWORK:
    case ConnectionError::CE_MALFORMED:
        break;
    }
    return {DnsError::AE_SOCKET_ERROR, std::move(error.description)};
}

Relay::Relay(RelaySettings settings, std::shared_ptr<Transport> transport)
        : m_log(QRELAY_FMT("Relay {}", settings.upstream_address))
        , m_settings(std::move(settings))
        , m_transport(std::move(transport)) {
}

UpstreamProtocol Relay::select_protocol(const RequestState &state, RelayOptions options) const {
    UpstreamProtocol protocol;
    if (options.force_tcp) {
        protocol = UpstreamProtocol::TCP;
    } else if (options.prefer_udp) {
        protocol = UpstreamProtocol::UDP;
    } else {
        protocol = (state.protocol == utils::TP_TCP) ? UpstreamProtocol::TCP : UpstreamProtocol::UDP;
    }

    auto [scheme, address] = upstream_utils::split_scheme(m_settings.upstream_address);
    if (is_scion_address(address)) {
        return protocol;
    }

    // The upstream address decides for a regular upstream
    if (scheme.empty()) {
        return UpstreamProtocol::UDP;
    }
    std::optional<UpstreamProtocol> from_scheme = upstream_utils::protocol_from_scheme(scheme);
    if (!from_scheme.has_value()) {
        dbglog(m_log, "Unknown upstream scheme {}, using udp", scheme);
        return UpstreamProtocol::UDP;
    }
    return from_scheme.value();
}

ConnectResult Relay::connect(RequestState &state, RelayOptions options) {
    utils::Timer timer;
    ldns_pkt *request = state.request.get();
    if (request == nullptr) {
        return {nullptr, ExchangeError{DnsError::AE_INTERNAL_ERROR, "No request"}};
    }

    const uint16_t origin_id = ldns_pkt_id(request);
    const uint16_t upstream_id = generate_query_id();
    ldns_pkt_set_id(request, upstream_id);
    utils::ScopeExit restore_id([request, origin_id] {
        ldns_pkt_set_id(request, origin_id);
    });

    // Nothing is dialed for a query that can't be put on the wire
    dns::EncodeResult encoded = dns::encode_pkt(request);
    if (auto *e = std::get_if<ExchangeError>(&encoded); e != nullptr) {
        dbglog_id(m_log, origin_id, "Failed to encode query: {}", e->description);
        return {nullptr, std::move(*e)};
    }
    const Uint8Vector &wire = std::get<Uint8Vector>(encoded);

    UpstreamProtocol protocol = select_protocol(state, options);
    DialResult dial = m_transport->dial(protocol, options.fresh_connection);
    if (dial.error.has_value()) {
        return {nullptr, std::move(dial.error)};
    }
    DnsConnectionPtr connection = std::move(dial.connection);
    bool cached = dial.cached;

    connection->set_udp_size(std::max(state.udp_size, m_settings.min_udp_size));
    tracelog_id(m_log, origin_id, "Relaying as [{}] over {} ({})", upstream_id,
            upstream_protocol_name(connection->protocol()), cached ? "cached" : "new");

    if (auto e = connection->write_msg({wire.data(), wire.size()}, m_settings.write_timeout); e.has_value()) {
        dbglog_id(m_log, origin_id, "Write failed: {}", e->description);
        connection->close();
        return {nullptr, make_io_error(std::move(e.value()), cached)};
    }

    const bool datagram = connection->protocol() == UpstreamProtocol::UDP;
    utils::Timer read_timer;
    ldns_pkt_ptr reply;
    while (reply == nullptr) {
        Micros left = m_settings.read_timeout - read_timer.elapsed<Micros>();
        if (left.count() <= 0) {
            connection->close();
            return {nullptr, ExchangeError{DnsError::AE_TIMED_OUT, "No matching reply within read timeout"}};
        }

        DnsConnection::ReadResult r = connection->read_msg(left);
        if (auto *e = std::get_if<ConnectionError>(&r); e != nullptr) {
            if (datagram && e->kind == ConnectionError::CE_MALFORMED) {
                dbglog_id(m_log, origin_id, "Ignoring malformed datagram: {}", e->description);
                continue;
            }
            dbglog_id(m_log, origin_id, "Read failed: {}", e->description);
            connection->close();
            return {nullptr, make_io_error(std::move(*e), cached)};
        }

        const Uint8Vector &bytes = std::get<Uint8Vector>(r);
        dns::DecodeResult decoded = dns::decode_pkt({bytes.data(), bytes.size()});
        if (auto *e = std::get_if<ExchangeError>(&decoded); e != nullptr) {
            if (datagram) {
                dbglog_id(m_log, origin_id, "Ignoring undecodable datagram: {}", e->description);
                continue;
            }
            connection->close();
            return {nullptr, std::move(*e)};
        }

        ldns_pkt_ptr pkt = std::move(std::get<ldns_pkt_ptr>(decoded));
        if (ldns_pkt_id(pkt.get()) != upstream_id) {
            dbglog_id(m_log, origin_id, "Discarding reply with unexpected id {}", ldns_pkt_id(pkt.get()));
            continue;
        }
        reply = std::move(pkt);
    }

    ldns_pkt_set_id(reply.get(), origin_id);
    m_transport->yield(std::move(connection));

    Micros duration = timer.elapsed<Micros>();
    record(reply.get(), duration);
    tracelog_id(m_log, origin_id, "Got {} in {}", dns::rcode_to_string(ldns_pkt_get_rcode(reply.get())),
            std::chrono::duration_cast<Millis>(duration));

    return {std::move(reply), std::nullopt};
}

void Relay::record(const ldns_pkt *reply, Micros duration) {
    m_requests.fetch_add(1, std::memory_order_relaxed);
    m_last_duration_us.store(duration.count(), std::memory_order_relaxed);
    m_total_duration_us.fetch_add(duration.count(), std::memory_order_relaxed);
    std::scoped_lock l(m_rcodes.mtx);
    ++m_rcodes.val[ldns_pkt_get_rcode(reply)];
}

size_t Relay::requests() const {
    return m_requests.load(std::memory_order_relaxed);
}

size_t Relay::rcode_count(int rcode) const {
    std::scoped_lock l(m_rcodes.mtx);
    auto it = m_rcodes.val.find(rcode);
    return it != m_rcodes.val.end() ? it->second : 0;
}

Micros Relay::last_duration() const {
    return Micros{m_last_duration_us.load(std::memory_order_relaxed)};
}

Micros Relay::total_duration() const {
    return Micros{m_total_duration_us.load(std::memory_order_relaxed)};
}

} // namespace qrelay

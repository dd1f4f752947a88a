#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include "qrelay/common/defs.h"
#include "qrelay/common/logger.h"
#include "qrelay/dns/dns_defs.h"
#include "qrelay/proxy/request_state.h"
#include "qrelay/upstream/transport.h"

namespace qrelay {

struct RelaySettings {
    /** Upstream address, optionally with a scheme (`udp://`, `dns://`, `tcp://`, `tls://`) or a SCION address */
    std::string upstream_address;
    /** Deadline for the whole read-and-match phase */
    Micros read_timeout = Secs{2};
    /** Maximum time to send a query */
    Micros write_timeout = Secs{2};
    /** Lower bound of the UDP size hint given to a connection */
    uint16_t min_udp_size = DEFAULT_UDP_PAYLOAD_SIZE;

    static const RelaySettings &get_default();
};

struct RelayOptions {
    /** Use TCP to the upstream regardless of the client protocol */
    bool force_tcp = false;
    /** Use UDP to the upstream regardless of the client protocol */
    bool prefer_udp = false;
    /** Do not reuse a cached connection */
    bool fresh_connection = false;
};

struct ConnectResult {
    /** Upstream response carrying the client's ID, null on error */
    ldns_pkt_ptr response;
    /** Error if failed */
    std::optional<ExchangeError> error;
};

/**
 * Sends client queries to one upstream over pooled connections and matches the replies by ID
 */
class Relay {
public:
    /**
     * @param settings relay settings
     * @param transport connection cache for `settings.upstream_address`
     */
    Relay(RelaySettings settings, std::shared_ptr<Transport> transport);
    ~Relay() = default;

    Relay(const Relay &) = delete;
    Relay &operator=(const Relay &) = delete;
    Relay(Relay &&) = delete;
    Relay &operator=(Relay &&) = delete;

    /**
     * Relay a request to the upstream. Blocks the calling thread.
     * The request keeps its ID on return.
     * @param state client request
     * @param options protocol preferences
     * @return see `ConnectResult`
     */
    ConnectResult connect(RequestState &state, RelayOptions options);

    /**
     * @return protocol `connect` would request from the transport
     */
    [[nodiscard]] UpstreamProtocol select_protocol(const RequestState &state, RelayOptions options) const;

    [[nodiscard]] const RelaySettings &settings() const {
        return m_settings;
    }

    [[nodiscard]] Transport &transport() {
        return *m_transport;
    }

    /** Number of successfully relayed requests */
    [[nodiscard]] size_t requests() const;
    /** Number of successfully relayed requests per response code */
    [[nodiscard]] size_t rcode_count(int rcode) const;
    /** Duration of the last successful exchange */
    [[nodiscard]] Micros last_duration() const;
    /** Sum of durations of the successful exchanges */
    [[nodiscard]] Micros total_duration() const;

private:
    Logger m_log;
    RelaySettings m_settings;
    std::shared_ptr<Transport> m_transport;

    std::atomic_size_t m_requests{0};
    mutable WithMtx<HashMap<int, size_t>> m_rcodes;
    std::atomic<int64_t> m_last_duration_us{0};
    std::atomic<int64_t> m_total_duration_us{0};

    void record(const ldns_pkt *reply, Micros duration);
};

/**
 * @return 16-bit ID for a query sent upstream
 */
uint16_t generate_query_id();

} // namespace qrelay

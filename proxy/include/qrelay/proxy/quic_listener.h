#pragma once

#include <array>
#include <atomic>
#include <memory>
#include <string>

#include <event2/event.h>

#include "qrelay/common/buffer_pool.h"
#include "qrelay/common/defs.h"
#include "qrelay/common/event_loop.h"
#include "qrelay/common/logger.h"
#include "qrelay/common/socket_address.h"
#include "qrelay/dns/dns_defs.h"
#include "qrelay/net/tls_config.h"
#include "qrelay/proxy/dns_handler.h"
#include "qrelay/proxy/doq_exchange.h"
#include "qrelay/proxy/packet_conn_provider.h"

namespace qrelay {

struct QuicListenerSettings {
    /** Address to listen on, its format depends on the packet connection provider */
    std::string address;
    /** Server name passed to the handler */
    std::string server_name;
    /** A session with no activity for this long is closed */
    Micros idle_timeout = std::chrono::minutes(5);
    /** Stream reads shorter than this are ignored */
    size_t min_message_size = MIN_DNS_PACKET_SIZE;
    /** Largest amount of data a client may send on a stream */
    size_t max_stream_data = MAX_DNS_MESSAGE_SIZE + DNS_LENGTH_PREFIX_SIZE;
    /** Number of idle stream buffers kept for reuse */
    size_t buffer_pool_size = 128;
    /** Queries handled at once, streams above the limit are reset. 0 means no limit. */
    size_t max_exchanges_in_flight = 0;
    /** Certificate, key and ALPN. The listener cannot start without them. */
    TlsServerConfig tls = {{}, {}, {"doq"}};

    static const QuicListenerSettings &get_default();
};

class QuicSession;

/**
 * DNS-over-QUIC listener. Every client-initiated bidirectional stream carries one query,
 * which is passed to the handler on a worker thread.
 */
class QuicListener {
public:
    enum State {
        QLS_IDLE,
        QLS_LISTENING,
        QLS_CLOSED,
    };

    QuicListener(QuicListenerSettings settings, std::shared_ptr<DnsHandler> handler);
    ~QuicListener();

    QuicListener(const QuicListener &) = delete;
    QuicListener &operator=(const QuicListener &) = delete;
    QuicListener(QuicListener &&) = delete;
    QuicListener &operator=(QuicListener &&) = delete;

    /**
     * Open a packet connection with `provider` and start accepting sessions
     * @return some error if failed
     */
    ErrString listen(PacketConnProvider &provider);

    /**
     * Close all the sessions and the packet connection. Exchanges in progress are abandoned.
     */
    void stop();

    [[nodiscard]] State state() const {
        return m_state.load();
    }

    /**
     * @return The address the packet connection is bound to
     */
    [[nodiscard]] SocketAddress local_address() const;

    [[nodiscard]] const QuicListenerSettings &settings() const {
        return m_settings;
    }

    /** Number of sessions accepted so far */
    [[nodiscard]] size_t sessions() const {
        return m_sessions_accepted.load(std::memory_order_relaxed);
    }
    /** Number of exchanges handed to the handler */
    [[nodiscard]] size_t exchanges() const {
        return m_exchanges.load(std::memory_order_relaxed);
    }
    /** Number of streams ignored because of too short reads */
    [[nodiscard]] size_t dropped_short_reads() const {
        return m_dropped_short_reads.load(std::memory_order_relaxed);
    }
    /** Number of streams dropped because of malformed or oversized data */
    [[nodiscard]] size_t dropped_malformed() const {
        return m_dropped_malformed.load(std::memory_order_relaxed);
    }
    /** Number of streams reset because their exchange could not run or failed */
    [[nodiscard]] size_t dropped_exchanges() const {
        return m_dropped_exchanges.load(std::memory_order_relaxed);
    }
    /** Number of sessions closed because of a protocol violation */
    [[nodiscard]] size_t sessions_aborted() const {
        return m_sessions_aborted.load(std::memory_order_relaxed);
    }

private:
    friend class QuicSession;

    struct ResultSink;
    class SessionControlImpl;

    Logger m_log{"QuicListener"};
    QuicListenerSettings m_settings;
    std::shared_ptr<DnsHandler> m_handler;
    std::atomic<State> m_state{QLS_IDLE};
    DnsContext m_context;
    SslCtxPtr m_ssl_ctx;
    std::array<uint8_t, 32> m_static_secret{};
    BufferPool m_buffer_pool;
    EventLoopPtr m_loop;
    PacketConnPtr m_conn;
    UniquePtr<event, &event_free> m_read_event;
    SocketAddress m_local_address;
    std::shared_ptr<ResultSink> m_sink;
    uint64_t m_next_session_id = 0;
    HashMap<uint64_t, std::unique_ptr<QuicSession>> m_sessions;
    HashMap<std::string, QuicSession *> m_sessions_by_cid;
    Uint8Vector m_recv_buffer;

    std::atomic_size_t m_sessions_accepted{0};
    std::atomic_size_t m_exchanges{0};
    std::atomic_size_t m_dropped_short_reads{0};
    std::atomic_size_t m_dropped_malformed{0};
    std::atomic_size_t m_dropped_exchanges{0};
    std::atomic_size_t m_sessions_aborted{0};

    static void on_read(evutil_socket_t fd, short what, void *arg);
    void handle_datagram(const SocketAddress &remote, Uint8View data);
    void send_version_negotiation(const SocketAddress &remote, Uint8View dcid, Uint8View scid);
    void send_packet(const SocketAddress &remote, Uint8View data);

    void register_cid(Uint8View cid, QuicSession *session);
    void unregister_cid(Uint8View cid);
    void remove_session(uint64_t id);

    /**
     * Hand a complete query over to a worker
     * @return false if the stream is to be reset
     */
    bool dispatch_exchange(QuicSession &session, int64_t stream_id, BufferPool::Handle buffer, size_t length);
    void complete_exchange(uint64_t session_id, int64_t stream_id, DoqExchange::Result result);
    void abort_session(uint64_t session_id, std::string_view reason);
    void count_outcome(DoqExchange::Outcome outcome);
};

} // namespace qrelay

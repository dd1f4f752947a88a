#pragma once

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include <event2/buffer.h>
#include <event2/event.h>
#include <ngtcp2/ngtcp2.h>
#include <ngtcp2/ngtcp2_crypto.h>
#include <openssl/ssl.h>

#include "qrelay/common/buffer_pool.h"
#include "qrelay/common/defs.h"
#include "qrelay/common/logger.h"
#include "qrelay/common/socket_address.h"
#include "qrelay/net/tls_config.h"
#include "qrelay/proxy/quic_listener.h"

namespace qrelay {

/** Application error codes from RFC 9250 */
static constexpr uint64_t DOQ_NO_ERROR = 0x0;
static constexpr uint64_t DOQ_INTERNAL_ERROR = 0x1;
static constexpr uint64_t DOQ_PROTOCOL_ERROR = 0x2;
static constexpr uint64_t DOQ_REQUEST_CANCELLED = 0x3;

/** Length of the connection IDs the server issues */
static constexpr size_t QUIC_SCID_LEN = 18;
/** Largest UDP payload the server sends */
static constexpr size_t QUIC_MAX_PKTLEN = 1232;

/**
 * Route from worker threads back to the listener. Detached once the listener stops.
 */
struct QuicListener::ResultSink {
    std::mutex mtx;
    QuicListener *listener = nullptr;
    /** Workers that have not finished yet */
    std::atomic_size_t in_flight{0};
};

class QuicListener::SessionControlImpl : public SessionControl {
public:
    SessionControlImpl(std::shared_ptr<ResultSink> sink, uint64_t session_id)
            : m_sink(std::move(sink))
            , m_session_id(session_id) {
    }

    void abort_session(std::string_view reason) override;

    [[nodiscard]] bool aborted() const {
        return m_aborted.load();
    }

private:
    std::shared_ptr<ResultSink> m_sink;
    uint64_t m_session_id;
    std::atomic_bool m_aborted{false};
};

/**
 * Server side of one QUIC connection. Lives on the listener's event loop thread.
 */
class QuicSession {
public:
    enum NetworkError {
        NETWORK_ERR_OK = 0,
        /** The session is done and must be removed, nothing to send */
        NETWORK_ERR_DROP_CONN = -1,
        /** The session is closed, CONNECTION_CLOSE is sent */
        NETWORK_ERR_CLOSED = -2,
    };

    QuicSession(QuicListener &listener, uint64_t id, const SocketAddress &remote);
    ~QuicSession();

    QuicSession(const QuicSession &) = delete;
    QuicSession &operator=(const QuicSession &) = delete;
    QuicSession(QuicSession &&) = delete;
    QuicSession &operator=(QuicSession &&) = delete;

    /**
     * Create the connection from the client's first Initial packet
     */
    ErrString init(const ngtcp2_pkt_hd &hd);

    /**
     * Feed a datagram received from the peer
     */
    int on_read(const SocketAddress &remote, Uint8View data);

    /**
     * Send whatever the connection has to send and re-arm the timer
     */
    int on_write();

    /**
     * Queue the response of a finished exchange and close the stream's send side
     * @param response framed response, or none to close the stream with no data
     */
    void send_response(int64_t stream_id, std::optional<Uint8Vector> response);

    /**
     * Reset both directions of a stream with an application error
     */
    void shutdown_stream(int64_t stream_id, uint64_t app_error);

    /**
     * Close the connection with an application error
     */
    void close(uint64_t app_error, std::string_view reason);

    [[nodiscard]] uint64_t id() const {
        return m_id;
    }

    [[nodiscard]] const SocketAddress &remote_address() const {
        return m_remote;
    }

    [[nodiscard]] const std::shared_ptr<QuicListener::SessionControlImpl> &control() const {
        return m_control;
    }

private:
    struct Stream {
        /** Query bytes received so far */
        BufferPool::Handle recv_buf;
        size_t received = 0;
        /** The query has been handed over to a worker */
        bool dispatched = false;
        /** Response bytes not yet acknowledged by the peer */
        UniquePtr<evbuffer, &evbuffer_free> send_buf{evbuffer_new()};
        /** Offset of the first unsent byte in `send_buf` */
        size_t read_position = 0;
        /** The response is complete, FIN is to be sent after it */
        bool fin_queued = false;
        bool fin_sent = false;
    };

    Logger m_log;
    QuicListener &m_listener;
    uint64_t m_id;
    SocketAddress m_remote;
    ngtcp2_path_storage m_path{};
    ngtcp2_crypto_conn_ref m_conn_ref{};
    SslPtr m_ssl;
    ngtcp2_conn *m_conn = nullptr;
    UniquePtr<event, &event_free> m_timer;
    std::shared_ptr<QuicListener::SessionControlImpl> m_control;
    HashMap<int64_t, Stream> m_streams;
    std::deque<int64_t> m_send_queue;
    std::vector<Uint8Vector> m_cids;
    Uint8Vector m_send_buf;

    int write_streams();
    int handle_expiry();
    void schedule_timer();
    void write_connection_close(const ngtcp2_ccerr &ccerr);
    int handle_read_error(int rv);
    void add_cid(const ngtcp2_cid &cid);
    void drop_cid(const ngtcp2_cid &cid);

    static ngtcp2_conn *get_conn(ngtcp2_crypto_conn_ref *conn_ref);
    static void rand_cb(uint8_t *dest, size_t destlen, const ngtcp2_rand_ctx *rand_ctx);
    static int get_new_connection_id(ngtcp2_conn *conn, ngtcp2_cid *cid, uint8_t *token, size_t cidlen,
            void *user_data);
    static int remove_connection_id(ngtcp2_conn *conn, const ngtcp2_cid *cid, void *user_data);
    static int handshake_completed(ngtcp2_conn *conn, void *user_data);
    static int stream_open(ngtcp2_conn *conn, int64_t stream_id, void *user_data);
    static int recv_stream_data(ngtcp2_conn *conn, uint32_t flags, int64_t stream_id, uint64_t offset,
            const uint8_t *data, size_t datalen, void *user_data, void *stream_user_data);
    static int acked_stream_data_offset(ngtcp2_conn *conn, int64_t stream_id, uint64_t offset, uint64_t datalen,
            void *user_data, void *stream_user_data);
    static int stream_close(ngtcp2_conn *conn, uint32_t flags, int64_t stream_id, uint64_t app_error_code,
            void *user_data, void *stream_user_data);
    static int stream_reset(ngtcp2_conn *conn, int64_t stream_id, uint64_t final_size, uint64_t app_error_code,
            void *user_data, void *stream_user_data);
    static int extend_max_stream_data(ngtcp2_conn *conn, int64_t stream_id, uint64_t max_data, void *user_data,
            void *stream_user_data);
    static void timer_cb(evutil_socket_t, short, void *arg);
    static void log_printf(void *user_data, const char *format, ...);
};

/**
 * @return Monotonic timestamp in nanoseconds
 */
ngtcp2_tstamp get_tstamp();

} // namespace qrelay

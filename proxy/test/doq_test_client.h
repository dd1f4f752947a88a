#pragma once

#include <algorithm>
#include <chrono>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <thread>

#include <netinet/in.h>
#include <ngtcp2/ngtcp2.h>
#include <ngtcp2/ngtcp2_crypto.h>
#include <ngtcp2/ngtcp2_crypto_boringssl.h>
#include <openssl/rand.h>
#include <openssl/ssl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "qrelay/common/defs.h"
#include "qrelay/common/net_utils.h"
#include "qrelay/common/socket_address.h"
#include "qrelay/common/utils.h"
#include "qrelay/net/tls_config.h"

namespace qrelay::test {

/**
 * Synchronous DNS-over-QUIC client driven from the test thread.
 * Every query goes on its own bidirectional stream, which is closed for writing right after it.
 */
class DoqTestClient {
public:
    /** What the client has seen on one stream */
    struct Stream {
        Uint8Vector data;
        /** The server closed its side with FIN */
        bool fin = false;
        /** Error code of RESET_STREAM from the server */
        std::optional<uint64_t> reset_code;
    };

    /**
     * Rewrites a datagram before it is sent. Returning false drops it.
     */
    using Filter = std::function<bool(Uint8Vector &datagram)>;

    explicit DoqTestClient(const SocketAddress &server, Filter outgoing = nullptr, Filter incoming = nullptr)
            : m_outgoing_filter(std::move(outgoing))
            , m_incoming_filter(std::move(incoming))
            , m_conn_ref{get_conn, this} {
        ngtcp2_ccerr_default(&m_close_error);
        if (ErrString error = init(server); error.has_value()) {
            m_error = std::move(error);
            m_closed = true;
        }
    }

    ~DoqTestClient() {
        if (m_conn != nullptr) {
            ngtcp2_conn_del(m_conn);
        }
        if (m_fd != -1) {
            ::close(m_fd);
        }
    }

    DoqTestClient(const DoqTestClient &) = delete;
    DoqTestClient &operator=(const DoqTestClient &) = delete;
    DoqTestClient(DoqTestClient &&) = delete;
    DoqTestClient &operator=(DoqTestClient &&) = delete;

    /**
     * Run the handshake
     * @return true if it completed in time
     */
    bool connect(Millis timeout = Millis{3000}) {
        run_until(
                [this] {
                    return m_closed || ngtcp2_conn_get_handshake_completed(m_conn) != 0;
                },
                timeout);
        return !m_closed && ngtcp2_conn_get_handshake_completed(m_conn) != 0;
    }

    /**
     * Open a stream and send `data` on it followed by FIN
     * @return stream ID, none if no stream can be opened
     */
    std::optional<int64_t> send(Uint8View data) {
        if (m_closed) {
            return std::nullopt;
        }
        int64_t stream_id = -1;
        if (0 != ngtcp2_conn_open_bidi_stream(m_conn, &stream_id, nullptr)) {
            return std::nullopt;
        }
        m_streams[stream_id];
        m_pending.push_back({stream_id, Uint8Vector(data.begin(), data.end())});
        flush();
        return stream_id;
    }

    /**
     * Wait until the server has finished with the stream: answered it up to FIN or reset it
     */
    bool wait_stream(int64_t stream_id, Millis timeout = Millis{3000}) {
        auto finished = [this, stream_id] {
            const Stream &s = m_streams[stream_id];
            return s.fin || s.reset_code.has_value();
        };
        run_until(
                [this, &finished] {
                    return m_closed || finished();
                },
                timeout);
        return finished();
    }

    /**
     * Pump the connection until `done` holds or the time is out
     * @return the last value of `done`
     */
    bool run_until(const std::function<bool()> &done, Millis timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!done()) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return done();
            }
            if (m_closed) {
                // Nothing to exchange any more, just let the time pass
                std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(deadline - now, Millis{10}));
                continue;
            }
            flush();
            auto wait = std::chrono::duration_cast<Millis>(deadline - now);
            ngtcp2_tstamp expiry = ngtcp2_conn_get_expiry(m_conn);
            ngtcp2_tstamp ts = timestamp();
            if (expiry != UINT64_MAX) {
                wait = std::min(wait, std::chrono::ceil<Millis>(Nanos(expiry > ts ? expiry - ts : 0)));
            }

            pollfd pfd{m_fd, POLLIN, 0};
            int r = ::poll(&pfd, 1, (int) wait.count());
            if (r > 0) {
                receive();
            } else if (r == 0 && expiry != UINT64_MAX && timestamp() >= expiry) {
                if (int rv = ngtcp2_conn_handle_expiry(m_conn, timestamp()); rv != 0) {
                    m_error = ngtcp2_strerror(rv);
                    m_closed = true;
                }
            }
        }
        return true;
    }

    [[nodiscard]] const Stream &stream(int64_t stream_id) {
        return m_streams[stream_id];
    }

    /** The connection is closed or draining, nothing more can be exchanged */
    [[nodiscard]] bool closed() const {
        return m_closed;
    }

    /** CONNECTION_CLOSE received from the server */
    [[nodiscard]] const ngtcp2_ccerr &close_error() const {
        return m_close_error;
    }

    [[nodiscard]] const SocketAddress &local_address() const {
        return m_local;
    }

    [[nodiscard]] const ErrString &error() const {
        return m_error;
    }

private:
    struct Pending {
        int64_t stream_id;
        Uint8Vector data;
        size_t offset = 0;
    };

    static constexpr size_t MAX_UDP_PAYLOAD = 1200;

    int m_fd = -1;
    SocketAddress m_local;
    SocketAddress m_remote;
    ngtcp2_path_storage m_path{};
    Filter m_outgoing_filter;
    Filter m_incoming_filter;
    ngtcp2_crypto_conn_ref m_conn_ref;
    SslCtxPtr m_ssl_ctx;
    SslPtr m_ssl;
    ngtcp2_conn *m_conn = nullptr;
    HashMap<int64_t, Stream> m_streams;
    std::deque<Pending> m_pending;
    ngtcp2_ccerr m_close_error{};
    bool m_closed = false;
    ErrString m_error;

    static ngtcp2_tstamp timestamp() {
        return std::chrono::duration_cast<Nanos>(std::chrono::steady_clock::now().time_since_epoch()).count();
    }

    ErrString init(const SocketAddress &server) {
        m_fd = ::socket(server.c_sockaddr()->sa_family, SOCK_DGRAM, 0);
        if (m_fd == -1 || 0 != ::connect(m_fd, server.c_sockaddr(), server.c_socklen())) {
            return "Failed to connect UDP socket";
        }
        std::optional<SocketAddress> local = utils::get_local_address(m_fd);
        if (!local.has_value()) {
            return "Failed to get local address";
        }
        m_local = local.value();
        m_remote = server;
        ngtcp2_path_storage_init(&m_path, (const ngtcp2_sockaddr *) m_local.c_sockaddr(), m_local.c_socklen(),
                (const ngtcp2_sockaddr *) m_remote.c_sockaddr(), m_remote.c_socklen(), nullptr);

        m_ssl_ctx.reset(SSL_CTX_new(TLS_client_method()));
        if (m_ssl_ctx == nullptr || 0 != ngtcp2_crypto_boringssl_configure_client_context(m_ssl_ctx.get())) {
            return "Failed to set up TLS context";
        }
        SSL_CTX_set_min_proto_version(m_ssl_ctx.get(), TLS1_3_VERSION);
        SSL_CTX_set_max_proto_version(m_ssl_ctx.get(), TLS1_3_VERSION);
        // The server certificate is self-signed
        SSL_CTX_set_verify(m_ssl_ctx.get(), SSL_VERIFY_NONE, nullptr);

        m_ssl.reset(SSL_new(m_ssl_ctx.get()));
        if (m_ssl == nullptr) {
            return "Failed to create SSL session";
        }
        SSL_set_app_data(m_ssl.get(), &m_conn_ref);
        SSL_set_connect_state(m_ssl.get());
        SSL_set_tlsext_host_name(m_ssl.get(), "dns.example");
        static constexpr uint8_t ALPN[] = {3, 'd', 'o', 'q'};
        SSL_set_alpn_protos(m_ssl.get(), ALPN, sizeof(ALPN));

        ngtcp2_callbacks callbacks{};
        callbacks.client_initial = ngtcp2_crypto_client_initial_cb;
        callbacks.recv_crypto_data = ngtcp2_crypto_recv_crypto_data_cb;
        callbacks.encrypt = ngtcp2_crypto_encrypt_cb;
        callbacks.decrypt = ngtcp2_crypto_decrypt_cb;
        callbacks.hp_mask = ngtcp2_crypto_hp_mask_cb;
        callbacks.recv_retry = ngtcp2_crypto_recv_retry_cb;
        callbacks.update_key = ngtcp2_crypto_update_key_cb;
        callbacks.delete_crypto_aead_ctx = ngtcp2_crypto_delete_crypto_aead_ctx_cb;
        callbacks.delete_crypto_cipher_ctx = ngtcp2_crypto_delete_crypto_cipher_ctx_cb;
        callbacks.get_path_challenge_data = ngtcp2_crypto_get_path_challenge_data_cb;
        callbacks.version_negotiation = ngtcp2_crypto_version_negotiation_cb;
        callbacks.rand = rand_cb;
        callbacks.get_new_connection_id = get_new_connection_id;
        callbacks.recv_stream_data = recv_stream_data;
        callbacks.stream_reset = stream_reset;

        ngtcp2_settings settings;
        ngtcp2_settings_default(&settings);
        settings.initial_ts = timestamp();
        settings.max_tx_udp_payload_size = MAX_UDP_PAYLOAD;

        ngtcp2_transport_params params;
        ngtcp2_transport_params_default(&params);
        params.initial_max_stream_data_bidi_local = 256 * 1024;
        params.initial_max_data = 1024 * 1024;
        params.initial_max_streams_bidi = 0;
        params.initial_max_streams_uni = 0;
        params.max_idle_timeout = std::chrono::duration_cast<Nanos>(Secs{10}).count();

        ngtcp2_cid dcid{};
        ngtcp2_cid scid{};
        dcid.datalen = 18;
        scid.datalen = 17;
        if (1 != RAND_bytes(dcid.data, dcid.datalen) || 1 != RAND_bytes(scid.data, scid.datalen)) {
            return "Failed to generate connection IDs";
        }

        if (int rv = ngtcp2_conn_client_new(&m_conn, &dcid, &scid, &m_path.path, NGTCP2_PROTO_VER_V1, &callbacks,
                    &settings, &params, nullptr, this);
                rv != 0) {
            m_conn = nullptr;
            return QRELAY_FMT("Failed to create QUIC connection: {}", ngtcp2_strerror(rv));
        }
        ngtcp2_conn_set_tls_native_handle(m_conn, m_ssl.get());
        return std::nullopt;
    }

    void flush() {
        if (m_closed) {
            return;
        }
        uint8_t buf[MAX_UDP_PAYLOAD];
        bool streams_blocked = false;
        for (;;) {
            Pending *pending = (m_pending.empty() || streams_blocked) ? nullptr : &m_pending.front();
            ngtcp2_vec vec{};
            size_t vcnt = 0;
            int64_t stream_id = -1;
            uint32_t flags = NGTCP2_WRITE_STREAM_FLAG_MORE;
            if (pending != nullptr) {
                stream_id = pending->stream_id;
                vec.base = pending->data.data() + pending->offset;
                vec.len = pending->data.size() - pending->offset;
                vcnt = (vec.len > 0) ? 1 : 0;
                flags |= NGTCP2_WRITE_STREAM_FLAG_FIN;
            }

            ngtcp2_pkt_info pi{};
            ngtcp2_ssize ndatalen = -1;
            ngtcp2_ssize n = ngtcp2_conn_writev_stream(m_conn, &m_path.path, &pi, buf, sizeof(buf), &ndatalen, flags,
                    stream_id, &vec, vcnt, timestamp());
            if (pending != nullptr && ndatalen >= 0) {
                pending->offset += ndatalen;
                if (pending->offset == pending->data.size()) {
                    m_pending.pop_front();
                }
            }

            if (n < 0) {
                switch (n) {
                case NGTCP2_ERR_WRITE_MORE:
                    continue;
                case NGTCP2_ERR_STREAM_DATA_BLOCKED:
                    streams_blocked = true;
                    continue;
                case NGTCP2_ERR_STREAM_SHUT_WR:
                case NGTCP2_ERR_STREAM_NOT_FOUND:
                    m_pending.pop_front();
                    continue;
                default:
                    m_error = ngtcp2_strerror(n);
                    m_closed = true;
                    return;
                }
            }
            if (n == 0) {
                return;
            }

            Uint8Vector datagram(buf, buf + n);
            if (m_outgoing_filter != nullptr && !m_outgoing_filter(datagram)) {
                continue;
            }
            ::send(m_fd, datagram.data(), datagram.size(), 0);
        }
    }

    void receive() {
        Uint8Vector datagram(UINT16_MAX);
        ssize_t r = ::recv(m_fd, datagram.data(), datagram.size(), 0);
        if (r <= 0) {
            return;
        }
        datagram.resize(r);
        if (m_incoming_filter != nullptr && !m_incoming_filter(datagram)) {
            return;
        }

        ngtcp2_pkt_info pi{};
        int rv = ngtcp2_conn_read_pkt(m_conn, &m_path.path, &pi, datagram.data(), datagram.size(), timestamp());
        if (rv == 0) {
            return;
        }
        if (rv == NGTCP2_ERR_DRAINING) {
            m_close_error = *ngtcp2_conn_get_ccerr(m_conn);
        } else {
            m_error = ngtcp2_strerror(rv);
        }
        m_closed = true;
    }

    static ngtcp2_conn *get_conn(ngtcp2_crypto_conn_ref *conn_ref) {
        return ((DoqTestClient *) conn_ref->user_data)->m_conn;
    }

    static void rand_cb(uint8_t *dest, size_t destlen, const ngtcp2_rand_ctx *) {
        RAND_bytes(dest, destlen);
    }

    static int get_new_connection_id(ngtcp2_conn *, ngtcp2_cid *cid, uint8_t *token, size_t cidlen, void *) {
        if (1 != RAND_bytes(cid->data, cidlen) || 1 != RAND_bytes(token, NGTCP2_STATELESS_RESET_TOKENLEN)) {
            return NGTCP2_ERR_CALLBACK_FAILURE;
        }
        cid->datalen = cidlen;
        return 0;
    }

    static int recv_stream_data(ngtcp2_conn *conn, uint32_t flags, int64_t stream_id, uint64_t, const uint8_t *data,
            size_t datalen, void *user_data, void *) {
        auto *self = (DoqTestClient *) user_data;
        Stream &stream = self->m_streams[stream_id];
        stream.data.insert(stream.data.end(), data, data + datalen);
        if (flags & NGTCP2_STREAM_DATA_FLAG_FIN) {
            stream.fin = true;
        }
        ngtcp2_conn_extend_max_stream_offset(conn, stream_id, datalen);
        ngtcp2_conn_extend_max_offset(conn, datalen);
        return 0;
    }

    static int stream_reset(ngtcp2_conn *, int64_t stream_id, uint64_t, uint64_t app_error_code, void *user_data,
            void *) {
        auto *self = (DoqTestClient *) user_data;
        self->m_streams[stream_id].reset_code = app_error_code;
        return 0;
    }
};

} // namespace qrelay::test

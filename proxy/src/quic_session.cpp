#include <algorithm>
#include <array>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <utility>

#include <ngtcp2/ngtcp2_crypto_boringssl.h>
#include <openssl/err.h>
#include <openssl/rand.h>

#include "qrelay/common/net_utils.h"
#include "qrelay/common/utils.h"

#include "quic_session.h"

#define log_sess(s_, lvl_, fmt_, ...)                                                                                  \
    lvl_##log((s_)->m_log, "[id={}] {}(): " fmt_, (s_)->m_id, __func__, ##__VA_ARGS__)

namespace qrelay {

ngtcp2_tstamp get_tstamp() {
#ifdef __linux__
    static constexpr int64_t NANOS_PER_SEC = 1'000'000'000;
    timespec ts{};
    if (clock_gettime(CLOCK_MONOTONIC, &ts) != -1) {
        return (ts.tv_sec * NANOS_PER_SEC) + ts.tv_nsec;
    }
#endif
    return std::chrono::duration_cast<Nanos>(std::chrono::steady_clock::now().time_since_epoch()).count();
}

QuicSession::QuicSession(QuicListener &listener, uint64_t id, const SocketAddress &remote)
        : m_log(__func__)
        , m_listener(listener)
        , m_id(id)
        , m_remote(remote)
        , m_conn_ref{get_conn, this}
        , m_timer(evtimer_new(listener.m_loop->c_base(), timer_cb, this))
        , m_control(std::make_shared<QuicListener::SessionControlImpl>(listener.m_sink, id))
        , m_send_buf(QUIC_MAX_PKTLEN) {
    const SocketAddress &local = listener.m_local_address;
    ngtcp2_path_storage_init(&m_path, (const ngtcp2_sockaddr *) local.c_sockaddr(), local.c_socklen(),
            (const ngtcp2_sockaddr *) remote.c_sockaddr(), remote.c_socklen(), nullptr);
}

QuicSession::~QuicSession() {
    for (const Uint8Vector &cid : m_cids) {
        m_listener.unregister_cid({cid.data(), cid.size()});
    }
    if (m_conn != nullptr) {
        ngtcp2_conn_del(m_conn);
    }
}

ErrString QuicSession::init(const ngtcp2_pkt_hd &hd) {
    if (m_timer == nullptr) {
        return "Failed to create timer event";
    }

    ngtcp2_cid scid{};
    scid.datalen = QUIC_SCID_LEN;
    if (1 != RAND_bytes(scid.data, scid.datalen)) {
        return "Failed to generate connection ID";
    }

    ngtcp2_callbacks callbacks{};
    callbacks.recv_client_initial = ngtcp2_crypto_recv_client_initial_cb;
    callbacks.recv_crypto_data = ngtcp2_crypto_recv_crypto_data_cb;
    callbacks.encrypt = ngtcp2_crypto_encrypt_cb;
    callbacks.decrypt = ngtcp2_crypto_decrypt_cb;
    callbacks.hp_mask = ngtcp2_crypto_hp_mask_cb;
    callbacks.update_key = ngtcp2_crypto_update_key_cb;
    callbacks.delete_crypto_aead_ctx = ngtcp2_crypto_delete_crypto_aead_ctx_cb;
    callbacks.delete_crypto_cipher_ctx = ngtcp2_crypto_delete_crypto_cipher_ctx_cb;
    callbacks.get_path_challenge_data = ngtcp2_crypto_get_path_challenge_data_cb;
    callbacks.version_negotiation = ngtcp2_crypto_version_negotiation_cb;
    callbacks.rand = rand_cb;
    callbacks.get_new_connection_id = get_new_connection_id;
    callbacks.remove_connection_id = remove_connection_id;
    callbacks.handshake_completed = handshake_completed;
    callbacks.stream_open = stream_open;
    callbacks.recv_stream_data = recv_stream_data;
    callbacks.acked_stream_data_offset = acked_stream_data_offset;
    callbacks.stream_close = stream_close;
    callbacks.stream_reset = stream_reset;
    callbacks.extend_max_stream_data = extend_max_stream_data;

    const QuicListenerSettings &listener_settings = m_listener.m_settings;

    ngtcp2_settings settings;
    ngtcp2_settings_default(&settings);
    settings.initial_ts = get_tstamp();
    settings.max_tx_udp_payload_size = QUIC_MAX_PKTLEN;
    settings.cc_algo = NGTCP2_CC_ALGO_CUBIC;
    settings.token = hd.token;
    settings.tokenlen = hd.tokenlen;
    if (m_log.is_enabled(LOG_LEVEL_TRACE)) {
        settings.log_printf = log_printf;
    }

    ngtcp2_transport_params params;
    ngtcp2_transport_params_default(&params);
    params.initial_max_stream_data_bidi_local = listener_settings.max_stream_data;
    params.initial_max_stream_data_bidi_remote = listener_settings.max_stream_data;
    params.initial_max_stream_data_uni = 0;
    params.initial_max_data = 1 * 1024 * 1024;
    params.initial_max_streams_bidi = 100;
    params.initial_max_streams_uni = 0;
    params.max_idle_timeout = std::chrono::duration_cast<Nanos>(listener_settings.idle_timeout).count();
    params.active_connection_id_limit = 7;
    params.original_dcid = hd.dcid;
    params.original_dcid_present = 1;
    params.stateless_reset_token_present = 1;
    const auto &secret = m_listener.m_static_secret;
    if (0 != ngtcp2_crypto_generate_stateless_reset_token(
                params.stateless_reset_token, secret.data(), secret.size(), &scid)) {
        return "Failed to generate stateless reset token";
    }

    m_ssl.reset(SSL_new(m_listener.m_ssl_ctx.get()));
    if (m_ssl == nullptr) {
        return QRELAY_FMT("Failed to create SSL session: {}", ERR_error_string(ERR_get_error(), nullptr));
    }
    SSL_set_app_data(m_ssl.get(), &m_conn_ref);
    SSL_set_accept_state(m_ssl.get());
    SSL_set_quic_use_legacy_codepoint(m_ssl.get(), hd.version != NGTCP2_PROTO_VER_V1);

    if (int rv = ngtcp2_conn_server_new(&m_conn, &hd.scid, &scid, &m_path.path, hd.version, &callbacks, &settings,
                &params, nullptr, this);
            rv != 0) {
        m_conn = nullptr;
        return QRELAY_FMT("Failed to create QUIC connection: {}", ngtcp2_strerror(rv));
    }
    ngtcp2_conn_set_tls_native_handle(m_conn, m_ssl.get());

    add_cid(scid);
    add_cid(hd.dcid);

    log_sess(this, trace, "Accepted connection from {}", m_remote.str());
    return std::nullopt;
}

int QuicSession::on_read(const SocketAddress &remote, Uint8View data) {
    if (!(remote == m_remote)) {
        log_sess(this, dbg, "Peer address changed: {} -> {}", m_remote.str(), remote.str());
        m_remote = remote;
        const SocketAddress &local = m_listener.m_local_address;
        ngtcp2_path_storage_init(&m_path, (const ngtcp2_sockaddr *) local.c_sockaddr(), local.c_socklen(),
                (const ngtcp2_sockaddr *) remote.c_sockaddr(), remote.c_socklen(), nullptr);
    }

    ngtcp2_pkt_info pi{};
    if (int rv = ngtcp2_conn_read_pkt(m_conn, &m_path.path, &pi, data.data(), data.size(), get_tstamp()); rv != 0) {
        return handle_read_error(rv);
    }

    return on_write();
}

int QuicSession::handle_read_error(int rv) {
    log_sess(this, dbg, "ngtcp2_conn_read_pkt: {}", ngtcp2_strerror(rv));

    switch (rv) {
    case NGTCP2_ERR_DRAINING:
    case NGTCP2_ERR_DROP_CONN:
    case NGTCP2_ERR_RETRY:
        return NETWORK_ERR_DROP_CONN;
    default:
        break;
    }

    ngtcp2_ccerr ccerr;
    ngtcp2_ccerr_default(&ccerr);
    if (rv == NGTCP2_ERR_CRYPTO) {
        ngtcp2_ccerr_set_tls_alert(&ccerr, ngtcp2_conn_get_tls_alert(m_conn), nullptr, 0);
    } else {
        ngtcp2_ccerr_set_liberr(&ccerr, rv, nullptr, 0);
    }
    write_connection_close(ccerr);
    return NETWORK_ERR_CLOSED;
}

int QuicSession::on_write() {
    if (ngtcp2_conn_in_closing_period(m_conn) || ngtcp2_conn_in_draining_period(m_conn)) {
        return NETWORK_ERR_DROP_CONN;
    }

    if (int rv = write_streams(); rv != NETWORK_ERR_OK) {
        return rv;
    }

    schedule_timer();
    return NETWORK_ERR_OK;
}

int QuicSession::write_streams() {
    std::array<ngtcp2_vec, 2> vec{};
    ngtcp2_pkt_info pi{};
    ngtcp2_tstamp ts = get_tstamp();

    for (;;) {
        int64_t stream_id = -1;
        Stream *stream = nullptr;
        size_t vcnt = 0;
        uint32_t flags = NGTCP2_WRITE_STREAM_FLAG_MORE;

        while (!m_send_queue.empty()) {
            auto it = m_streams.find(m_send_queue.front());
            if (it == m_streams.end() || it->second.fin_sent) {
                m_send_queue.pop_front();
                continue;
            }
            stream_id = it->first;
            stream = &it->second;
            evbuffer *buf = stream->send_buf.get();
            size_t unsent = evbuffer_get_length(buf) - stream->read_position;
            int extents = 0;
            if (unsent > 0) {
                evbuffer_ptr position{};
                evbuffer_ptr_set(buf, &position, stream->read_position, EVBUFFER_PTR_SET);
                extents = evbuffer_peek(buf, unsent, &position, (evbuffer_iovec *) vec.data(), vec.size());
                vcnt = std::min((size_t) std::max(extents, 0), vec.size());
            }
            if (extents <= (int) vec.size()) {
                flags |= NGTCP2_WRITE_STREAM_FLAG_FIN;
            }
            break;
        }

        ngtcp2_ssize ndatalen = -1;
        ngtcp2_ssize nwrite = ngtcp2_conn_writev_stream(m_conn, nullptr, &pi, m_send_buf.data(), m_send_buf.size(),
                &ndatalen, flags, stream_id, vec.data(), vcnt, ts);

        if (stream != nullptr && ndatalen >= 0) {
            stream->read_position += ndatalen;
            if ((flags & NGTCP2_WRITE_STREAM_FLAG_FIN)
                    && stream->read_position == evbuffer_get_length(stream->send_buf.get())) {
                log_sess(this, trace, "Stream {}: sent FIN", stream_id);
                stream->fin_sent = true;
                m_send_queue.pop_front();
            }
        }

        if (nwrite < 0) {
            switch (nwrite) {
            case NGTCP2_ERR_STREAM_DATA_BLOCKED:
            case NGTCP2_ERR_STREAM_SHUT_WR:
                log_sess(this, trace, "Can't write stream {} because: {}", stream_id, ngtcp2_strerror(nwrite));
                m_send_queue.pop_front();
                continue;
            case NGTCP2_ERR_WRITE_MORE:
                continue;
            default:
                break;
            }
            log_sess(this, dbg, "ngtcp2_conn_writev_stream: {}", ngtcp2_strerror(nwrite));
            ngtcp2_ccerr ccerr;
            ngtcp2_ccerr_default(&ccerr);
            ngtcp2_ccerr_set_liberr(&ccerr, nwrite, nullptr, 0);
            write_connection_close(ccerr);
            return NETWORK_ERR_CLOSED;
        }

        if (nwrite == 0) {
            return NETWORK_ERR_OK;
        }

        m_listener.send_packet(m_remote, {m_send_buf.data(), (size_t) nwrite});
    }
}

int QuicSession::handle_expiry() {
    int rv = ngtcp2_conn_handle_expiry(m_conn, get_tstamp());
    if (rv == 0) {
        return NETWORK_ERR_OK;
    }
    if (rv == NGTCP2_ERR_IDLE_CLOSE) {
        log_sess(this, dbg, "Idle timeout");
        return NETWORK_ERR_DROP_CONN;
    }

    log_sess(this, dbg, "Handling expiry error: {}", ngtcp2_strerror(rv));
    ngtcp2_ccerr ccerr;
    ngtcp2_ccerr_default(&ccerr);
    ngtcp2_ccerr_set_liberr(&ccerr, rv, nullptr, 0);
    write_connection_close(ccerr);
    return NETWORK_ERR_CLOSED;
}

void QuicSession::schedule_timer() {
    ngtcp2_tstamp expiry_ns = ngtcp2_conn_get_expiry(m_conn);
    if (expiry_ns == UINT64_MAX) {
        evtimer_del(m_timer.get());
        return;
    }

    ngtcp2_tstamp now_ns = get_tstamp();
    timeval tv{};
    if (expiry_ns > now_ns) {
        tv = utils::duration_to_timeval(std::chrono::ceil<Micros>(Nanos(expiry_ns - now_ns)));
    }
    evtimer_add(m_timer.get(), &tv);
}

void QuicSession::timer_cb(evutil_socket_t, short, void *arg) {
    auto *self = (QuicSession *) arg;
    int rv = self->handle_expiry();
    if (rv == NETWORK_ERR_OK) {
        rv = self->on_write();
    }
    if (rv != NETWORK_ERR_OK) {
        self->m_listener.remove_session(self->m_id);
    }
}

void QuicSession::send_response(int64_t stream_id, std::optional<Uint8Vector> response) {
    auto it = m_streams.find(stream_id);
    if (it == m_streams.end()) {
        log_sess(this, dbg, "Stream {} is already closed", stream_id);
        return;
    }

    Stream &stream = it->second;
    if (response.has_value() && 0 != evbuffer_add(stream.send_buf.get(), response->data(), response->size())) {
        log_sess(this, dbg, "Stream {}: failed to buffer {} bytes", stream_id, response->size());
        shutdown_stream(stream_id, DOQ_INTERNAL_ERROR);
        return;
    }

    log_sess(this, trace, "Stream {}: {} bytes to send", stream_id, response.has_value() ? response->size() : 0);
    stream.fin_queued = true;
    m_send_queue.push_back(stream_id);
}

void QuicSession::shutdown_stream(int64_t stream_id, uint64_t app_error) {
    if (int rv = ngtcp2_conn_shutdown_stream(m_conn, 0, stream_id, app_error); rv != 0) {
        log_sess(this, dbg, "Stream {}: ngtcp2_conn_shutdown_stream: {}", stream_id, ngtcp2_strerror(rv));
    }
}

void QuicSession::close(uint64_t app_error, std::string_view reason) {
    log_sess(this, dbg, "Closing: {}", reason);
    ngtcp2_ccerr ccerr;
    ngtcp2_ccerr_default(&ccerr);
    ngtcp2_ccerr_set_application_error(&ccerr, app_error, (const uint8_t *) reason.data(), reason.size());
    write_connection_close(ccerr);
}

void QuicSession::write_connection_close(const ngtcp2_ccerr &ccerr) {
    if (ngtcp2_conn_in_closing_period(m_conn) || ngtcp2_conn_in_draining_period(m_conn)) {
        return;
    }

    ngtcp2_pkt_info pi{};
    ngtcp2_ssize n = ngtcp2_conn_write_connection_close(
            m_conn, nullptr, &pi, m_send_buf.data(), m_send_buf.size(), &ccerr, get_tstamp());
    if (n < 0) {
        log_sess(this, dbg, "ngtcp2_conn_write_connection_close: {}", ngtcp2_strerror(n));
        return;
    }
    if (n > 0) {
        m_listener.send_packet(m_remote, {m_send_buf.data(), (size_t) n});
    }
}

void QuicSession::add_cid(const ngtcp2_cid &cid) {
    Uint8Vector &stored = m_cids.emplace_back(cid.data, cid.data + cid.datalen);
    m_listener.register_cid({stored.data(), stored.size()}, this);
}

void QuicSession::drop_cid(const ngtcp2_cid &cid) {
    Uint8View view{cid.data, cid.datalen};
    auto it = std::find_if(m_cids.begin(), m_cids.end(), [view](const Uint8Vector &stored) {
        return view == Uint8View{stored.data(), stored.size()};
    });
    if (it != m_cids.end()) {
        m_listener.unregister_cid(view);
        m_cids.erase(it);
    }
}

ngtcp2_conn *QuicSession::get_conn(ngtcp2_crypto_conn_ref *conn_ref) {
    return ((QuicSession *) conn_ref->user_data)->m_conn;
}

void QuicSession::rand_cb(uint8_t *dest, size_t destlen, const ngtcp2_rand_ctx *) {
    if (1 != RAND_bytes(dest, destlen)) {
        static Logger rand_log{"QuicSession"};
        errlog(rand_log, "RAND_bytes failed: {}", ERR_error_string(ERR_get_error(), nullptr));
    }
}

int QuicSession::get_new_connection_id(ngtcp2_conn *, ngtcp2_cid *cid, uint8_t *token, size_t cidlen,
        void *user_data) {
    auto *self = (QuicSession *) user_data;

    if (1 != RAND_bytes(cid->data, cidlen)) {
        return NGTCP2_ERR_CALLBACK_FAILURE;
    }
    cid->datalen = cidlen;
    const auto &secret = self->m_listener.m_static_secret;
    if (0 != ngtcp2_crypto_generate_stateless_reset_token(token, secret.data(), secret.size(), cid)) {
        return NGTCP2_ERR_CALLBACK_FAILURE;
    }

    self->add_cid(*cid);
    return 0;
}

int QuicSession::remove_connection_id(ngtcp2_conn *, const ngtcp2_cid *cid, void *user_data) {
    auto *self = (QuicSession *) user_data;
    self->drop_cid(*cid);
    return 0;
}

int QuicSession::handshake_completed(ngtcp2_conn *, void *user_data) {
    auto *self = (QuicSession *) user_data;
    const uint8_t *buf = nullptr;
    unsigned len = 0;
    SSL_get0_alpn_selected(self->m_ssl.get(), &buf, &len);
    log_sess(self, dbg, "Handshake completed, ALPN: {}", std::string_view{(const char *) buf, len});
    return 0;
}

int QuicSession::stream_open(ngtcp2_conn *, int64_t stream_id, void *user_data) {
    auto *self = (QuicSession *) user_data;
    if (!ngtcp2_is_bidi_stream(stream_id)) {
        return 0;
    }
    log_sess(self, trace, "Stream {} opened", stream_id);
    self->m_streams.try_emplace(stream_id);
    return 0;
}

int QuicSession::recv_stream_data(ngtcp2_conn *conn, uint32_t flags, int64_t stream_id, uint64_t,
        const uint8_t *data, size_t datalen, void *user_data, void *) {
    auto *self = (QuicSession *) user_data;

    ngtcp2_conn_extend_max_offset(conn, datalen);

    auto it = self->m_streams.find(stream_id);
    if (it == self->m_streams.end() || it->second.dispatched) {
        return 0;
    }

    Stream &stream = it->second;
    if (!stream.recv_buf) {
        stream.recv_buf = self->m_listener.m_buffer_pool.acquire();
    }
    if (stream.received + datalen > stream.recv_buf.capacity()) {
        log_sess(self, dbg, "Stream {}: query exceeds {} bytes", stream_id, stream.recv_buf.capacity());
        self->m_listener.m_dropped_malformed.fetch_add(1, std::memory_order_relaxed);
        stream.recv_buf.reset();
        stream.dispatched = true;
        self->shutdown_stream(stream_id, DOQ_PROTOCOL_ERROR);
        return 0;
    }

    if (datalen > 0) {
        std::memcpy(stream.recv_buf.data() + stream.received, data, datalen);
        stream.received += datalen;
    }

    if (flags & NGTCP2_STREAM_DATA_FLAG_FIN) {
        log_sess(self, trace, "Stream {}: query of {} bytes", stream_id, stream.received);
        stream.dispatched = true;
        if (!self->m_listener.dispatch_exchange(*self, stream_id, std::move(stream.recv_buf), stream.received)) {
            self->shutdown_stream(stream_id, DOQ_INTERNAL_ERROR);
        }
    }

    return 0;
}

int QuicSession::acked_stream_data_offset(ngtcp2_conn *, int64_t stream_id, uint64_t, uint64_t datalen,
        void *user_data, void *) {
    auto *self = (QuicSession *) user_data;
    if (auto it = self->m_streams.find(stream_id); it != self->m_streams.end()) {
        Stream &stream = it->second;
        evbuffer_drain(stream.send_buf.get(), datalen);
        stream.read_position -= std::min<size_t>(datalen, stream.read_position);
    }
    return 0;
}

int QuicSession::stream_close(ngtcp2_conn *conn, uint32_t, int64_t stream_id, uint64_t app_error_code,
        void *user_data, void *) {
    auto *self = (QuicSession *) user_data;
    log_sess(self, trace, "Stream {} closed ({})", stream_id, app_error_code);

    self->m_streams.erase(stream_id);
    if (ngtcp2_is_bidi_stream(stream_id) && !ngtcp2_conn_is_local_stream(conn, stream_id)) {
        ngtcp2_conn_extend_max_streams_bidi(conn, 1);
    }
    return 0;
}

int QuicSession::stream_reset(ngtcp2_conn *, int64_t stream_id, uint64_t, uint64_t app_error_code,
        void *user_data, void *) {
    auto *self = (QuicSession *) user_data;
    log_sess(self, dbg, "Stream {} reset by peer ({})", stream_id, app_error_code);

    if (auto it = self->m_streams.find(stream_id); it != self->m_streams.end() && !it->second.dispatched) {
        it->second.recv_buf.reset();
        it->second.dispatched = true;
        self->shutdown_stream(stream_id, DOQ_REQUEST_CANCELLED);
    }
    return 0;
}

int QuicSession::extend_max_stream_data(ngtcp2_conn *, int64_t stream_id, uint64_t, void *user_data, void *) {
    auto *self = (QuicSession *) user_data;
    if (auto it = self->m_streams.find(stream_id);
            it != self->m_streams.end() && it->second.fin_queued && !it->second.fin_sent) {
        self->m_send_queue.push_back(stream_id);
    }
    return 0;
}

void QuicSession::log_printf(void *user_data, const char *format, ...) {
    auto *self = (QuicSession *) user_data;
    char buf[1024];
    va_list args;
    va_start(args, format);
    int n = vsnprintf(buf, sizeof(buf), format, args);
    va_end(args);
    if (n > 0) {
        log_sess(self, trace, "{}", std::string_view{buf, std::min((size_t) n, sizeof(buf) - 1)});
    }
}

} // namespace qrelay

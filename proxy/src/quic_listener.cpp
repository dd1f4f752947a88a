#include <array>
#include <exception>
#include <iterator>
#include <system_error>
#include <thread>
#include <utility>

#include <ngtcp2/ngtcp2_crypto_boringssl.h>
#include <openssl/rand.h>

#include "qrelay/common/utils.h"
#include "qrelay/proxy/quic_listener.h"

#include "quic_session.h"

namespace qrelay {

/** Upper bound of datagrams handled per readiness notification */
static constexpr int MAX_DATAGRAMS_PER_READ = 64;

const QuicListenerSettings &QuicListenerSettings::get_default() {
    static const QuicListenerSettings settings{};
    return settings;
}

void QuicListener::SessionControlImpl::abort_session(std::string_view reason) {
    if (m_aborted.exchange(true)) {
        return;
    }
    std::scoped_lock l(m_sink->mtx);
    if (QuicListener *listener = m_sink->listener; listener != nullptr) {
        listener->m_loop->submit([listener, session_id = m_session_id, reason = std::string(reason)]() {
            listener->abort_session(session_id, reason);
        });
    }
}

QuicListener::QuicListener(QuicListenerSettings settings, std::shared_ptr<DnsHandler> handler)
        : m_settings(std::move(settings))
        , m_handler(std::move(handler))
        , m_buffer_pool(m_settings.max_stream_data, m_settings.buffer_pool_size)
        , m_sink(std::make_shared<ResultSink>())
        , m_recv_buffer(UINT16_MAX) {
}

QuicListener::~QuicListener() {
    stop();
}

ErrString QuicListener::listen(PacketConnProvider &provider) {
    if (m_state.load() != QLS_IDLE) {
        return "Listener has already been started";
    }
    if (m_handler == nullptr) {
        return "DNS handler is not set";
    }
    if (!m_settings.tls.has_material()) {
        return "Cannot run a QUIC listener without TLS certificate and private key";
    }

    MakeSslCtxResult ctx = make_server_ssl_ctx(m_settings.tls);
    if (auto *e = std::get_if<std::string>(&ctx); e != nullptr) {
        return QRELAY_FMT("Failed to set up TLS: {}", *e);
    }
    m_ssl_ctx = std::move(std::get<SslCtxPtr>(ctx));
    if (0 != ngtcp2_crypto_boringssl_configure_server_context(m_ssl_ctx.get())) {
        return "Failed to configure TLS context for QUIC";
    }
    SSL_CTX_set_min_proto_version(m_ssl_ctx.get(), TLS1_3_VERSION);
    SSL_CTX_set_max_proto_version(m_ssl_ctx.get(), TLS1_3_VERSION);

    if (1 != RAND_bytes(m_static_secret.data(), m_static_secret.size())) {
        return "Failed to generate static secret";
    }

    PacketConnResult conn = provider.listen(m_settings.address);
    if (conn.error.has_value()) {
        return QRELAY_FMT("Failed to open packet connection: {}", conn.error.value());
    }
    m_conn = std::move(conn.conn);
    m_local_address = m_conn->local_address();
    m_context = {m_settings.server_name, QRELAY_FMT("{}://{}", provider.scheme(), m_settings.address)};

    auto fail = [this](std::string error) -> ErrString {
        m_read_event.reset();
        m_loop.reset();
        m_conn.reset();
        return error;
    };

    m_loop = EventLoop::create(false);
    if (m_loop == nullptr) {
        return fail("Failed to create event loop");
    }
    m_read_event.reset(event_new(m_loop->c_base(), m_conn->fd(), EV_READ | EV_PERSIST, on_read, this));
    if (m_read_event == nullptr || 0 != event_add(m_read_event.get(), nullptr)) {
        return fail("Failed to register read event");
    }

    {
        std::scoped_lock l(m_sink->mtx);
        m_sink->listener = this;
    }
    m_state = QLS_LISTENING;
    m_loop->start();

    infolog(m_log, "Listening on {} ({})", m_context.listener_address, m_local_address.str());
    return std::nullopt;
}

void QuicListener::stop() {
    if (State prev = m_state.exchange(QLS_CLOSED); prev != QLS_LISTENING) {
        return;
    }

    {
        std::scoped_lock l(m_sink->mtx);
        m_sink->listener = nullptr;
    }

    m_loop->submit([this] {
        for (auto &[id, session] : m_sessions) {
            session->close(DOQ_NO_ERROR, "Server is shutting down");
        }
        m_sessions.clear();
        m_read_event.reset();
    });
    m_loop->stop();
    m_loop->join();

    m_sessions.clear();
    m_read_event.reset();
    m_conn.reset();

    infolog(m_log, "Stopped listening on {}", m_context.listener_address);
}

SocketAddress QuicListener::local_address() const {
    return m_local_address;
}

void QuicListener::on_read(evutil_socket_t, short, void *arg) {
    auto *self = (QuicListener *) arg;

    for (int i = 0; i < MAX_DATAGRAMS_PER_READ; ++i) {
        PacketConn::ReadResult r = self->m_conn->read_from(self->m_recv_buffer.data(), self->m_recv_buffer.size());
        switch (r.status) {
        case PacketConn::PCR_DATAGRAM:
            self->handle_datagram(r.from, {self->m_recv_buffer.data(), r.length});
            continue;
        case PacketConn::PCR_DROPPED:
            tracelog(self->m_log, "{}: datagram dropped: {}", r.from.str(), r.error);
            continue;
        case PacketConn::PCR_ERROR:
            dbglog(self->m_log, "Failed to receive datagram: {}", r.error);
            break;
        case PacketConn::PCR_WOULD_BLOCK:
            break;
        }
        break;
    }
}

void QuicListener::handle_datagram(const SocketAddress &remote, Uint8View data) {
    ngtcp2_version_cid vc;
    if (int rv = ngtcp2_pkt_decode_version_cid(&vc, data.data(), data.size(), QUIC_SCID_LEN); rv != 0) {
        if (rv == NGTCP2_ERR_VERSION_NEGOTIATION) {
            send_version_negotiation(remote, {vc.scid, vc.scidlen}, {vc.dcid, vc.dcidlen});
        } else {
            tracelog(m_log, "{}: undecodable packet of {} bytes: {}", remote.str(), data.size(), ngtcp2_strerror(rv));
        }
        return;
    }

    QuicSession *session = nullptr;
    if (auto it = m_sessions_by_cid.find(std::string((const char *) vc.dcid, vc.dcidlen));
            it != m_sessions_by_cid.end()) {
        session = it->second;
    } else {
        ngtcp2_pkt_hd hd;
        if (int rv = ngtcp2_accept(&hd, data.data(), data.size()); rv != 0) {
            tracelog(m_log, "{}: unexpected packet: {}", remote.str(), ngtcp2_strerror(rv));
            return;
        }

        uint64_t id = ++m_next_session_id;
        std::unique_ptr<QuicSession> &slot = m_sessions[id];
        slot = std::make_unique<QuicSession>(*this, id, remote);
        if (ErrString error = slot->init(hd); error.has_value()) {
            dbglog(m_log, "{}: failed to accept session: {}", remote.str(), error.value());
            remove_session(id);
            return;
        }
        m_sessions_accepted.fetch_add(1, std::memory_order_relaxed);
        dbglog(m_log, "Session {} from {}", id, remote.str());
        session = slot.get();
    }

    if (session->on_read(remote, data) != QuicSession::NETWORK_ERR_OK) {
        remove_session(session->id());
    }
}

void QuicListener::send_version_negotiation(const SocketAddress &remote, Uint8View dcid, Uint8View scid) {
    static constexpr uint32_t SUPPORTED_VERSIONS[] = {NGTCP2_PROTO_VER_V1};

    uint8_t unused_random = 0;
    if (1 != RAND_bytes(&unused_random, 1)) {
        dbglog(m_log, "Failed to generate random byte for version negotiation");
        return;
    }

    std::array<uint8_t, QUIC_MAX_PKTLEN> buf{};
    ngtcp2_ssize n = ngtcp2_pkt_write_version_negotiation(buf.data(), buf.size(), unused_random, dcid.data(),
            dcid.size(), scid.data(), scid.size(), SUPPORTED_VERSIONS, std::size(SUPPORTED_VERSIONS));
    if (n < 0) {
        dbglog(m_log, "Failed to write version negotiation: {}", ngtcp2_strerror(n));
        return;
    }
    send_packet(remote, {buf.data(), (size_t) n});
}

void QuicListener::send_packet(const SocketAddress &remote, Uint8View data) {
    if (ErrString error = m_conn->write_to(data, remote); error.has_value()) {
        dbglog(m_log, "Failed to send {} bytes to {}: {}", data.size(), remote.str(), error.value());
    }
}

void QuicListener::register_cid(Uint8View cid, QuicSession *session) {
    m_sessions_by_cid[std::string((const char *) cid.data(), cid.size())] = session;
}

void QuicListener::unregister_cid(Uint8View cid) {
    m_sessions_by_cid.erase(std::string((const char *) cid.data(), cid.size()));
}

void QuicListener::remove_session(uint64_t id) {
    if (auto node = m_sessions.extract(id); !node.empty()) {
        dbglog(m_log, "Session {} removed", id);
    }
}

bool QuicListener::dispatch_exchange(QuicSession &session, int64_t stream_id, BufferPool::Handle buffer, size_t length) {
    if (session.control()->aborted()) {
        dbglog(m_log, "Session {} is being aborted, ignoring stream {}", session.id(), stream_id);
        return true;
    }

    if (size_t limit = m_settings.max_exchanges_in_flight; limit != 0 && m_sink->in_flight.load() >= limit) {
        dbglog(m_log, "Session {} stream {}: {} exchanges in flight already", session.id(), stream_id, limit);
        m_dropped_exchanges.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    m_sink->in_flight.fetch_add(1);
    try {
        std::thread([sink = m_sink, handler = m_handler, ctx = m_context, control = session.control(),
                            local = m_local_address, remote = session.remote_address(),
                            min_size = m_settings.min_message_size, session_id = session.id(), stream_id,
                            buffer = std::move(buffer), length]() mutable {
            static Logger worker_log{"QuicListener"};
            DoqExchange::Result result{DoqExchange::DE_HANDLER_FAILED, std::nullopt};
            try {
                result = DoqExchange::handle(
                        *handler, ctx, {buffer.data(), length}, *control, local, remote, min_size);
            } catch (const std::exception &e) {
                errlog(worker_log, "Session {} stream {}: exchange failed: {}", session_id, stream_id, e.what());
            } catch (...) {
                errlog(worker_log, "Session {} stream {}: exchange failed with unknown exception", session_id,
                        stream_id);
            }
            buffer.reset();

            std::scoped_lock l(sink->mtx);
            sink->in_flight.fetch_sub(1);
            if (QuicListener *listener = sink->listener; listener != nullptr) {
                listener->m_loop->submit([listener, session_id, stream_id, result = std::move(result)]() mutable {
                    listener->complete_exchange(session_id, stream_id, std::move(result));
                });
            }
        }).detach();
    } catch (const std::system_error &e) {
        m_sink->in_flight.fetch_sub(1);
        errlog(m_log, "Session {} stream {}: failed to start worker: {}", session.id(), stream_id, e.what());
        m_dropped_exchanges.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    m_exchanges.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void QuicListener::complete_exchange(uint64_t session_id, int64_t stream_id, DoqExchange::Result result) {
    count_outcome(result.outcome);
    if (m_state.load() != QLS_LISTENING) {
        return;
    }

    auto it = m_sessions.find(session_id);
    if (it == m_sessions.end()) {
        tracelog(m_log, "Session {} is gone, dropping result of stream {}", session_id, stream_id);
        return;
    }

    QuicSession &session = *it->second;
    if (result.outcome == DoqExchange::DE_HANDLER_FAILED) {
        session.shutdown_stream(stream_id, DOQ_INTERNAL_ERROR);
    } else {
        session.send_response(stream_id, std::move(result.response));
    }
    if (session.on_write() != QuicSession::NETWORK_ERR_OK) {
        remove_session(session_id);
    }
}

void QuicListener::abort_session(uint64_t session_id, std::string_view reason) {
    auto it = m_sessions.find(session_id);
    if (it == m_sessions.end()) {
        return;
    }

    warnlog(m_log, "Aborting session {} with {}: {}", session_id, it->second->remote_address().str(), reason);
    m_sessions_aborted.fetch_add(1, std::memory_order_relaxed);
    it->second->close(DOQ_PROTOCOL_ERROR, reason);
    remove_session(session_id);
}

void QuicListener::count_outcome(DoqExchange::Outcome outcome) {
    switch (outcome) {
    case DoqExchange::DE_SHORT_READ:
        m_dropped_short_reads.fetch_add(1, std::memory_order_relaxed);
        break;
    case DoqExchange::DE_MALFORMED:
        m_dropped_malformed.fetch_add(1, std::memory_order_relaxed);
        break;
    case DoqExchange::DE_HANDLER_FAILED:
        m_dropped_exchanges.fetch_add(1, std::memory_order_relaxed);
        break;
    case DoqExchange::DE_RESPONDED:
    case DoqExchange::DE_NO_RESPONSE:
    case DoqExchange::DE_FORBIDDEN_OPTION:
    case DoqExchange::DE_ENCODE_ERROR:
        break;
    }
}

} // namespace qrelay

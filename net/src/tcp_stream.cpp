#include <event2/buffer.h>

#include "qrelay/common/net_utils.h"
#include "qrelay/common/utils.h"
#include "qrelay/dns/dns_defs.h"
#include "qrelay/dns/framing.h"

#include "tcp_stream.h"

#define log_stream(s_, lvl_, fmt_, ...)                                                                                \
    lvl_##log((s_)->m_log, "[id={}] {}(): " fmt_, (s_)->m_id, __func__, ##__VA_ARGS__)

namespace qrelay {

static Socket::Error last_socket_error(bufferevent *bev, std::string_view fallback) {
    int err = evutil_socket_geterror(bufferevent_getfd(bev));
    if (err == 0) {
        return {-1, std::string(fallback)};
    }
    return {err, evutil_socket_error_to_string(err)};
}

TcpStream::TcpStream()
        : Socket(__func__, utils::TP_TCP)
        , m_deferred_arg(this) {
}

std::optional<evutil_socket_t> TcpStream::get_fd() const {
    if (m_bev == nullptr) {
        return std::nullopt;
    }
    return bufferevent_getfd(m_bev.get());
}

std::optional<Socket::Error> TcpStream::connect(ConnectParameters params) {
    log_stream(this, trace, "{}", params.peer.str());

    m_bev.reset(bufferevent_socket_new(params.loop->c_base(), -1,
            BEV_OPT_CLOSE_ON_FREE | BEV_OPT_THREADSAFE | BEV_OPT_DEFER_CALLBACKS | BEV_OPT_UNLOCK_CALLBACKS));
    if (m_bev == nullptr) {
        return Error{-1, "bufferevent_socket_new failed"};
    }

    if (params.timeout.has_value()) {
        m_connect_timeout = params.timeout;
        if (!m_read_timeout.has_value()) {
            m_read_timeout = params.timeout;
        }
        if (!this->apply_timeouts()) {
            return Error{-1, "Failed to set connect time out"};
        }
    }

    if (auto e = this->set_callbacks(params.callbacks); e.has_value()) {
        return e;
    }

    if (bufferevent_socket_connect(m_bev.get(), params.peer.c_sockaddr(), (int) params.peer.c_socklen()) != 0) {
        Error e = last_socket_error(m_bev.get(), "Failed to initiate connection");
        log_stream(this, dbg, "{}: {}", params.peer.str(), e.description);
        return e;
    }
    return std::nullopt;
}

std::optional<Socket::Error> TcpStream::send(Uint8View data) {
    log_stream(this, trace, "{} bytes", data.size());
    if (m_bev == nullptr) {
        return Error{-1, "Not connected"};
    }
    if (bufferevent_write(m_bev.get(), data.data(), data.size()) != 0) {
        return last_socket_error(m_bev.get(), "Failed to queue data");
    }
    return std::nullopt;
}

std::optional<Socket::Error> TcpStream::send_dns_packet(Uint8View data) {
    if (data.size() > MAX_DNS_MESSAGE_SIZE) {
        return Error{-1, QRELAY_FMT("Packet is too large: {}", data.size())};
    }
    Uint8Vector framed = dns::frame(data);
    return this->send({framed.data(), framed.size()});
}

std::optional<Socket::Error> TcpStream::set_callbacks(Callbacks cbx) {
    {
        std::scoped_lock l(m_callbacks.mtx);
        m_callbacks.val = cbx;
    }
    if (m_bev == nullptr) {
        return std::nullopt;
    }

    bufferevent_setcb(m_bev.get(), (cbx.on_read != nullptr) ? on_read : nullptr,
            (cbx.on_flushed != nullptr) ? on_write : nullptr, on_event, m_deferred_arg.token());
    int r = (cbx.on_read != nullptr) ? bufferevent_enable(m_bev.get(), EV_READ)
                                     : bufferevent_disable(m_bev.get(), EV_READ);
    if (r != 0) {
        return Error{-1, QRELAY_FMT("Failed to {} reading", (cbx.on_read != nullptr) ? "resume" : "pause")};
    }
    return std::nullopt;
}

bool TcpStream::set_timeout(Micros timeout) {
    log_stream(this, trace, "{}", timeout);
    m_read_timeout = timeout;
    return this->apply_timeouts();
}

bool TcpStream::set_write_timeout(std::optional<Micros> timeout) {
    if (timeout.has_value()) {
        log_stream(this, trace, "{}", timeout.value());
    }
    m_write_timeout = timeout;
    return this->apply_timeouts();
}

size_t TcpStream::pending_output() const {
    if (m_bev == nullptr) {
        return 0;
    }
    return evbuffer_get_length(bufferevent_get_output(m_bev.get()));
}

// `bufferevent_set_timeouts` replaces both, so the pair is always set together
bool TcpStream::apply_timeouts() {
    if (m_bev == nullptr) {
        return true;
    }
    std::optional<Micros> read = m_connected ? m_read_timeout : std::nullopt;
    std::optional<Micros> write = m_connected ? m_write_timeout : m_connect_timeout;
    timeval read_tv = utils::duration_to_timeval(read.value_or(Micros{0}));
    timeval write_tv = utils::duration_to_timeval(write.value_or(Micros{0}));
    int r = bufferevent_set_timeouts(
            m_bev.get(), read.has_value() ? &read_tv : nullptr, write.has_value() ? &write_tv : nullptr);
    return r == 0;
}

Socket::Callbacks TcpStream::get_callbacks() {
    std::scoped_lock l(m_callbacks.mtx);
    return m_callbacks.val;
}

void TcpStream::notify_close(std::optional<Error> error) {
    if (Callbacks cbx = this->get_callbacks(); cbx.on_close != nullptr) {
        cbx.on_close(cbx.arg, std::move(error));
    }
}

void TcpStream::on_event(bufferevent *bev, short what, void *arg) {
    auto *self = DeferredArg::resolve<TcpStream>(arg);
    if (self == nullptr) {
        return;
    }

    if (what & BEV_EVENT_CONNECTED) {
        log_stream(self, trace, "Connected");
        // Reads get the connect time out until `set_timeout`, writes are unbounded until `set_write_timeout`
        self->m_connected = true;
        if (!self->apply_timeouts()) {
            self->notify_close(Error{-1, "Failed to set read time out"});
            return;
        }
        if (Callbacks cbx = self->get_callbacks(); cbx.on_connected != nullptr) {
            cbx.on_connected(cbx.arg);
        }
    } else if (what & BEV_EVENT_TIMEOUT) {
        log_stream(self, trace, "Timed out while {}",
                (what & BEV_EVENT_READING) ? "reading" : (self->m_connected ? "writing" : "connecting"));
        int err = utils::QRELAY_ETIMEDOUT;
        self->notify_close(Error{err, evutil_socket_error_to_string(err)});
    } else if (what & BEV_EVENT_ERROR) {
        Error error = last_socket_error(bev, "Connection failed");
        log_stream(self, trace, "{} ({})", error.description, error.code);
        self->notify_close(std::move(error));
    } else if (what & BEV_EVENT_EOF) {
        log_stream(self, trace, "EOF");
        self->notify_close(std::nullopt);
    } else {
        log_stream(self, dbg, "Unexpected event: {:#x}", what);
    }
}

void TcpStream::on_read(bufferevent *bev, void *arg) {
    auto *self = DeferredArg::resolve<TcpStream>(arg);
    if (self == nullptr) {
        return;
    }

    evbuffer *input = bufferevent_get_input(bev);
    size_t length = evbuffer_get_length(input);
    if (length == 0) {
        return;
    }
    // DNS replies are small, a contiguous copy is cheaper than walking the chain
    Uint8Vector chunk(length);
    if (evbuffer_remove(input, chunk.data(), length) != (int) length) {
        self->notify_close(Error{-1, "Failed to drain input buffer"});
        return;
    }
    log_stream(self, trace, "{} bytes", length);
    if (Callbacks cbx = self->get_callbacks(); cbx.on_read != nullptr) {
        cbx.on_read(cbx.arg, {chunk.data(), chunk.size()});
    }
}

void TcpStream::on_write(bufferevent *, void *arg) {
    auto *self = DeferredArg::resolve<TcpStream>(arg);
    if (self == nullptr) {
        return;
    }
    log_stream(self, trace, "Output flushed");
    if (Callbacks cbx = self->get_callbacks(); cbx.on_flushed != nullptr) {
        cbx.on_flushed(cbx.arg);
    }
}

} // namespace qrelay

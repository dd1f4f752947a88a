#include <sys/socket.h>

#include "qrelay/common/net_utils.h"
#include "qrelay/common/utils.h"

#include "udp_socket.h"

#define log_sock(s_, lvl_, fmt_, ...)                                                                                  \
    lvl_##log((s_)->m_log, "[id={}] {}(): " fmt_, (s_)->m_id, __func__, ##__VA_ARGS__)

namespace qrelay {

// Any datagram fits, oversized replies are rejected by the connection layer
static constexpr size_t MAX_DATAGRAM_SIZE = 65535;

static Socket::Error errno_error() {
    int err = evutil_socket_geterror(-1);
    return {err, evutil_socket_error_to_string(err)};
}

UdpSocket::UdpSocket()
        : Socket(__func__, utils::TP_UDP)
        , m_deferred_arg(this) {
}

UdpSocket::~UdpSocket() {
    // The event must be removed from the base before its descriptor is closed
    m_read_event.reset();
    if (m_fd != EVUTIL_INVALID_SOCKET) {
        evutil_closesocket(m_fd);
    }
}

std::optional<evutil_socket_t> UdpSocket::get_fd() const {
    if (m_fd == EVUTIL_INVALID_SOCKET) {
        return std::nullopt;
    }
    return m_fd;
}

std::optional<Socket::Error> UdpSocket::connect(ConnectParameters params) {
    log_sock(this, trace, "{}", params.peer.str());

    m_fd = ::socket(params.peer.c_sockaddr()->sa_family, SOCK_DGRAM, 0);
    if (m_fd == EVUTIL_INVALID_SOCKET) {
        return errno_error();
    }
    if (evutil_make_socket_nonblocking(m_fd) != 0 || evutil_make_socket_closeonexec(m_fd) != 0
            || ::connect(m_fd, params.peer.c_sockaddr(), params.peer.c_socklen()) != 0) {
        Error e = errno_error();
        log_sock(this, dbg, "{}: {}", params.peer.str(), e.description);
        return e;
    }

    m_read_event.reset(event_new(params.loop->c_base(), m_fd, EV_READ | EV_PERSIST, on_event, m_deferred_arg.token()));
    if (m_read_event == nullptr) {
        return Error{-1, "event_new failed"};
    }
    m_datagram.resize(MAX_DATAGRAM_SIZE);
    m_timeout = params.timeout;
    if (auto e = this->set_callbacks(params.callbacks); e.has_value()) {
        return e;
    }

    // Nothing to wait for, report the connection from the loop like the stream sockets do
    params.loop->submit([token = m_deferred_arg.token()]() {
        if (auto *self = DeferredArg::resolve<UdpSocket>(token); self != nullptr) {
            if (Callbacks cbx = self->get_callbacks(); cbx.on_connected != nullptr) {
                cbx.on_connected(cbx.arg);
            }
        }
    });
    return std::nullopt;
}

std::optional<Socket::Error> UdpSocket::send(Uint8View data) {
    log_sock(this, trace, "{} bytes", data.size());
    if (m_fd == EVUTIL_INVALID_SOCKET) {
        return Error{-1, "Not connected"};
    }
    if (::send(m_fd, data.data(), data.size(), 0) < 0) {
        Error e = errno_error();
        // A dropped datagram looks like a lost one, the reader times out
        if (!utils::socket_error_is_eagain(e.code)) {
            return e;
        }
        log_sock(this, dbg, "Datagram dropped: {}", e.description);
    }
    return std::nullopt;
}

std::optional<Socket::Error> UdpSocket::send_dns_packet(Uint8View data) {
    return this->send(data);
}

bool UdpSocket::set_timeout(Micros timeout) {
    log_sock(this, trace, "{}", timeout);
    m_timeout = timeout;
    if (m_read_event == nullptr || !event_pending(m_read_event.get(), EV_READ, nullptr)) {
        return true;
    }
    return this->arm_read_event();
}

// Datagrams are written straight to the kernel, nothing is ever queued
bool UdpSocket::set_write_timeout(std::optional<Micros>) {
    return true;
}

size_t UdpSocket::pending_output() const {
    return 0;
}

std::optional<Socket::Error> UdpSocket::set_callbacks(Callbacks cbx) {
    {
        std::scoped_lock l(m_callbacks.mtx);
        m_callbacks.val = cbx;
    }
    if (m_read_event == nullptr) {
        return std::nullopt;
    }
    if (cbx.on_read == nullptr) {
        if (event_del(m_read_event.get()) != 0) {
            return Error{-1, "Failed to pause reading"};
        }
    } else if (!this->arm_read_event()) {
        return Error{-1, "Failed to resume reading"};
    }
    return std::nullopt;
}

Socket::Callbacks UdpSocket::get_callbacks() {
    std::scoped_lock l(m_callbacks.mtx);
    return m_callbacks.val;
}

bool UdpSocket::arm_read_event() {
    if (!m_timeout.has_value()) {
        return event_add(m_read_event.get(), nullptr) == 0;
    }
    timeval tv = utils::duration_to_timeval(m_timeout.value());
    return event_add(m_read_event.get(), &tv) == 0;
}

void UdpSocket::drain_datagrams() {
    for (;;) {
        ssize_t r = ::recv(m_fd, m_datagram.data(), m_datagram.size(), 0);
        if (r < 0) {
            Error e = errno_error();
            if (utils::socket_error_is_eagain(e.code)) {
                return;
            }
            log_sock(this, dbg, "{} ({})", e.description, e.code);
            if (Callbacks cbx = this->get_callbacks(); cbx.on_close != nullptr) {
                cbx.on_close(cbx.arg, std::move(e));
            }
            return;
        }
        log_sock(this, trace, "Datagram of {} bytes", r);
        Callbacks cbx = this->get_callbacks();
        if (cbx.on_read == nullptr) {
            // Reading was paused by the previous chunk handler, leave the rest in the socket
            return;
        }
        cbx.on_read(cbx.arg, {m_datagram.data(), (size_t) r});
    }
}

void UdpSocket::on_event(evutil_socket_t, short what, void *arg) {
    auto *self = DeferredArg::resolve<UdpSocket>(arg);
    if (self == nullptr) {
        return;
    }

    if (what & EV_READ) {
        self->drain_datagrams();
    } else if (what & EV_TIMEOUT) {
        log_sock(self, trace, "Timed out");
        int err = utils::QRELAY_ETIMEDOUT;
        if (Callbacks cbx = self->get_callbacks(); cbx.on_close != nullptr) {
            cbx.on_close(cbx.arg, Error{err, evutil_socket_error_to_string(err)});
        }
    }
}

} // namespace qrelay

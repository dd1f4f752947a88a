#include "qrelay/common/utils.h"
#include "qrelay/dns/dns_defs.h"
#include "qrelay/dns/framing.h"

#include "secured_socket.h"

#define log_sock(s_, lvl_, fmt_, ...)                                                                                  \
    lvl_##log((s_)->m_log, "[id={}] {}(): " fmt_, (s_)->m_id, __func__, ##__VA_ARGS__)

namespace qrelay {

enum SecuredSocket::State : int {
    SS_IDLE,
    SS_TCP_CONNECTING,
    SS_HANDSHAKING,
    SS_ESTABLISHED,
    SS_CLOSED,
};

SecuredSocket::SecuredSocket(
        SocketPtr underlying_socket, const CertificateVerifier *cert_verifier, TlsClientConfig config)
        : Socket(__func__, underlying_socket->get_protocol())
        , m_state(SS_IDLE)
        , m_underlying_socket(std::move(underlying_socket))
        , m_codec(cert_verifier)
        , m_config(std::move(config)) {
}

std::optional<evutil_socket_t> SecuredSocket::get_fd() const {
    return m_underlying_socket->get_fd();
}

std::optional<Socket::Error> SecuredSocket::connect(ConnectParameters params) {
    log_sock(this, trace, "{} name={}", params.peer.str(), m_config.server_name);

    if (auto err = this->set_callbacks(params.callbacks); err.has_value()) {
        return err;
    }
    m_state = SS_TCP_CONNECTING;
    return m_underlying_socket->connect(this->make_underlying_connect_parameters(params));
}

std::optional<Socket::Error> SecuredSocket::send(Uint8View data) {
    if (m_state != SS_ESTABLISHED) {
        return Error{-1, "TLS session is not established"};
    }
    if (auto err = m_codec.write(data); err.has_value()) {
        return Error{err->closed ? SOCKET_EOF : -1, std::move(err->description)};
    }
    return this->flush_outgoing();
}

std::optional<Socket::Error> SecuredSocket::send_dns_packet(Uint8View data) {
    if (data.size() > MAX_DNS_MESSAGE_SIZE) {
        return Error{-1, QRELAY_FMT("Packet is too large: {}", data.size())};
    }
    Uint8Vector framed = dns::frame(data);
    return this->send({framed.data(), framed.size()});
}

bool SecuredSocket::set_timeout(Micros timeout) {
    return m_underlying_socket->set_timeout(timeout);
}

bool SecuredSocket::set_write_timeout(std::optional<Micros> timeout) {
    return m_underlying_socket->set_write_timeout(timeout);
}

// Records are handed to the underlying socket as soon as they are sealed
size_t SecuredSocket::pending_output() const {
    return m_underlying_socket->pending_output();
}

std::optional<Socket::Error> SecuredSocket::set_callbacks(Callbacks cbx) {
    {
        std::scoped_lock l(m_callbacks.mtx);
        m_callbacks.val = cbx;
    }
    // The handshake needs the transport reads regardless of the caller
    if (m_state != SS_ESTABLISHED) {
        return std::nullopt;
    }
    return this->follow_read_interest(cbx);
}

std::optional<Socket::Error> SecuredSocket::follow_read_interest(const Callbacks &cbx) {
    return m_underlying_socket->set_callbacks({on_connected, (cbx.on_read != nullptr) ? on_read : nullptr, on_close,
            (void *) this, (cbx.on_flushed != nullptr) ? on_flushed : nullptr});
}

void SecuredSocket::on_connected(void *arg) {
    auto *self = (SecuredSocket *) arg;
    if (self->m_state != SS_TCP_CONNECTING) {
        log_sock(self, dbg, "Unexpected state: {}", (int) self->m_state);
        return;
    }

    self->m_state = SS_HANDSHAKING;
    if (auto err = self->m_codec.start(self->m_config); err.has_value()) {
        self->raise_close(Error{-1, std::move(err->description)});
        return;
    }
    if (auto err = self->flush_outgoing(); err.has_value()) {
        self->raise_close(std::move(err));
    }
}

void SecuredSocket::on_read(void *arg, Uint8View data) {
    auto *self = (SecuredSocket *) arg;
    if (self->m_state != SS_HANDSHAKING && self->m_state != SS_ESTABLISHED) {
        return;
    }

    if (auto err = self->m_codec.feed(data); err.has_value()) {
        self->raise_close(Error{-1, std::move(err->description)});
        return;
    }
    // Handshake replies and post-handshake messages
    if (auto err = self->flush_outgoing(); err.has_value()) {
        self->raise_close(std::move(err));
        return;
    }

    if (self->m_state == SS_HANDSHAKING) {
        if (!self->m_codec.handshake_done()) {
            return;
        }
        log_sock(self, trace, "Handshake with {} completed", self->m_config.server_name);
        self->m_state = SS_ESTABLISHED;
        Callbacks cbx = self->get_callbacks();
        if (auto err = self->follow_read_interest(cbx); err.has_value()) {
            self->raise_close(std::move(err));
            return;
        }
        if (cbx.on_connected != nullptr) {
            cbx.on_connected(cbx.arg);
        }
    }

    self->deliver_plaintext();
}

void SecuredSocket::on_close(void *arg, std::optional<Error> error) {
    auto *self = (SecuredSocket *) arg;
    if (error.has_value() && error->code == utils::QRELAY_ETIMEDOUT) {
        // The connection survives a read time out
        if (Callbacks cbx = self->get_callbacks(); cbx.on_close != nullptr) {
            cbx.on_close(cbx.arg, std::move(error));
        }
        return;
    }
    self->raise_close(std::move(error));
}

void SecuredSocket::on_flushed(void *arg) {
    auto *self = (SecuredSocket *) arg;
    if (self->m_state != SS_ESTABLISHED) {
        return;
    }
    if (Callbacks cbx = self->get_callbacks(); cbx.on_flushed != nullptr) {
        cbx.on_flushed(cbx.arg);
    }
}

void SecuredSocket::deliver_plaintext() {
    Callbacks cbx = this->get_callbacks();
    if (cbx.on_read == nullptr) {
        return;
    }

    TlsCodec::Output r = m_codec.read();
    if (auto *err = std::get_if<TlsCodec::Error>(&r); err != nullptr) {
        this->raise_close(err->closed ? std::nullopt : std::make_optional(Error{-1, std::move(err->description)}));
        return;
    }
    if (const auto &plain = std::get<Uint8Vector>(r); !plain.empty()) {
        cbx.on_read(cbx.arg, {plain.data(), plain.size()});
    }
}

void SecuredSocket::raise_close(std::optional<Error> error) {
    if (m_state == SS_CLOSED) {
        return;
    }
    m_state = SS_CLOSED;
    if (Callbacks cbx = this->get_callbacks(); cbx.on_close != nullptr) {
        cbx.on_close(cbx.arg, std::move(error));
    }
}

Socket::ConnectParameters SecuredSocket::make_underlying_connect_parameters(ConnectParameters &params) const {
    return {
            params.loop,
            params.peer,
            {on_connected, on_read, on_close, (void *) this},
            params.timeout,
    };
}

Socket::Callbacks SecuredSocket::get_callbacks() {
    std::scoped_lock l(m_callbacks.mtx);
    return m_callbacks.val;
}

std::optional<Socket::Error> SecuredSocket::flush_outgoing() {
    TlsCodec::Output r = m_codec.take_outgoing();
    if (auto *err = std::get_if<TlsCodec::Error>(&r); err != nullptr) {
        return Error{-1, std::move(err->description)};
    }
    const auto &cipher = std::get<Uint8Vector>(r);
    if (cipher.empty()) {
        return std::nullopt;
    }
    return m_underlying_socket->send({cipher.data(), cipher.size()});
}

} // namespace qrelay

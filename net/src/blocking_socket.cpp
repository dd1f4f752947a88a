#include <utility>

#include "qrelay/net/blocking_socket.h"

#define log_sock(s_, lvl_, fmt_, ...)                                                                                  \
    lvl_##log((s_)->m_log, "[id={}] {}(): " fmt_, (s_)->m_socket->get_id(), __func__, ##__VA_ARGS__)

namespace qrelay {

BlockingSocket::BlockingSocket(SocketPtr socket)
        : m_log(__func__)
        , m_socket(std::move(socket)) {
}

BlockingSocket::~BlockingSocket() {
    // The socket may schedule its teardown on the loop
    m_socket.reset();
    if (m_event_loop != nullptr) {
        m_event_loop->start();
        m_event_loop.reset();
    }
}

void BlockingSocket::run_until_stopped() {
    m_event_loop->start();
    m_event_loop->join();
}

std::optional<Socket::Error> BlockingSocket::connect(const SocketAddress &peer, std::optional<Micros> timeout) {
    log_sock(this, trace, "{}", peer.str());
    if (m_event_loop == nullptr) {
        return Socket::Error{-1, "Event loop is not available"};
    }

    Socket::ConnectParameters params{m_event_loop.get(), peer, {on_connected, nullptr, on_close, this}, timeout};
    if (auto e = m_socket->connect(params); e.has_value()) {
        return e;
    }
    this->run_until_stopped();

    if (auto e = std::exchange(m_pending_error, std::nullopt); e.has_value()) {
        m_closed = true;
        return e;
    }
    if (m_closed) {
        return Socket::Error{Socket::SOCKET_EOF, "Peer closed the connection while connecting"};
    }
    return std::nullopt;
}

std::optional<Socket::Error> BlockingSocket::send_dns_packet(Uint8View message, std::optional<Micros> timeout) {
    log_sock(this, trace, "{} bytes", message.size());
    if (m_closed) {
        return Socket::Error{Socket::SOCKET_EOF, "Connection is closed"};
    }
    if (!m_socket->set_write_timeout(timeout)) {
        return Socket::Error{-1, "Failed to arm the write time out"};
    }
    // The loop is not running, so the flush notification can't be missed
    if (auto e = m_socket->set_callbacks({on_connected, nullptr, on_close, this, on_flushed}); e.has_value()) {
        return e;
    }
    std::optional<Socket::Error> error = m_socket->send_dns_packet(message);
    if (!error.has_value() && m_socket->pending_output() > 0) {
        this->run_until_stopped();
        error = std::exchange(m_pending_error, std::nullopt);
        if (!error.has_value() && m_closed) {
            error = Socket::Error{Socket::SOCKET_EOF, "Connection closed while sending"};
        }
        if (error.has_value()) {
            log_sock(this, dbg, "Failed to flush {} bytes: {}", m_socket->pending_output(), error->description);
            m_closed = true;
        }
    }
    if (!m_closed) {
        if (auto e = m_socket->set_callbacks({on_connected, nullptr, on_close, this}); e.has_value()) {
            log_sock(this, dbg, "Failed to reset callbacks: {}", e->description);
        }
    }
    return error;
}

BlockingSocket::ReceiveResult BlockingSocket::receive_dns_packet(std::optional<Micros> timeout) {
    if (m_received.empty() && !m_closed) {
        if (auto e = m_socket->set_callbacks({on_connected, on_read, on_close, this}); e.has_value()) {
            return e.value();
        }
        if (timeout.has_value() && !m_socket->set_timeout(timeout.value())) {
            return Socket::Error{-1, "Failed to arm the read time out"};
        }

        this->run_until_stopped();

        if (!m_closed) {
            if (auto e = m_socket->set_callbacks({on_connected, nullptr, on_close, this}); e.has_value()) {
                log_sock(this, dbg, "Failed to pause reading: {}", e->description);
            }
        }
    }

    if (!m_received.empty()) {
        Uint8Vector message = std::move(m_received.front());
        m_received.pop_front();
        return message;
    }
    if (auto e = std::exchange(m_pending_error, std::nullopt); e.has_value()) {
        return e.value();
    }
    return Socket::Error{Socket::SOCKET_EOF,
            m_stream_buffer.pending() > 0 ? "Connection closed in the middle of a message" : "Connection closed by peer"};
}

void BlockingSocket::take_chunk(Uint8View data) {
    if (m_socket->get_protocol() == utils::TP_UDP) {
        m_received.emplace_back(data.begin(), data.end());
        return;
    }
    while (!data.empty()) {
        data = m_stream_buffer.store(data);
        if (auto message = m_stream_buffer.extract_packet(); message.has_value()) {
            m_received.emplace_back(std::move(message.value()));
        }
    }
}

void BlockingSocket::on_connected(void *arg) {
    auto *self = (BlockingSocket *) arg;
    log_sock(self, trace, "Connected");
    self->m_event_loop->stop();
}

void BlockingSocket::on_read(void *arg, Uint8View data) {
    auto *self = (BlockingSocket *) arg;
    log_sock(self, trace, "{} bytes", data.size());
    self->take_chunk(data);
    if (!self->m_received.empty()) {
        self->m_event_loop->stop();
    }
}

void BlockingSocket::on_close(void *arg, std::optional<Socket::Error> error) {
    auto *self = (BlockingSocket *) arg;
    if (!error.has_value()) {
        log_sock(self, trace, "Closed by peer");
        self->m_closed = true;
    } else {
        log_sock(self, trace, "{} ({})", error->description, error->code);
        self->m_closed = error->code != utils::QRELAY_ETIMEDOUT;
        self->m_pending_error = std::move(error);
    }
    self->m_event_loop->stop();
}

void BlockingSocket::on_flushed(void *arg) {
    auto *self = (BlockingSocket *) arg;
    log_sock(self, trace, "Flushed");
    self->m_event_loop->stop();
}

} // namespace qrelay

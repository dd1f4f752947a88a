#pragma once

#include <deque>
#include <optional>
#include <variant>

#include "qrelay/common/event_loop.h"
#include "qrelay/common/logger.h"
#include "qrelay/net/socket.h"
#include "qrelay/net/tcp_dns_buffer.h"

namespace qrelay {

/**
 * Exchanges whole DNS messages over a `Socket` synchronously.
 * Each call drives a private event loop until the operation completes.
 * Stream replies are reassembled, messages that arrive back to back are queued
 * and handed out by the following `receive_dns_packet` calls.
 */
class BlockingSocket {
public:
    using ReceiveResult = std::variant<Uint8Vector, Socket::Error>;

    explicit BlockingSocket(SocketPtr socket);
    ~BlockingSocket();

    BlockingSocket(const BlockingSocket &) = delete;
    BlockingSocket &operator=(const BlockingSocket &) = delete;
    BlockingSocket(BlockingSocket &&) = delete;
    BlockingSocket &operator=(BlockingSocket &&) = delete;

    /**
     * @return some error if the connection (TLS handshake included) failed or timed out
     */
    [[nodiscard]] std::optional<Socket::Error> connect(const SocketAddress &peer, std::optional<Micros> timeout);

    /**
     * Send a message and wait until it is written out.
     * A time out gives `QRELAY_ETIMEDOUT` and closes the socket, since the peer may have
     * got a part of the message.
     */
    [[nodiscard]] std::optional<Socket::Error> send_dns_packet(Uint8View message, std::optional<Micros> timeout);

    /**
     * Wait for the next message.
     * A graceful close before a complete message gives `Socket::SOCKET_EOF`.
     * A time out gives `QRELAY_ETIMEDOUT` and keeps the socket usable.
     */
    [[nodiscard]] ReceiveResult receive_dns_packet(std::optional<Micros> timeout);

    explicit operator bool() const noexcept {
        return m_event_loop != nullptr;
    }

private:
    Logger m_log;
    EventLoopPtr m_event_loop = EventLoop::create(false);
    SocketPtr m_socket;
    TcpDnsBuffer m_stream_buffer;
    std::deque<Uint8Vector> m_received;
    std::optional<Socket::Error> m_pending_error;
    bool m_closed = false;

    void run_until_stopped();
    void take_chunk(Uint8View data);
    static void on_connected(void *arg);
    static void on_read(void *arg, Uint8View data);
    static void on_close(void *arg, std::optional<Socket::Error> error);
    static void on_flushed(void *arg);
};

} // namespace qrelay

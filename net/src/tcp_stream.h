#pragma once

#include <optional>

#include <event2/bufferevent.h>

#include "qrelay/common/deferred_arg.h"
#include "qrelay/common/defs.h"
#include "qrelay/net/socket.h"

namespace qrelay {

/**
 * TCP connection on a libevent bufferevent.
 * The connect time out is applied as the write time out until the connection is established.
 * Afterwards the read time out only runs while the reading is enabled, and the write time out
 * only while there is output pending.
 */
class TcpStream : public Socket {
public:
    TcpStream();
    ~TcpStream() override = default;

    TcpStream(TcpStream &&) = delete;
    TcpStream &operator=(TcpStream &&) = delete;
    TcpStream(const TcpStream &) = delete;
    TcpStream &operator=(const TcpStream &) = delete;

private:
    UniquePtr<bufferevent, &bufferevent_free> m_bev;
    WithMtx<Callbacks> m_callbacks;
    std::optional<Micros> m_connect_timeout;
    std::optional<Micros> m_read_timeout;
    std::optional<Micros> m_write_timeout;
    bool m_connected = false;
    DeferredArg::Guard m_deferred_arg;

    [[nodiscard]] std::optional<evutil_socket_t> get_fd() const override;
    [[nodiscard]] std::optional<Error> connect(ConnectParameters params) override;
    [[nodiscard]] std::optional<Error> send(Uint8View data) override;
    [[nodiscard]] std::optional<Error> send_dns_packet(Uint8View data) override;
    [[nodiscard]] bool set_timeout(Micros timeout) override;
    [[nodiscard]] bool set_write_timeout(std::optional<Micros> timeout) override;
    [[nodiscard]] size_t pending_output() const override;
    [[nodiscard]] std::optional<Error> set_callbacks(Callbacks cbx) override;

    Callbacks get_callbacks();
    void notify_close(std::optional<Error> error);
    bool apply_timeouts();

    static void on_event(bufferevent *bev, short what, void *arg);
    static void on_read(bufferevent *bev, void *arg);
    static void on_write(bufferevent *bev, void *arg);
};

} // namespace qrelay

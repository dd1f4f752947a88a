#pragma once

#include <optional>

#include <event2/event.h>

#include "qrelay/common/deferred_arg.h"
#include "qrelay/common/defs.h"
#include "qrelay/net/socket.h"

namespace qrelay {

/**
 * Connected datagram socket. Every datagram is delivered as a separate `on_read` chunk.
 */
class UdpSocket : public Socket {
public:
    UdpSocket();
    ~UdpSocket() override;

    UdpSocket(UdpSocket &&) = delete;
    UdpSocket &operator=(UdpSocket &&) = delete;
    UdpSocket(const UdpSocket &) = delete;
    UdpSocket &operator=(const UdpSocket &) = delete;

private:
    evutil_socket_t m_fd = EVUTIL_INVALID_SOCKET;
    UniquePtr<event, &event_free> m_read_event;
    WithMtx<Callbacks> m_callbacks;
    std::optional<Micros> m_timeout;
    Uint8Vector m_datagram;
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
    [[nodiscard]] bool arm_read_event();
    void drain_datagrams();

    static void on_event(evutil_socket_t fd, short what, void *arg);
};

} // namespace qrelay

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <event2/util.h>

#include "qrelay/common/defs.h"
#include "qrelay/common/event_loop.h"
#include "qrelay/common/logger.h"
#include "qrelay/common/net_utils.h"
#include "qrelay/common/socket_address.h"
#include "qrelay/common/utils.h"

namespace qrelay {

/**
 * Asynchronous connection to an upstream DNS server.
 * All the callbacks are raised from the event loop passed to `connect`.
 */
class Socket {
public:
    /** Error code of a graceful close by the peer before the expected data arrived */
    static constexpr int SOCKET_EOF = -2;

    struct Error {
        /** System error code if there is one, a negative value otherwise */
        int code;
        std::string description;
    };

    struct Callbacks {
        void (*on_connected)(void *arg);
        /** Null turns the read events off */
        void (*on_read)(void *arg, Uint8View data);
        /** `error` is none if the peer closed the connection gracefully */
        void (*on_close)(void *arg, std::optional<Error> error);
        void *arg;
        /** Raised once the queued output has been handed to the kernel, null if not interested */
        void (*on_flushed)(void *arg) = nullptr;
    };

    struct ConnectParameters {
        EventLoop *loop = nullptr;
        const SocketAddress &peer;
        Callbacks callbacks = {};
        /** Connect time out, also used for the reads if `set_timeout` is never called */
        std::optional<Micros> timeout;
    };

    virtual ~Socket() = default;

    Socket(Socket &&) = delete;
    Socket &operator=(Socket &&) = delete;
    Socket(const Socket &) = delete;
    Socket &operator=(const Socket &) = delete;

    [[nodiscard]] utils::TransportProtocol get_protocol() const {
        return m_protocol;
    }

    [[nodiscard]] size_t get_id() const {
        return m_id;
    }

    /** Descriptor of the connected socket, none before `connect` */
    [[nodiscard]] virtual std::optional<evutil_socket_t> get_fd() const = 0;

    /**
     * Start connecting to the peer. `on_connected` or `on_close` reports the outcome.
     * @return some error if the connection could not be initiated
     */
    [[nodiscard]] virtual std::optional<Error> connect(ConnectParameters params) = 0;

    /** Send raw bytes */
    [[nodiscard]] virtual std::optional<Error> send(Uint8View data) = 0;

    /**
     * Send one DNS message. Stream sockets prepend the 2-byte length.
     */
    [[nodiscard]] virtual std::optional<Error> send_dns_packet(Uint8View data) = 0;

    /**
     * Set the time out for the subsequent reads. Expiration raises `on_close`
     * with `QRELAY_ETIMEDOUT` and leaves the connection open.
     */
    [[nodiscard]] virtual bool set_timeout(Micros timeout) = 0;

    /**
     * Bound the time the queued output may wait for the peer, none removes the bound.
     * Expiration raises `on_close` with `QRELAY_ETIMEDOUT`, the unsent part of the output is lost.
     */
    [[nodiscard]] virtual bool set_write_timeout(std::optional<Micros> timeout) = 0;

    /** Number of bytes accepted by `send` but not yet written to the kernel */
    [[nodiscard]] virtual size_t pending_output() const = 0;

    [[nodiscard]] virtual std::optional<Error> set_callbacks(Callbacks cbx) = 0;

protected:
    Logger m_log;
    size_t m_id = 0;
    utils::TransportProtocol m_protocol;

    Socket(const std::string &logger_name, utils::TransportProtocol protocol);
};

using SocketPtr = std::unique_ptr<Socket>;

} // namespace qrelay

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <event2/util.h>

#include "qrelay/common/defs.h"
#include "qrelay/common/logger.h"
#include "qrelay/common/socket_address.h"
#include "qrelay/net/scion_address.h"
#include "qrelay/net/scion_packet.h"

namespace qrelay {

/**
 * Datagram endpoint a QUIC listener runs on. Used from one thread at a time.
 */
class PacketConn {
public:
    enum ReadStatus {
        /** A datagram is in the buffer */
        PCR_DATAGRAM,
        /** A datagram was consumed, but it carries nothing for the listener */
        PCR_DROPPED,
        /** Nothing to read */
        PCR_WOULD_BLOCK,
        PCR_ERROR,
    };

    struct ReadResult {
        ReadStatus status = PCR_ERROR;
        /** Payload length in the caller's buffer */
        size_t length = 0;
        /** Sender, the address to reply to with `write_to` */
        SocketAddress from;
        /** Why the datagram was dropped or the read failed */
        std::string error;
    };

    PacketConn() = default;
    virtual ~PacketConn() = default;

    PacketConn(const PacketConn &) = delete;
    PacketConn &operator=(const PacketConn &) = delete;
    PacketConn(PacketConn &&) = delete;
    PacketConn &operator=(PacketConn &&) = delete;

    /**
     * @return Descriptor to wait for readability on. Stays owned by the connection.
     */
    [[nodiscard]] virtual evutil_socket_t fd() const = 0;

    [[nodiscard]] virtual const SocketAddress &local_address() const = 0;

    /**
     * Read one datagram without blocking
     */
    virtual ReadResult read_from(uint8_t *buf, size_t size) = 0;

    /**
     * Send one datagram to a peer previously reported by `read_from`
     * @return some error if failed
     */
    virtual ErrString write_to(Uint8View data, const SocketAddress &to) = 0;
};

using PacketConnPtr = std::unique_ptr<PacketConn>;

struct PacketConnResult {
    PacketConnPtr conn;
    ErrString error;
};

/**
 * Source of the packet connection a QUIC listener runs on
 */
class PacketConnProvider {
public:
    PacketConnProvider() = default;
    virtual ~PacketConnProvider() = default;

    PacketConnProvider(const PacketConnProvider &) = delete;
    PacketConnProvider &operator=(const PacketConnProvider &) = delete;
    PacketConnProvider(PacketConnProvider &&) = delete;
    PacketConnProvider &operator=(PacketConnProvider &&) = delete;

    /**
     * Open a packet connection bound to `address`
     */
    virtual PacketConnResult listen(std::string_view address) = 0;

    /**
     * @return The scheme the listener address is reported with, e.g. `quic`
     */
    [[nodiscard]] virtual std::string_view scheme() const = 0;
};

/**
 * Non-blocking UDP socket
 */
class UdpPacketConn : public PacketConn {
public:
    /**
     * @param fd bound non-blocking socket, closed by the connection
     */
    UdpPacketConn(evutil_socket_t fd, SocketAddress local_address);
    ~UdpPacketConn() override;

    UdpPacketConn(const UdpPacketConn &) = delete;
    UdpPacketConn &operator=(const UdpPacketConn &) = delete;
    UdpPacketConn(UdpPacketConn &&) = delete;
    UdpPacketConn &operator=(UdpPacketConn &&) = delete;

    [[nodiscard]] evutil_socket_t fd() const override {
        return m_fd;
    }

    [[nodiscard]] const SocketAddress &local_address() const override {
        return m_local_address;
    }

    ReadResult read_from(uint8_t *buf, size_t size) override;
    ErrString write_to(Uint8View data, const SocketAddress &to) override;

private:
    evutil_socket_t m_fd;
    SocketAddress m_local_address;
};

/**
 * Plain UDP: the address is `IP:port`
 */
class UdpPacketConnProvider : public PacketConnProvider {
public:
    PacketConnResult listen(std::string_view address) override;

    [[nodiscard]] std::string_view scheme() const override {
        return "quic";
    }
};

/**
 * Path handling of a SCION end host: turns the path a datagram arrived on into the path of the reply
 */
class ScionPathLayer {
public:
    ScionPathLayer() = default;
    virtual ~ScionPathLayer() = default;

    ScionPathLayer(const ScionPathLayer &) = delete;
    ScionPathLayer &operator=(const ScionPathLayer &) = delete;
    ScionPathLayer(ScionPathLayer &&) = delete;
    ScionPathLayer &operator=(ScionPathLayer &&) = delete;

    /**
     * @return none if the path can't be reversed, the datagram is dropped then
     */
    virtual std::optional<ScionPath> reverse(const ScionPath &path) = 0;
};

/**
 * Intra-AS only: the empty path is its own reverse, anything else is refused
 */
class EmptyScionPathLayer : public ScionPathLayer {
public:
    std::optional<ScionPath> reverse(const ScionPath &path) override;
};

/**
 * SCION/UDP on top of an underlay packet connection.
 * Incoming SCION packets addressed to the local SCION address are unwrapped, everything else is dropped.
 * Replies take the reversed path of the last datagram from the same peer and go out through the
 * underlay host the datagram came from. Peers are told apart by their host address and port.
 */
class ScionPacketConn : public PacketConn {
public:
    ScionPacketConn(PacketConnPtr underlay, ScionAddress local, std::shared_ptr<ScionPathLayer> path_layer);
    ~ScionPacketConn() override = default;

    ScionPacketConn(const ScionPacketConn &) = delete;
    ScionPacketConn &operator=(const ScionPacketConn &) = delete;
    ScionPacketConn(ScionPacketConn &&) = delete;
    ScionPacketConn &operator=(ScionPacketConn &&) = delete;

    [[nodiscard]] evutil_socket_t fd() const override {
        return m_underlay->fd();
    }

    [[nodiscard]] const SocketAddress &local_address() const override {
        return m_underlay->local_address();
    }

    [[nodiscard]] const ScionAddress &scion_address() const {
        return m_local;
    }

    ReadResult read_from(uint8_t *buf, size_t size) override;
    ErrString write_to(Uint8View data, const SocketAddress &to) override;

private:
    struct Route {
        /** The peer and our address as the peer sees it */
        ScionUdpHeader reply_header;
        /** Underlay hop the last datagram came from */
        SocketAddress next_hop;
    };

    Logger m_log{"ScionPacketConn"};
    PacketConnPtr m_underlay;
    ScionAddress m_local;
    std::shared_ptr<ScionPathLayer> m_path_layer;
    HashMap<std::string, Route> m_routes;
    Uint8Vector m_packet;
};

/**
 * SCION: the address is `ISD-AS,IP:port`. The SCION/UDP port is the port of the underlay socket.
 */
class ScionPacketConnProvider : public PacketConnProvider {
public:
    /**
     * @param path_layer reverses the paths of incoming datagrams
     */
    explicit ScionPacketConnProvider(
            std::shared_ptr<ScionPathLayer> path_layer = std::make_shared<EmptyScionPathLayer>());

    PacketConnResult listen(std::string_view address) override;

    [[nodiscard]] std::string_view scheme() const override {
        return "squic";
    }

private:
    std::shared_ptr<ScionPathLayer> m_path_layer;
};

} // namespace qrelay

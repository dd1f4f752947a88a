#include <cstring>
#include <utility>
#include <variant>

#include <sys/socket.h>

#include <event2/util.h>

#include "qrelay/common/net_utils.h"
#include "qrelay/common/utils.h"
#include "qrelay/proxy/packet_conn_provider.h"

namespace qrelay {

static Logger g_log{"PacketConnProvider"};

/** Upper bound of the peers a SCION connection remembers reply routes for */
static constexpr size_t MAX_SCION_ROUTES = 4096;

static PacketConnResult bind_udp(const SocketAddress &address) {
    evutil_socket_t fd = ::socket(address.c_sockaddr()->sa_family, SOCK_DGRAM, 0);
    if (fd == EVUTIL_INVALID_SOCKET) {
        int err = evutil_socket_geterror(fd);
        return {nullptr, QRELAY_FMT("Failed to create socket: {} ({})", evutil_socket_error_to_string(err), err)};
    }

    auto fail = [fd](std::string_view what) -> PacketConnResult {
        int err = evutil_socket_geterror(fd);
        evutil_closesocket(fd);
        return {nullptr, QRELAY_FMT("{}: {} ({})", what, evutil_socket_error_to_string(err), err)};
    };

    if (0 != evutil_make_listen_socket_reuseable(fd)) {
        return fail("Failed to set SO_REUSEADDR");
    }
    if (0 != evutil_make_listen_socket_reuseable_port(fd)) {
        return fail("Failed to set SO_REUSEPORT");
    }
    if (0 != ::bind(fd, address.c_sockaddr(), address.c_socklen())) {
        return fail(QRELAY_FMT("Failed to bind to {}", address.str()));
    }
    if (0 != evutil_make_socket_nonblocking(fd)) {
        return fail("Failed to make socket non-blocking");
    }
    if (0 != evutil_make_socket_closeonexec(fd)) {
        return fail("Failed to set close-on-exec");
    }

    std::optional<SocketAddress> bound = utils::get_local_address(fd);
    if (!bound.has_value()) {
        return fail("Failed to get local address");
    }

    dbglog(g_log, "Bound packet socket {} to {}", fd, bound->str());
    return {std::make_unique<UdpPacketConn>(fd, bound.value()), std::nullopt};
}

UdpPacketConn::UdpPacketConn(evutil_socket_t fd, SocketAddress local_address)
        : m_fd(fd)
        , m_local_address(std::move(local_address)) {
}

UdpPacketConn::~UdpPacketConn() {
    evutil_closesocket(m_fd);
}

PacketConn::ReadResult UdpPacketConn::read_from(uint8_t *buf, size_t size) {
    sockaddr_storage from{};
    socklen_t from_len = sizeof(from);
    ssize_t r = ::recvfrom(m_fd, buf, size, 0, (sockaddr *) &from, &from_len);
    if (r < 0) {
        int err = evutil_socket_geterror(m_fd);
        if (utils::socket_error_is_eagain(err)) {
            return {PCR_WOULD_BLOCK};
        }
        return {PCR_ERROR, 0, {}, QRELAY_FMT("{} ({})", evutil_socket_error_to_string(err), err)};
    }
    return {PCR_DATAGRAM, (size_t) r, SocketAddress((sockaddr *) &from), {}};
}

ErrString UdpPacketConn::write_to(Uint8View data, const SocketAddress &to) {
    if (ssize_t r = ::sendto(m_fd, data.data(), data.size(), 0, to.c_sockaddr(), to.c_socklen()); r < 0) {
        int err = evutil_socket_geterror(m_fd);
        return QRELAY_FMT("{} ({})", evutil_socket_error_to_string(err), err);
    }
    return std::nullopt;
}

PacketConnResult UdpPacketConnProvider::listen(std::string_view address) {
    SocketAddress addr = utils::str_to_socket_address(address);
    if (!addr.valid()) {
        return {nullptr, QRELAY_FMT("Invalid listen address: {}", address)};
    }
    return bind_udp(addr);
}

std::optional<ScionPath> EmptyScionPathLayer::reverse(const ScionPath &path) {
    if (path.type != SPT_EMPTY) {
        return std::nullopt;
    }
    return path;
}

ScionPacketConn::ScionPacketConn(
        PacketConnPtr underlay, ScionAddress local, std::shared_ptr<ScionPathLayer> path_layer)
        : m_underlay(std::move(underlay))
        , m_local(std::move(local))
        , m_path_layer(std::move(path_layer))
        , m_packet(UINT16_MAX) {
}

PacketConn::ReadResult ScionPacketConn::read_from(uint8_t *buf, size_t size) {
    ReadResult r = m_underlay->read_from(m_packet.data(), m_packet.size());
    if (r.status != PCR_DATAGRAM) {
        return r;
    }

    ScionDecodeResult decoded = decode_scion_udp({m_packet.data(), r.length});
    if (auto *e = std::get_if<std::string>(&decoded); e != nullptr) {
        return {PCR_DROPPED, 0, r.from, std::move(*e)};
    }
    const ScionUdpPacket &packet = std::get<ScionUdpPacket>(decoded);
    const ScionAddress &dst = packet.header.dst;
    if (dst.isd != m_local.isd || dst.as != m_local.as || dst.host.port() != m_local.host.port()) {
        return {PCR_DROPPED, 0, r.from, QRELAY_FMT("Addressed to {}", dst.str())};
    }
    if (packet.payload.size() > size) {
        return {PCR_DROPPED, 0, r.from, QRELAY_FMT("Payload of {} bytes does not fit", packet.payload.size())};
    }
    std::optional<ScionPath> reply_path = m_path_layer->reverse(packet.header.path);
    if (!reply_path.has_value()) {
        return {PCR_DROPPED, 0, r.from, QRELAY_FMT("Can't reverse path of type {}", packet.header.path.type)};
    }

    const SocketAddress &peer = packet.header.src.host;
    std::string key = peer.str();
    auto it = m_routes.find(key);
    if (it == m_routes.end()) {
        if (m_routes.size() >= MAX_SCION_ROUTES) {
            m_routes.erase(m_routes.begin());
        }
        tracelog(m_log, "New peer {} via {}", packet.header.src.str(), r.from.str());
        it = m_routes.emplace(std::move(key), Route{}).first;
    }
    it->second.reply_header = {dst, packet.header.src, std::move(reply_path.value())};
    it->second.next_hop = r.from;

    std::memcpy(buf, packet.payload.data(), packet.payload.size());
    return {PCR_DATAGRAM, packet.payload.size(), peer, {}};
}

ErrString ScionPacketConn::write_to(Uint8View data, const SocketAddress &to) {
    auto it = m_routes.find(to.str());
    if (it == m_routes.end()) {
        return QRELAY_FMT("No SCION route to {}", to.str());
    }
    ScionEncodeResult encoded = encode_scion_udp(it->second.reply_header, data);
    if (auto *e = std::get_if<std::string>(&encoded); e != nullptr) {
        return std::move(*e);
    }
    const Uint8Vector &packet = std::get<Uint8Vector>(encoded);
    return m_underlay->write_to({packet.data(), packet.size()}, it->second.next_hop);
}

ScionPacketConnProvider::ScionPacketConnProvider(std::shared_ptr<ScionPathLayer> path_layer)
        : m_path_layer(std::move(path_layer)) {
}

PacketConnResult ScionPacketConnProvider::listen(std::string_view address) {
    std::optional<ScionAddress> addr = parse_scion_address(address);
    if (!addr.has_value()) {
        return {nullptr, QRELAY_FMT("Invalid SCION listen address: {}", address)};
    }
    if (m_path_layer == nullptr) {
        return {nullptr, "SCION path layer is not set"};
    }
    PacketConnResult underlay = bind_udp(addr->host);
    if (underlay.error.has_value()) {
        return underlay;
    }
    ScionAddress local{addr->isd, addr->as, underlay.conn->local_address()};
    infolog(g_log, "SCION packet connection for {} is on underlay {}", local.ia_str(), local.host.str());
    return {std::make_unique<ScionPacketConn>(std::move(underlay.conn), std::move(local), m_path_layer),
            std::nullopt};
}

} // namespace qrelay

#include <cstring>

#include <netinet/in.h>

#include "qrelay/common/utils.h"
#include "qrelay/net/scion_packet.h"

namespace qrelay {

static constexpr uint8_t SCION_VERSION = 0;
static constexpr size_t COMMON_HEADER_SIZE = 12;
static constexpr size_t IA_SIZE = 8;
static constexpr size_t UDP_HEADER_SIZE = 8;
static constexpr uint8_t NEXT_HDR_UDP = 17;
// `HdrLen` counts 4-byte lines
static constexpr size_t LINE_SIZE = 4;
static constexpr size_t MAX_HEADER_SIZE = UINT8_MAX * LINE_SIZE;
// Non-zero flow ID for all the datagrams of the listener
static constexpr uint32_t FLOW_ID = 1;

// Host address type/length codes: type 0 is IP, the length code is `bytes / 4 - 1`
static constexpr uint8_t HOST_IPV4 = 0x0;
static constexpr uint8_t HOST_IPV6 = 0x3;

static uint16_t get_u16(const uint8_t *p) {
    return (uint16_t) ((p[0] << 8) | p[1]);
}

static void put_u16(Uint8Vector &out, uint16_t v) {
    out.push_back((uint8_t) (v >> 8));
    out.push_back((uint8_t) (v & 0xff));
}

static void put_ia(Uint8Vector &out, const ScionAddress &addr) {
    put_u16(out, addr.isd);
    for (int shift = 40; shift >= 0; shift -= 8) {
        out.push_back((uint8_t) ((addr.as >> shift) & 0xff));
    }
}

static void get_ia(const uint8_t *p, ScionAddress &addr) {
    addr.isd = get_u16(p);
    addr.as = 0;
    for (size_t i = 2; i < IA_SIZE; ++i) {
        addr.as = (addr.as << 8) | p[i];
    }
}

static Uint8View host_bytes(const SocketAddress &addr) {
    if (addr.is_ipv4()) {
        const auto *sin = (const sockaddr_in *) addr.c_sockaddr();
        return {(const uint8_t *) &sin->sin_addr, sizeof(sin->sin_addr)};
    }
    if (addr.is_ipv6()) {
        const auto *sin6 = (const sockaddr_in6 *) addr.c_sockaddr();
        return {(const uint8_t *) &sin6->sin6_addr, sizeof(sin6->sin6_addr)};
    }
    return {};
}

static SocketAddress make_host(Uint8View bytes, uint16_t port) {
    sockaddr_storage ss{};
    if (bytes.size() == sizeof(in_addr)) {
        auto *sin = (sockaddr_in *) &ss;
        sin->sin_family = AF_INET;
        sin->sin_port = htons(port);
        std::memcpy(&sin->sin_addr, bytes.data(), bytes.size());
    } else {
        auto *sin6 = (sockaddr_in6 *) &ss;
        sin6->sin6_family = AF_INET6;
        sin6->sin6_port = htons(port);
        std::memcpy(&sin6->sin6_addr, bytes.data(), bytes.size());
    }
    return SocketAddress((const sockaddr *) &ss);
}

/**
 * RFC 1071 sum over a byte stream split into arbitrary pieces
 */
class InternetChecksum {
public:
    void add(Uint8View data) {
        for (uint8_t b : data) {
            m_sum += m_odd ? b : ((uint64_t) b << 8);
            m_odd = !m_odd;
        }
    }

    [[nodiscard]] uint16_t value() const {
        uint64_t sum = m_sum;
        while (sum >> 16) {
            sum = (sum & 0xffff) + (sum >> 16);
        }
        return (uint16_t) ~sum;
    }

private:
    uint64_t m_sum = 0;
    bool m_odd = false;
};

// The pseudo header is the address header with the upper-layer length and protocol appended
static void add_pseudo_header(InternetChecksum &sum, Uint8View address_header, size_t l4_length) {
    sum.add(address_header);
    const uint8_t tail[] = {(uint8_t) (l4_length >> 24), (uint8_t) (l4_length >> 16), (uint8_t) (l4_length >> 8),
            (uint8_t) l4_length, 0, 0, 0, NEXT_HDR_UDP};
    sum.add({tail, sizeof(tail)});
}

ScionDecodeResult decode_scion_udp(Uint8View packet) {
    if (packet.size() < COMMON_HEADER_SIZE) {
        return QRELAY_FMT("Packet of {} bytes is shorter than the common header", packet.size());
    }
    const uint8_t *p = packet.data();
    if (uint8_t version = p[0] >> 4; version != SCION_VERSION) {
        return QRELAY_FMT("Unsupported SCION version: {}", version);
    }
    uint8_t next_hdr = p[4];
    size_t hdr_len = p[5] * LINE_SIZE;
    size_t payload_len = get_u16(p + 6);
    uint8_t path_type = p[8];
    uint8_t dt = (p[9] >> 6) & 0x3;
    uint8_t dl = (p[9] >> 4) & 0x3;
    uint8_t st = (p[9] >> 2) & 0x3;
    uint8_t sl = p[9] & 0x3;

    if (hdr_len + payload_len > packet.size()) {
        return QRELAY_FMT("Truncated packet: {} bytes, header says {}", packet.size(), hdr_len + payload_len);
    }
    if (dt != 0 || st != 0 || (dl != HOST_IPV4 && dl != HOST_IPV6) || (sl != HOST_IPV4 && sl != HOST_IPV6)) {
        return QRELAY_FMT("Unsupported host address types: dst {}/{} src {}/{}", dt, dl, st, sl);
    }
    size_t dst_len = (dl + 1) * LINE_SIZE;
    size_t src_len = (sl + 1) * LINE_SIZE;
    size_t addr_len = 2 * IA_SIZE + dst_len + src_len;
    if (COMMON_HEADER_SIZE + addr_len > hdr_len) {
        return QRELAY_FMT("Header length {} is too short for the address header", hdr_len);
    }
    Uint8View address_header = packet.substr(COMMON_HEADER_SIZE, addr_len);
    Uint8View path = packet.substr(COMMON_HEADER_SIZE + addr_len, hdr_len - COMMON_HEADER_SIZE - addr_len);
    if (path_type == SPT_EMPTY && !path.empty()) {
        return QRELAY_FMT("Empty path type with {} bytes of path", path.size());
    }

    if (next_hdr != NEXT_HDR_UDP) {
        return QRELAY_FMT("Not a SCION/UDP datagram: next header {}", next_hdr);
    }
    Uint8View l4 = packet.substr(hdr_len, payload_len);
    if (l4.size() < UDP_HEADER_SIZE) {
        return QRELAY_FMT("SCION/UDP datagram of {} bytes is shorter than its header", l4.size());
    }
    if (size_t udp_len = get_u16(l4.data() + 4); udp_len != l4.size()) {
        return QRELAY_FMT("SCION/UDP length {} does not match payload length {}", udp_len, l4.size());
    }

    InternetChecksum sum;
    add_pseudo_header(sum, address_header, l4.size());
    sum.add(l4);
    if (sum.value() != 0) {
        return std::string("SCION/UDP checksum mismatch");
    }

    const uint8_t *a = address_header.data();
    ScionUdpPacket result;
    get_ia(a, result.header.dst);
    get_ia(a + IA_SIZE, result.header.src);
    result.header.dst.host = make_host({a + 2 * IA_SIZE, dst_len}, get_u16(l4.data() + 2));
    result.header.src.host = make_host({a + 2 * IA_SIZE + dst_len, src_len}, get_u16(l4.data()));
    result.header.path.type = path_type;
    result.header.path.raw.assign(path.begin(), path.end());
    result.payload = l4.substr(UDP_HEADER_SIZE);
    return result;
}

ScionEncodeResult encode_scion_udp(const ScionUdpHeader &header, Uint8View payload) {
    Uint8View dst_host = host_bytes(header.dst.host);
    Uint8View src_host = host_bytes(header.src.host);
    if (dst_host.empty() || src_host.empty()) {
        return std::string("Host addresses must be IPv4 or IPv6");
    }
    if (header.path.raw.size() % LINE_SIZE != 0) {
        return QRELAY_FMT("Path length {} is not a multiple of {}", header.path.raw.size(), LINE_SIZE);
    }
    size_t addr_len = 2 * IA_SIZE + dst_host.size() + src_host.size();
    size_t hdr_len = COMMON_HEADER_SIZE + addr_len + header.path.raw.size();
    if (hdr_len > MAX_HEADER_SIZE) {
        return QRELAY_FMT("Header of {} bytes is too long", hdr_len);
    }
    size_t l4_len = UDP_HEADER_SIZE + payload.size();
    if (l4_len > UINT16_MAX) {
        return QRELAY_FMT("Payload of {} bytes is too large", payload.size());
    }

    Uint8Vector out;
    out.reserve(hdr_len + l4_len);
    out.push_back((uint8_t) (SCION_VERSION << 4));
    out.push_back((uint8_t) ((FLOW_ID >> 16) & 0xf));
    put_u16(out, (uint16_t) (FLOW_ID & 0xffff));
    out.push_back(NEXT_HDR_UDP);
    out.push_back((uint8_t) (hdr_len / LINE_SIZE));
    put_u16(out, (uint16_t) l4_len);
    out.push_back(header.path.type);
    uint8_t dl = header.dst.host.is_ipv4() ? HOST_IPV4 : HOST_IPV6;
    uint8_t sl = header.src.host.is_ipv4() ? HOST_IPV4 : HOST_IPV6;
    out.push_back((uint8_t) ((dl << 4) | sl));
    put_u16(out, 0);

    size_t addr_start = out.size();
    put_ia(out, header.dst);
    put_ia(out, header.src);
    out.insert(out.end(), dst_host.begin(), dst_host.end());
    out.insert(out.end(), src_host.begin(), src_host.end());
    out.insert(out.end(), header.path.raw.begin(), header.path.raw.end());

    size_t l4_start = out.size();
    put_u16(out, header.src.host.port());
    put_u16(out, header.dst.host.port());
    put_u16(out, (uint16_t) l4_len);
    put_u16(out, 0);
    out.insert(out.end(), payload.begin(), payload.end());

    InternetChecksum sum;
    add_pseudo_header(sum, {out.data() + addr_start, addr_len}, l4_len);
    sum.add({out.data() + l4_start, l4_len});
    uint16_t checksum = sum.value();
    // Zero would read as "no checksum"
    if (checksum == 0) {
        checksum = 0xffff;
    }
    out[l4_start + 6] = (uint8_t) (checksum >> 8);
    out[l4_start + 7] = (uint8_t) (checksum & 0xff);
    return out;
}

} // namespace qrelay

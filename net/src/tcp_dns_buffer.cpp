#include <algorithm>

#include "qrelay/dns/framing.h"
#include "qrelay/net/tcp_dns_buffer.h"

namespace qrelay {

size_t TcpDnsBuffer::expected_size() const {
    std::optional<uint16_t> length = dns::framed_length({m_buffer.data(), m_buffer.size()});
    return DNS_LENGTH_PREFIX_SIZE + length.value_or(0);
}

Uint8View TcpDnsBuffer::store(Uint8View data) {
    // First pass completes the prefix, the second one the payload it announces
    for (size_t wanted = expected_size() - m_buffer.size(); wanted > 0 && !data.empty();
            wanted = expected_size() - m_buffer.size()) {
        size_t n = std::min(wanted, data.size());
        m_buffer.insert(m_buffer.end(), data.begin(), data.begin() + n);
        data.remove_prefix(n);
    }
    return data;
}

std::optional<Uint8Vector> TcpDnsBuffer::extract_packet() {
    if (m_buffer.size() < DNS_LENGTH_PREFIX_SIZE || m_buffer.size() < expected_size()) {
        return std::nullopt;
    }
    Uint8Vector packet(m_buffer.begin() + DNS_LENGTH_PREFIX_SIZE, m_buffer.end());
    m_buffer.clear();
    return packet;
}

} // namespace qrelay

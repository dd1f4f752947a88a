#include <utility>

#include "qrelay/proxy/dns_handler.h"

namespace qrelay {

CapturingWriter::CapturingWriter(SocketAddress local, SocketAddress remote, utils::TransportProtocol protocol)
        : m_local(local)
        , m_remote(remote)
        , m_protocol(protocol) {
}

ErrString CapturingWriter::write_msg(ldns_pkt_ptr msg) {
    if (msg == nullptr) {
        return "Null message";
    }
    m_msgs.emplace_back(std::move(msg));
    return std::nullopt;
}

const ldns_pkt *CapturingWriter::msg() const {
    return m_msgs.empty() ? nullptr : m_msgs.front().get();
}

ldns_pkt_ptr CapturingWriter::release_msg() {
    if (m_msgs.empty()) {
        return nullptr;
    }
    return std::move(m_msgs.front());
}

} // namespace qrelay

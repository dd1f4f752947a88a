#include <atomic>

#include "qrelay/net/socket.h"

namespace qrelay {

static std::atomic_size_t next_socket_id = {0};

Socket::Socket(const std::string &logger_name, utils::TransportProtocol protocol)
        : m_log(logger_name)
        , m_id(next_socket_id.fetch_add(1, std::memory_order_relaxed))
        , m_protocol(protocol) {
}

} // namespace qrelay

#pragma once

#include "qrelay/common/socket_address.h"
#include "qrelay/common/utils.h"
#include "qrelay/dns/dns_defs.h"
#include "qrelay/proxy/dns_handler.h"

namespace qrelay {

/**
 * Client request as seen by the relay
 */
struct RequestState {
    /** The request. The relay temporarily rewrites its ID. */
    ldns_pkt_ptr request;
    /** Transport protocol the client used */
    utils::TransportProtocol protocol = utils::TP_UDP;
    /** UDP payload size the client advertised (512 without EDNS) */
    uint16_t udp_size = DEFAULT_UDP_PAYLOAD_SIZE;
    /** Client address */
    SocketAddress remote;

    /**
     * Build a state from what a DNS handler receives. The request is cloned.
     */
    static RequestState make(const ResponseWriter &writer, const ldns_pkt *request);
};

} // namespace qrelay

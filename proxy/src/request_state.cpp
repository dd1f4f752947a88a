#include "qrelay/dns/dns_utils.h"
#include "qrelay/proxy/request_state.h"

namespace qrelay {

RequestState RequestState::make(const ResponseWriter &writer, const ldns_pkt *request) {
    return {
            ldns_pkt_ptr{ldns_pkt_clone(request)},
            writer.protocol(),
            dns::advertised_udp_size(request),
            writer.remote_address(),
    };
}

} // namespace qrelay

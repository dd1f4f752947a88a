#include <utility>

#include "qrelay/dns/dns_utils.h"
#include "qrelay/proxy/forward_handler.h"

namespace qrelay {

ForwardHandler::ForwardHandler(std::shared_ptr<Relay> relay, RelayOptions options)
        : m_log(__func__)
        , m_relay(std::move(relay))
        , m_options(options) {
}

void ForwardHandler::serve_dns(const DnsContext &ctx, ResponseWriter &writer, const ldns_pkt *request) {
    RequestState state = RequestState::make(writer, request);
    if (state.request == nullptr) {
        errlog(m_log, "Failed to copy request from {}", writer.remote_address().str());
        return;
    }

    ConnectResult result = m_relay->connect(state, m_options);
    if (result.error.has_value() && result.error->code == DnsError::AE_CACHED_CONNECTION_CLOSED) {
        dbglog(m_log, "[{}] Cached connection to {} was stale, retrying on a new one", ldns_pkt_id(request),
                m_relay->settings().upstream_address);
        RelayOptions fresh = m_options;
        fresh.fresh_connection = true;
        result = m_relay->connect(state, fresh);
    }

    ldns_pkt_ptr response;
    if (result.error.has_value()) {
        warnlog(m_log, "[{}] {} {} via {}: {}", ldns_pkt_id(request), ctx.listener_address,
                dns::question_name(request), m_relay->settings().upstream_address, result.error->str());
        response = dns::make_servfail_response(request);
    } else {
        response = std::move(result.response);
    }

    if (response == nullptr) {
        errlog(m_log, "[{}] Failed to make a response", ldns_pkt_id(request));
        return;
    }
    if (auto e = writer.write_msg(std::move(response)); e.has_value()) {
        dbglog(m_log, "[{}] Failed to write response: {}", ldns_pkt_id(request), e.value());
    }
}

} // namespace qrelay

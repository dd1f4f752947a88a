#pragma once

#include <memory>

#include "qrelay/common/logger.h"
#include "qrelay/proxy/dns_handler.h"
#include "qrelay/proxy/relay.h"

namespace qrelay {

/**
 * DNS handler that forwards every query through a relay.
 * A failed exchange is answered with SERVFAIL.
 */
class ForwardHandler : public DnsHandler {
public:
    explicit ForwardHandler(std::shared_ptr<Relay> relay, RelayOptions options = {});
    ~ForwardHandler() override = default;

    void serve_dns(const DnsContext &ctx, ResponseWriter &writer, const ldns_pkt *request) override;

private:
    Logger m_log;
    std::shared_ptr<Relay> m_relay;
    RelayOptions m_options;
};

} // namespace qrelay

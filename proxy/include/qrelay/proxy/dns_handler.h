#pragma once

#include <memory>
#include <string>
#include <vector>

#include "qrelay/common/defs.h"
#include "qrelay/common/socket_address.h"
#include "qrelay/common/utils.h"
#include "qrelay/dns/dns_defs.h"

namespace qrelay {

/**
 * Identity of the server a query came through
 */
struct DnsContext {
    /** Server name the listener was configured for */
    std::string server_name;
    /** Listener address including its transport scheme, e.g. `quic://127.0.0.1:8853` */
    std::string listener_address;
};

/**
 * Sink for the response(s) of a DNS handler
 */
class ResponseWriter {
public:
    ResponseWriter() = default;
    virtual ~ResponseWriter() = default;

    ResponseWriter(const ResponseWriter &) = delete;
    ResponseWriter &operator=(const ResponseWriter &) = delete;
    ResponseWriter(ResponseWriter &&) = delete;
    ResponseWriter &operator=(ResponseWriter &&) = delete;

    /**
     * Write a response message
     * @return some error if failed
     */
    virtual ErrString write_msg(ldns_pkt_ptr msg) = 0;

    [[nodiscard]] virtual const SocketAddress &local_address() const = 0;
    [[nodiscard]] virtual const SocketAddress &remote_address() const = 0;

    /**
     * @return Transport protocol the client used
     */
    [[nodiscard]] virtual utils::TransportProtocol protocol() const = 0;
};

/**
 * Entry point of the DNS processing chain
 */
class DnsHandler {
public:
    DnsHandler() = default;
    virtual ~DnsHandler() = default;

    DnsHandler(const DnsHandler &) = delete;
    DnsHandler &operator=(const DnsHandler &) = delete;
    DnsHandler(DnsHandler &&) = delete;
    DnsHandler &operator=(DnsHandler &&) = delete;

    /**
     * Process a request. The response, if any, is written to `writer`.
     * May block the calling thread.
     */
    virtual void serve_dns(const DnsContext &ctx, ResponseWriter &writer, const ldns_pkt *request) = 0;
};

/**
 * Writer that records the messages instead of sending them anywhere
 */
class CapturingWriter : public ResponseWriter {
public:
    CapturingWriter(SocketAddress local, SocketAddress remote, utils::TransportProtocol protocol);
    ~CapturingWriter() override = default;

    ErrString write_msg(ldns_pkt_ptr msg) override;

    [[nodiscard]] const SocketAddress &local_address() const override {
        return m_local;
    }
    [[nodiscard]] const SocketAddress &remote_address() const override {
        return m_remote;
    }
    [[nodiscard]] utils::TransportProtocol protocol() const override {
        return m_protocol;
    }

    /**
     * @return The first written message, or null
     */
    [[nodiscard]] const ldns_pkt *msg() const;

    /**
     * Take ownership of the first written message
     */
    ldns_pkt_ptr release_msg();

    [[nodiscard]] const std::vector<ldns_pkt_ptr> &msgs() const {
        return m_msgs;
    }

private:
    SocketAddress m_local;
    SocketAddress m_remote;
    utils::TransportProtocol m_protocol;
    std::vector<ldns_pkt_ptr> m_msgs;
};

} // namespace qrelay

#pragma once

#include <optional>
#include <string_view>

#include "qrelay/common/defs.h"
#include "qrelay/common/socket_address.h"
#include "qrelay/dns/dns_defs.h"
#include "qrelay/proxy/dns_handler.h"

namespace qrelay {

/**
 * Session-level controls available to a stream handler
 */
class SessionControl {
public:
    SessionControl() = default;
    virtual ~SessionControl() = default;

    SessionControl(const SessionControl &) = delete;
    SessionControl &operator=(const SessionControl &) = delete;
    SessionControl(SessionControl &&) = delete;
    SessionControl &operator=(SessionControl &&) = delete;

    /**
     * Close the whole session with a protocol error. No more streams are accepted on it.
     * May be called from any thread.
     */
    virtual void abort_session(std::string_view reason) = 0;
};

/**
 * One DNS-over-QUIC query/response exchange carried by a single stream
 */
class DoqExchange {
public:
    enum Outcome {
        /** The response is ready to be written */
        DE_RESPONDED,
        /** The handler produced no response */
        DE_NO_RESPONSE,
        /** Fewer bytes than the smallest possible message */
        DE_SHORT_READ,
        /** Length prefix mismatch or undecodable message */
        DE_MALFORMED,
        /** The query carries the edns-tcp-keepalive option, the session has been aborted */
        DE_FORBIDDEN_OPTION,
        /** The response could not be encoded */
        DE_ENCODE_ERROR,
        /** The handler threw, the stream is reset with an internal error */
        DE_HANDLER_FAILED,
    };

    struct Result {
        Outcome outcome;
        /** Framed response, present only for `DE_RESPONDED` */
        std::optional<Uint8Vector> response;
    };

    /**
     * Handle the data read from a stream up to its FIN
     * @param handler DNS processing chain
     * @param ctx server identity passed to the handler
     * @param data stream data: the length-prefixed query
     * @param session the session the stream belongs to
     * @param local listener address
     * @param remote session peer address
     * @param min_message_size smallest acceptable read
     * @return see `Result`
     */
    static Result handle(DnsHandler &handler, const DnsContext &ctx, Uint8View data, SessionControl &session,
            const SocketAddress &local, const SocketAddress &remote, size_t min_message_size = MIN_DNS_PACKET_SIZE);
};

} // namespace qrelay

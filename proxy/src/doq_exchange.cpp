#include <utility>
#include <variant>

#include "qrelay/common/logger.h"
#include "qrelay/dns/dns_utils.h"
#include "qrelay/dns/framing.h"
#include "qrelay/proxy/doq_exchange.h"

namespace qrelay {

static Logger g_log{"DoqExchange"};

DoqExchange::Result DoqExchange::handle(DnsHandler &handler, const DnsContext &ctx, Uint8View data,
        SessionControl &session, const SocketAddress &local, const SocketAddress &remote, size_t min_message_size) {
    if (data.size() < min_message_size) {
        tracelog(g_log, "{}: ignoring read of {} bytes", remote.str(), data.size());
        return {DE_SHORT_READ, std::nullopt};
    }

    dns::UnframeResult unframed = dns::unframe(data);
    if (!unframed.ok) {
        dbglog(g_log, "{}: length prefix {} does not match {} payload bytes", remote.str(),
                dns::framed_length(data).value_or(0), data.size() - DNS_LENGTH_PREFIX_SIZE);
        return {DE_MALFORMED, std::nullopt};
    }

    dns::DecodeResult decoded = dns::decode_pkt(unframed.payload);
    if (auto *e = std::get_if<ExchangeError>(&decoded); e != nullptr) {
        dbglog(g_log, "{}: invalid query: {}", remote.str(), e->str());
        return {DE_MALFORMED, std::nullopt};
    }
    ldns_pkt_ptr request = std::move(std::get<ldns_pkt_ptr>(decoded));

    if (dns::has_edns_option(request.get(), EDNS_TCP_KEEPALIVE_OPTION)) {
        dbglog(g_log, "{}: [{}] query carries edns-tcp-keepalive, aborting session", remote.str(),
                ldns_pkt_id(request.get()));
        session.abort_session("edns-tcp-keepalive option is not allowed over QUIC");
        return {DE_FORBIDDEN_OPTION, std::nullopt};
    }

    CapturingWriter writer(local, remote, utils::TP_UDP);
    handler.serve_dns(ctx, writer, request.get());
    if (writer.msg() == nullptr) {
        tracelog(g_log, "{}: [{}] no response", remote.str(), ldns_pkt_id(request.get()));
        return {DE_NO_RESPONSE, std::nullopt};
    }

    dns::EncodeResult encoded = dns::encode_pkt(writer.msg());
    if (auto *e = std::get_if<ExchangeError>(&encoded); e != nullptr) {
        dbglog(g_log, "{}: [{}] failed to encode response: {}", remote.str(), ldns_pkt_id(request.get()), e->str());
        return {DE_ENCODE_ERROR, std::nullopt};
    }
    const Uint8Vector &wire = std::get<Uint8Vector>(encoded);
    if (wire.size() > MAX_DNS_MESSAGE_SIZE) {
        dbglog(g_log, "{}: [{}] response of {} bytes does not fit a frame", remote.str(),
                ldns_pkt_id(request.get()), wire.size());
        return {DE_ENCODE_ERROR, std::nullopt};
    }
    return {DE_RESPONDED, dns::frame({wire.data(), wire.size()})};
}

} // namespace qrelay

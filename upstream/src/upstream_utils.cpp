#include "qrelay/common/utils.h"
#include "qrelay/upstream/upstream_utils.h"

namespace qrelay {

static constexpr std::string_view SCHEME_SEPARATOR = "://";

std::string_view upstream_protocol_name(UpstreamProtocol protocol) {
    switch (protocol) {
    case UpstreamProtocol::UDP:
        return "udp";
    case UpstreamProtocol::TCP:
        return "tcp";
    case UpstreamProtocol::TCP_TLS:
        return "tcp-tls";
    }
    return "unknown";
}

std::pair<std::string_view, std::string_view> upstream_utils::split_scheme(std::string_view address) {
    size_t pos = address.find(SCHEME_SEPARATOR);
    if (pos == std::string_view::npos || pos == 0) {
        return {{}, address};
    }
    return {address.substr(0, pos), address.substr(pos + SCHEME_SEPARATOR.size())};
}

std::optional<UpstreamProtocol> upstream_utils::protocol_from_scheme(std::string_view scheme) {
    std::string lower = utils::to_lower(scheme);
    if (lower == "udp" || lower == "dns") {
        return UpstreamProtocol::UDP;
    }
    if (lower == "tcp") {
        return UpstreamProtocol::TCP;
    }
    if (lower == "tls") {
        return UpstreamProtocol::TCP_TLS;
    }
    return std::nullopt;
}

} // namespace qrelay

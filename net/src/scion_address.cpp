#include <charconv>
#include <vector>

#include "qrelay/common/net_utils.h"
#include "qrelay/common/utils.h"
#include "qrelay/net/scion_address.h"

namespace qrelay {

static constexpr uint64_t MAX_BGP_AS = UINT32_MAX;
static constexpr size_t AS_HEX_GROUPS = 3;
static constexpr size_t AS_HEX_GROUP_BITS = 16;

static std::optional<uint64_t> parse_as(std::string_view str) {
    if (str.find(':') == std::string_view::npos) {
        auto as = utils::to_integer<uint64_t>(str);
        if (!as.has_value() || as.value() > MAX_BGP_AS) {
            return std::nullopt;
        }
        return as;
    }

    std::vector<std::string_view> groups = utils::split_by(str, ':');
    if (groups.size() != AS_HEX_GROUPS) {
        return std::nullopt;
    }
    uint64_t as = 0;
    for (std::string_view group : groups) {
        if (group.empty() || group.size() > 4) {
            return std::nullopt;
        }
        uint16_t value = 0;
        auto [ptr, ec] = std::from_chars(group.data(), group.data() + group.size(), value, 16);
        if (ec != std::errc{} || ptr != group.data() + group.size()) {
            return std::nullopt;
        }
        as = (as << AS_HEX_GROUP_BITS) | value;
    }
    return as;
}

std::optional<ScionAddress> parse_scion_address(std::string_view address) {
    size_t comma = address.find(',');
    if (comma == std::string_view::npos) {
        return std::nullopt;
    }
    std::string_view ia = address.substr(0, comma);
    std::string_view host = address.substr(comma + 1);

    size_t dash = ia.find('-');
    if (dash == std::string_view::npos) {
        return std::nullopt;
    }
    auto isd = utils::to_integer<uint16_t>(ia.substr(0, dash));
    auto as = parse_as(ia.substr(dash + 1));
    if (!isd.has_value() || !as.has_value()) {
        return std::nullopt;
    }

    auto [host_part, port_part] = utils::split_host_port(host);
    if (port_part.empty()) {
        return std::nullopt;
    }
    SocketAddress underlay = utils::str_to_socket_address(host);
    if (!underlay.valid()) {
        return std::nullopt;
    }

    return ScionAddress{isd.value(), as.value(), underlay};
}

std::string ScionAddress::ia_str() const {
    if (as <= MAX_BGP_AS) {
        return QRELAY_FMT("{}-{}", isd, as);
    }
    return QRELAY_FMT("{}-{:x}:{:x}:{:x}", isd, (as >> 32) & 0xffff, (as >> 16) & 0xffff, as & 0xffff);
}

std::string ScionAddress::str() const {
    return QRELAY_FMT("{},{}", ia_str(), host.str());
}

} // namespace qrelay

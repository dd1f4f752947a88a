#include "qrelay/dns/dns_defs.h"
#include "qrelay/common/utils.h"

const char *qrelay::dns_error_to_string(DnsError code) {
    switch (code) {
    case DnsError::AE_DIAL_ERROR:
        return "Dial error";
    case DnsError::AE_CACHED_CONNECTION_CLOSED:
        return "Cached connection closed";
    case DnsError::AE_SOCKET_ERROR:
        return "Socket error";
    case DnsError::AE_TIMED_OUT:
        return "Timed out";
    case DnsError::AE_ENCODE_ERROR:
        return "Encode error";
    case DnsError::AE_DECODE_ERROR:
        return "Decode error";
    case DnsError::AE_INTERNAL_ERROR:
        return "Internal error";
    }
    return "Unknown error";
}

std::string qrelay::ExchangeError::str() const {
    if (description.empty()) {
        return dns_error_to_string(code);
    }
    return QRELAY_FMT("{}: {}", dns_error_to_string(code), description);
}

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "qrelay/common/defs.h"
#include "qrelay/common/logger.h"
#include "qrelay/net/socket_factory.h"
#include "qrelay/net/tls_config.h"
#include "qrelay/upstream/connection.h"

namespace qrelay {

/**
 * Establishes new connections to an upstream
 */
class Dialer {
public:
    Dialer() = default;
    virtual ~Dialer() = default;

    Dialer(const Dialer &) = delete;
    Dialer &operator=(const Dialer &) = delete;
    Dialer(Dialer &&) = delete;
    Dialer &operator=(Dialer &&) = delete;

    /**
     * Open a connection
     * @param address upstream address, with or without a scheme
     * @param protocol connection protocol
     * @param timeout dial deadline
     * @param tls TLS material, used only for `UpstreamProtocol::TCP_TLS`
     * @return the connection (`cached` is always false) or an error
     */
    virtual DialResult dial(std::string_view address, UpstreamProtocol protocol, Micros timeout,
                            const TlsClientConfig *tls) = 0;
};

/**
 * Dialer over the library sockets. Accepts numeric IP addresses only.
 */
class SocketDialer : public Dialer {
public:
    explicit SocketDialer(SocketFactory::Parameters parameters = {});
    ~SocketDialer() override = default;

    DialResult dial(std::string_view address, UpstreamProtocol protocol, Micros timeout,
                    const TlsClientConfig *tls) override;

private:
    Logger m_log;
    SocketFactory m_factory;
};

} // namespace qrelay

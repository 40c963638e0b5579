#pragma once

#include "proxyconn/transport/Transport.hpp"

#include <boost/asio/ssl/context.hpp>

#include <string>

namespace proxyconn::transport {

/**
 * HTTP/1.1 over a SOCKS5 tunnel, TLS on top for https:// targets. Each
 * exchange owns its io_context and sockets; one connection per attempt.
 */
class SocksHttpTransport final : public Transport {
public:
    struct Options {
        bool verifyPeer{false};
        std::string userAgent;
    };

    SocksHttpTransport();
    explicit SocksHttpTransport(Options options);

    Response exchange(const model::RequestDescription& request,
                      const proxy::ProxyEndpoint& proxy,
                      std::chrono::milliseconds timeout) override;

private:
    Options options_;
    boost::asio::ssl::context sslContext_;
};

} // namespace proxyconn::transport

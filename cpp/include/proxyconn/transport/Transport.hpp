#pragma once

#include "proxyconn/model/RequestDescription.hpp"
#include "proxyconn/proxy/ProxyEndpoint.hpp"
#include "proxyconn/transport/Response.hpp"

#include <chrono>

namespace proxyconn::transport {

/**
 * One request/response exchange tunneled through one proxy.
 * Implementations throw proxy::ProxyTimeoutError when the deadline passes and
 * proxy::ProxyTransportError for every other failure to complete the exchange.
 * Any HTTP status that arrives intact is a completed exchange.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual Response exchange(const model::RequestDescription& request,
                              const proxy::ProxyEndpoint& proxy,
                              std::chrono::milliseconds timeout) = 0;
};

} // namespace proxyconn::transport

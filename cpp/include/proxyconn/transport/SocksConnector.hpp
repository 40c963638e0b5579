#pragma once

#include "proxyconn/proxy/ProxyEndpoint.hpp"

#include <utility> // boost 1.74 asio/awaitable.hpp uses std::exchange without including it

#include <boost/asio/awaitable.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <cstdint>
#include <string>

namespace proxyconn::transport {

enum class ExchangeStage {
    resolving,
    connecting,
    greeting,
    authenticating,
    tunneling,
    tls_handshake,
    writing,
    reading,
};

const char* toString(ExchangeStage stage);

namespace socks {

constexpr std::uint8_t kVersion = 0x05;
constexpr std::uint8_t kMethodNoAuth = 0x00;
constexpr std::uint8_t kMethodUserPass = 0x02;
constexpr std::uint8_t kMethodNoAcceptable = 0xFF;
constexpr std::uint8_t kUserPassVersion = 0x01;
constexpr std::uint8_t kCommandConnect = 0x01;
constexpr std::uint8_t kAddressIpv4 = 0x01;
constexpr std::uint8_t kAddressDomain = 0x03;
constexpr std::uint8_t kAddressIpv6 = 0x04;

const char* replyMessage(std::uint8_t reply);

} // namespace socks

/**
 * Runs the SOCKS5 negotiation on a stream already connected to the proxy
 * and asks it to CONNECT to host:port (sent as a domain name, resolved by
 * the proxy). Credentials, when the endpoint has any, use RFC 1929.
 *
 * Throws proxy::ProxyTransportError for refusals and malformed replies;
 * socket errors propagate as boost::system::system_error. `stage` tracks
 * the step in progress for the caller's error classification.
 */
boost::asio::awaitable<void> socksConnect(boost::beast::tcp_stream& stream,
                                          const proxy::ProxyEndpoint& proxy,
                                          const std::string& host,
                                          std::uint16_t port,
                                          ExchangeStage& stage);

} // namespace proxyconn::transport

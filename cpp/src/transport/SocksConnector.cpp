#include "proxyconn/transport/SocksConnector.hpp"

#include "proxyconn/proxy/ProxyErrors.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <vector>

namespace proxyconn::transport {
namespace {

using Type = proxy::ProxyTransportError::Type;

void appendCounted(std::vector<std::uint8_t>& out, const std::string& value) {
    out.push_back(static_cast<std::uint8_t>(value.size()));
    out.insert(out.end(), value.begin(), value.end());
}

} // namespace

const char* toString(ExchangeStage stage) {
    switch (stage) {
    case ExchangeStage::resolving: return "resolving proxy address";
    case ExchangeStage::connecting: return "connecting to proxy";
    case ExchangeStage::greeting: return "negotiating SOCKS method";
    case ExchangeStage::authenticating: return "authenticating with proxy";
    case ExchangeStage::tunneling: return "opening tunnel";
    case ExchangeStage::tls_handshake: return "performing TLS handshake";
    case ExchangeStage::writing: return "sending request";
    case ExchangeStage::reading: return "reading response";
    }
    return "exchanging";
}

namespace socks {

const char* replyMessage(std::uint8_t reply) {
    switch (reply) {
    case 0x00: return "succeeded";
    case 0x01: return "general SOCKS server failure";
    case 0x02: return "connection not allowed by ruleset";
    case 0x03: return "network unreachable";
    case 0x04: return "host unreachable";
    case 0x05: return "connection refused";
    case 0x06: return "TTL expired";
    case 0x07: return "command not supported";
    case 0x08: return "address type not supported";
    default: return "unassigned reply code";
    }
}

} // namespace socks

boost::asio::awaitable<void> socksConnect(boost::beast::tcp_stream& stream,
                                          const proxy::ProxyEndpoint& proxy,
                                          const std::string& host,
                                          std::uint16_t port,
                                          ExchangeStage& stage) {
    namespace net = boost::asio;

    if (host.empty() || host.size() > 255) {
        throw proxy::ProxyTransportError(Type::protocol_error, proxy, "target host name cannot be sent over SOCKS5: " + host);
    }

    stage = ExchangeStage::greeting;
    std::vector<std::uint8_t> greeting{socks::kVersion};
    if (proxy.hasCredentials()) {
        greeting.insert(greeting.end(), {2, socks::kMethodNoAuth, socks::kMethodUserPass});
    } else {
        greeting.insert(greeting.end(), {1, socks::kMethodNoAuth});
    }
    co_await net::async_write(stream, net::buffer(greeting), net::use_awaitable);

    std::array<std::uint8_t, 2> choice{};
    co_await net::async_read(stream, net::buffer(choice), net::use_awaitable);
    if (choice[0] != socks::kVersion) {
        throw proxy::ProxyTransportError(Type::protocol_error, proxy,
                                         "proxy answered with SOCKS version " + std::to_string(choice[0]));
    }
    if (choice[1] == socks::kMethodNoAcceptable) {
        throw proxy::ProxyTransportError(Type::authentication_failed, proxy, "proxy accepted none of the offered auth methods");
    }

    if (choice[1] == socks::kMethodUserPass) {
        stage = ExchangeStage::authenticating;
        if (!proxy.hasCredentials()) {
            throw proxy::ProxyTransportError(Type::authentication_failed, proxy, "proxy requires credentials");
        }
        if (proxy.username.size() > 255 || proxy.password.size() > 255) {
            throw proxy::ProxyTransportError(Type::authentication_failed, proxy, "proxy credentials exceed 255 bytes");
        }
        std::vector<std::uint8_t> auth{socks::kUserPassVersion};
        appendCounted(auth, proxy.username);
        appendCounted(auth, proxy.password);
        co_await net::async_write(stream, net::buffer(auth), net::use_awaitable);

        std::array<std::uint8_t, 2> verdict{};
        co_await net::async_read(stream, net::buffer(verdict), net::use_awaitable);
        if (verdict[1] != 0x00) {
            throw proxy::ProxyTransportError(Type::authentication_failed, proxy, "proxy rejected credentials");
        }
    } else if (choice[1] != socks::kMethodNoAuth) {
        throw proxy::ProxyTransportError(Type::protocol_error, proxy,
                                         "proxy selected unsupported auth method " + std::to_string(choice[1]));
    }

    stage = ExchangeStage::tunneling;
    std::vector<std::uint8_t> connect{socks::kVersion, socks::kCommandConnect, 0x00, socks::kAddressDomain};
    appendCounted(connect, host);
    connect.push_back(static_cast<std::uint8_t>(port >> 8));
    connect.push_back(static_cast<std::uint8_t>(port & 0xFF));
    co_await net::async_write(stream, net::buffer(connect), net::use_awaitable);

    std::array<std::uint8_t, 4> reply{};
    co_await net::async_read(stream, net::buffer(reply), net::use_awaitable);
    if (reply[0] != socks::kVersion) {
        throw proxy::ProxyTransportError(Type::protocol_error, proxy, "malformed SOCKS5 CONNECT reply");
    }
    if (reply[1] != 0x00) {
        throw proxy::ProxyTransportError(Type::tunnel_rejected, proxy,
                                         std::string{"proxy refused tunnel to "} + host + ":" + std::to_string(port) +
                                             ": " + socks::replyMessage(reply[1]));
    }

    // Bound address and port follow; their length depends on the address type.
    std::size_t remaining = 2;
    switch (reply[3]) {
    case socks::kAddressIpv4:
        remaining += 4;
        break;
    case socks::kAddressIpv6:
        remaining += 16;
        break;
    case socks::kAddressDomain: {
        std::array<std::uint8_t, 1> length{};
        co_await net::async_read(stream, net::buffer(length), net::use_awaitable);
        remaining += length[0];
        break;
    }
    default:
        throw proxy::ProxyTransportError(Type::protocol_error, proxy,
                                         "proxy sent unknown bound address type " + std::to_string(reply[3]));
    }
    std::vector<std::uint8_t> bound(remaining);
    co_await net::async_read(stream, net::buffer(bound), net::use_awaitable);
}

} // namespace proxyconn::transport

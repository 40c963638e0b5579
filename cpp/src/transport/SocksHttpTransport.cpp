#include "proxyconn/transport/SocksHttpTransport.hpp"

#include "proxyconn/proxy/ProxyErrors.hpp"
#include "proxyconn/transport/SocksConnector.hpp"
#include "proxyconn/util/Logging.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>

#include <exception>
#include <limits>
#include <optional>
#include <type_traits>

namespace proxyconn::transport {
namespace {

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;
using SslStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;
using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;
using Type = proxy::ProxyTransportError::Type;

constexpr unsigned kHttpVersion = 11;

HttpRequest buildRequest(const model::RequestDescription& request, const std::string& userAgent) {
    HttpRequest message{http::string_to_verb(request.method), request.url.target, kHttpVersion};
    message.set(http::field::host, request.url.authority());
    for (const auto& [name, value] : request.headers) {
        if (model::equalsIgnoreCase(name, "host") || model::equalsIgnoreCase(name, "connection")) {
            continue;
        }
        message.set(name, value);
    }
    if (!message.count(http::field::user_agent) && !userAgent.empty()) {
        message.set(http::field::user_agent, userAgent);
    }
    message.set(http::field::connection, "close");
    if (request.method != "GET" && request.method != "HEAD") {
        message.body() = request.body;
        message.content_length(request.body.size());
    }
    return message;
}

Response toResponse(HttpResponse message, const model::RequestDescription& request) {
    model::Headers headers;
    for (const auto& field : message.base()) {
        headers.append(model::toLower(std::string(field.name_string())), std::string(field.value()));
    }

    // The body is buffered, so a chunked or close-delimited body now has a known length.
    if (request.method != "HEAD" && (message.chunked() || !headers.has("content-length"))) {
        headers.erase("transfer-encoding");
        headers.set("content-length", std::to_string(message.body().size()));
    }

    std::string statusText(message.reason());
    if (statusText.empty()) {
        statusText = std::string(http::obsolete_reason(message.result()));
    }
    return Response(static_cast<int>(message.result_int()), std::move(statusText), std::move(headers),
                    std::move(message.body()), request.urlString());
}

Type typeForStage(ExchangeStage stage) {
    switch (stage) {
    case ExchangeStage::resolving:
    case ExchangeStage::connecting:
    case ExchangeStage::greeting:
        return Type::connect_failed;
    case ExchangeStage::authenticating:
        return Type::authentication_failed;
    case ExchangeStage::tunneling:
        return Type::tunnel_rejected;
    case ExchangeStage::tls_handshake:
        return Type::tls_failed;
    case ExchangeStage::writing:
    case ExchangeStage::reading:
        return Type::io_failed;
    }
    return Type::io_failed;
}

bool isHttpParseError(const boost::system::error_code& ec) {
    if (ec.category() != http::make_error_code(http::error::bad_version).category()) {
        return false;
    }
    return ec != http::error::end_of_stream && ec != http::error::partial_message;
}

template <typename Stream>
boost::asio::awaitable<Response> performExchange(Stream& stream,
                                                 tcp::resolver& resolver,
                                                 HttpRequest& message,
                                                 const model::RequestDescription& request,
                                                 const proxy::ProxyEndpoint& proxy,
                                                 ExchangeStage& stage) {
    namespace net = boost::asio;
    auto& lowest = boost::beast::get_lowest_layer(stream);

    stage = ExchangeStage::resolving;
    auto endpoints = co_await resolver.async_resolve(proxy.host, std::to_string(proxy.port), net::use_awaitable);

    stage = ExchangeStage::connecting;
    co_await lowest.async_connect(endpoints, net::use_awaitable);

    co_await socksConnect(lowest, proxy, request.url.host, request.url.port, stage);

    if constexpr (std::is_same_v<Stream, SslStream>) {
        stage = ExchangeStage::tls_handshake;
        if (!SSL_set_tlsext_host_name(stream.native_handle(), request.url.host.c_str())) {
            throw proxy::ProxyTransportError(Type::tls_failed, proxy, "Failed to set SNI host name");
        }
        co_await stream.async_handshake(net::ssl::stream_base::client, net::use_awaitable);
    }

    stage = ExchangeStage::writing;
    co_await http::async_write(stream, message, net::use_awaitable);

    stage = ExchangeStage::reading;
    boost::beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    if (request.method == "HEAD") {
        parser.skip(true);
    }
    co_await http::async_read(stream, buffer, parser, net::use_awaitable);

    boost::system::error_code ec;
    lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != net::error::not_connected) {
        util::log(util::LogLevel::trace, "tunnel shutdown through " + proxy.toString() + ": " + ec.message());
    }
    co_return toResponse(parser.release(), request);
}

[[noreturn]] void rethrowClassified(std::exception_ptr failure,
                                    bool timedOut,
                                    ExchangeStage stage,
                                    const proxy::ProxyEndpoint& proxy,
                                    std::chrono::milliseconds timeout) {
    if (timedOut) {
        throw proxy::ProxyTimeoutError(proxy, timeout, toString(stage));
    }
    if (!failure) {
        throw proxy::ProxyTransportError(Type::io_failed, proxy, "exchange ended without a response");
    }
    try {
        std::rethrow_exception(failure);
    } catch (const proxy::ProxyConnError&) {
        throw;
    } catch (const boost::system::system_error& ex) {
        if (ex.code() == boost::beast::error::timeout) {
            throw proxy::ProxyTimeoutError(proxy, timeout, toString(stage));
        }
        auto type = isHttpParseError(ex.code()) ? Type::protocol_error : typeForStage(stage);
        throw proxy::ProxyTransportError(type, proxy, std::string{"failed while "} + toString(stage) + ": " +
                                                          ex.code().message());
    } catch (const std::exception& ex) {
        throw proxy::ProxyTransportError(typeForStage(stage), proxy,
                                         std::string{"failed while "} + toString(stage) + ": " + ex.what());
    }
}

template <typename Stream>
Response runExchange(boost::asio::io_context& io,
                     Stream& stream,
                     HttpRequest& message,
                     const model::RequestDescription& request,
                     const proxy::ProxyEndpoint& proxy,
                     std::chrono::milliseconds timeout) {
    tcp::resolver resolver(io);
    boost::asio::steady_timer deadline(io);
    ExchangeStage stage = ExchangeStage::resolving;
    bool timedOut = false;
    std::exception_ptr failure;
    std::optional<Response> result;

    deadline.expires_after(timeout);
    deadline.async_wait([&](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        timedOut = true;
        resolver.cancel();
        boost::beast::get_lowest_layer(stream).close();
    });

    boost::asio::co_spawn(io,
                          performExchange(stream, resolver, message, request, proxy, stage),
                          [&](std::exception_ptr ep, Response response) {
                              deadline.cancel();
                              if (ep) {
                                  failure = ep;
                              } else {
                                  result = std::move(response);
                              }
                          });
    io.run();

    if (result) {
        return std::move(*result);
    }
    rethrowClassified(failure, timedOut, stage, proxy, timeout);
}

} // namespace

SocksHttpTransport::SocksHttpTransport()
    : SocksHttpTransport(Options{}) {}

SocksHttpTransport::SocksHttpTransport(Options options)
    : options_(std::move(options))
    , sslContext_(boost::asio::ssl::context::tls_client) {
    sslContext_.set_default_verify_paths();
    sslContext_.set_verify_mode(options_.verifyPeer ? boost::asio::ssl::verify_peer : boost::asio::ssl::verify_none);
}

Response SocksHttpTransport::exchange(const model::RequestDescription& request,
                                      const proxy::ProxyEndpoint& proxy,
                                      std::chrono::milliseconds timeout) {
    boost::asio::io_context io;
    auto message = buildRequest(request, options_.userAgent);

    if (request.url.secure()) {
        SslStream stream(io, sslContext_);
        return runExchange(io, stream, message, request, proxy, timeout);
    }
    boost::beast::tcp_stream stream(io);
    return runExchange(io, stream, message, request, proxy, timeout);
}

} // namespace proxyconn::transport

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "proxyconn/proxy/ProxyErrors.hpp"
#include "proxyconn/transport/SocksHttpTransport.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <thread>
#include <vector>

using namespace proxyconn;
using boost::asio::ip::tcp;
using namespace std::chrono_literals;

namespace {

struct SocksScript {
    bool requireAuth{false};
    std::string username;
    std::string password;
    std::uint8_t connectReply{0x00};
    bool stall{false};
    std::string httpResponse{
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/plain\r\n"
        "X-Upstream: one\r\n"
        "x-upstream: two\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n"};
};

struct Captured {
    std::vector<std::uint8_t> methods;
    bool authenticated{false};
    std::uint8_t addressType{};
    std::string targetHost;
    std::uint16_t targetPort{};
    std::string request;
};

// Minimal SOCKS5 server on loopback; serves exactly one connection.
class FakeSocksServer {
public:
    explicit FakeSocksServer(SocksScript script)
        : acceptor_(io_, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0))
        , script_(std::move(script)) {
        thread_ = std::thread([this] { serve(); });
    }

    ~FakeSocksServer() {
        if (!accepted_.load()) {
            boost::system::error_code ec;
            boost::asio::io_context io;
            tcp::socket wake(io);
            wake.connect(tcp::endpoint(boost::asio::ip::address_v4::loopback(), port()), ec);
        }
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::uint16_t port() const { return acceptor_.local_endpoint().port(); }

    proxy::ProxyEndpoint endpoint(std::string username = {}, std::string password = {}) const {
        proxy::ProxyEndpoint result;
        result.host = "127.0.0.1";
        result.port = port();
        result.username = std::move(username);
        result.password = std::move(password);
        return result;
    }

    // Waits for the connection to finish.
    const Captured& finish() {
        if (thread_.joinable()) {
            thread_.join();
        }
        return captured_;
    }

private:
    void serve() {
        boost::system::error_code ec;
        tcp::socket socket(io_);
        acceptor_.accept(socket, ec);
        accepted_.store(true);
        if (ec) {
            return;
        }
        try {
            handle(socket);
        } catch (const boost::system::system_error&) {
            // Client hung up; nothing left to serve.
        }
    }

    void handle(tcp::socket& socket) {
        namespace net = boost::asio;
        if (script_.stall) {
            std::array<char, 256> sink{};
            boost::system::error_code ec;
            while (!ec) {
                socket.read_some(net::buffer(sink), ec);
            }
            return;
        }

        std::array<std::uint8_t, 2> greeting{};
        net::read(socket, net::buffer(greeting));
        captured_.methods.resize(greeting[1]);
        net::read(socket, net::buffer(captured_.methods));

        const bool offersUserPass =
            std::find(captured_.methods.begin(), captured_.methods.end(), 0x02) != captured_.methods.end();
        if (script_.requireAuth) {
            if (!offersUserPass) {
                net::write(socket, net::buffer(std::array<std::uint8_t, 2>{0x05, 0xFF}));
                return;
            }
            net::write(socket, net::buffer(std::array<std::uint8_t, 2>{0x05, 0x02}));
            std::array<std::uint8_t, 2> header{};
            net::read(socket, net::buffer(header));
            std::string username(header[1], '\0');
            net::read(socket, net::buffer(username));
            std::array<std::uint8_t, 1> passwordLength{};
            net::read(socket, net::buffer(passwordLength));
            std::string password(passwordLength[0], '\0');
            net::read(socket, net::buffer(password));
            captured_.authenticated = username == script_.username && password == script_.password;
            const std::uint8_t verdict = captured_.authenticated ? 0x00 : 0x01;
            net::write(socket, net::buffer(std::array<std::uint8_t, 2>{0x01, verdict}));
            if (!captured_.authenticated) {
                return;
            }
        } else {
            net::write(socket, net::buffer(std::array<std::uint8_t, 2>{0x05, 0x00}));
        }

        std::array<std::uint8_t, 4> request{};
        net::read(socket, net::buffer(request));
        captured_.addressType = request[3];
        std::array<std::uint8_t, 1> hostLength{};
        net::read(socket, net::buffer(hostLength));
        captured_.targetHost.assign(hostLength[0], '\0');
        net::read(socket, net::buffer(captured_.targetHost));
        std::array<std::uint8_t, 2> port{};
        net::read(socket, net::buffer(port));
        captured_.targetPort = static_cast<std::uint16_t>((port[0] << 8) | port[1]);

        std::array<std::uint8_t, 10> reply{0x05, script_.connectReply, 0x00, 0x01, 127, 0, 0, 1, 0x1f, 0x90};
        net::write(socket, net::buffer(reply));
        if (script_.connectReply != 0x00) {
            return;
        }

        std::string data;
        auto headerEnd = net::read_until(socket, net::dynamic_buffer(data), "\r\n\r\n");
        std::size_t contentLength = 0;
        auto lower = data.substr(0, headerEnd);
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (auto pos = lower.find("content-length:"); pos != std::string::npos) {
            contentLength = std::stoul(lower.substr(pos + 15));
        }
        if (data.size() < headerEnd + contentLength) {
            net::read(socket, net::dynamic_buffer(data), net::transfer_exactly(headerEnd + contentLength - data.size()));
        }
        captured_.request = data;

        net::write(socket, net::buffer(script_.httpResponse));
        boost::system::error_code ec;
        socket.shutdown(tcp::socket::shutdown_send, ec);
    }

    boost::asio::io_context io_;
    tcp::acceptor acceptor_;
    SocksScript script_;
    Captured captured_;
    std::atomic<bool> accepted_{false};
    std::thread thread_;
};

transport::SocksHttpTransport makeTransport() {
    transport::SocksHttpTransport::Options options;
    options.userAgent = "proxyconn-test/1.0";
    return transport::SocksHttpTransport(std::move(options));
}

proxy::ProxyTransportError::Type expectTransportError(transport::SocksHttpTransport& transport,
                                                       const model::RequestDescription& request,
                                                       const proxy::ProxyEndpoint& via) {
    try {
        transport.exchange(request, via, 2s);
    } catch (const proxy::ProxyTransportError& ex) {
        return ex.type();
    }
    FAIL("expected ProxyTransportError");
    return proxy::ProxyTransportError::Type::io_failed;
}

} // namespace

TEST_CASE("SocksHttpTransport tunnels a GET through a SOCKS5 proxy")
{
    FakeSocksServer server(SocksScript{});
    auto transport = makeTransport();
    auto request = model::makeRequestDescription(std::string("http://origin.test:8080/path?q=1"));

    auto response = transport.exchange(request, server.endpoint(), 2s);
    const auto& captured = server.finish();

    CHECK(captured.methods == std::vector<std::uint8_t>{0x00});
    CHECK(captured.addressType == 0x03);
    CHECK(captured.targetHost == "origin.test");
    CHECK(captured.targetPort == 8080);
    CHECK(captured.request.rfind("GET /path?q=1 HTTP/1.1\r\n", 0) == 0);
    CHECK(captured.request.find("Host: origin.test:8080\r\n") != std::string::npos);
    CHECK(captured.request.find("User-Agent: proxyconn-test/1.0\r\n") != std::string::npos);
    CHECK(captured.request.find("Connection: close\r\n") != std::string::npos);

    CHECK(response.status() == 200);
    CHECK(response.statusText() == "OK");
    CHECK(response.url() == "http://origin.test:8080/path?q=1");
    CHECK(response.headers().get("content-type").value() == "text/plain");
    CHECK(response.headers().get("x-upstream").value() == "one, two");
    CHECK_FALSE(response.headers().has("transfer-encoding"));
    CHECK(response.headers().get("content-length").value() == "11");
    CHECK(response.text() == "hello world");
}

TEST_CASE("SocksHttpTransport sends request bodies unchanged")
{
    SocksScript script;
    script.httpResponse = "HTTP/1.1 201 Created\r\nContent-Length: 2\r\n\r\nok";
    FakeSocksServer server(script);
    auto transport = makeTransport();

    model::RequestOptions options;
    options.method = "POST";
    options.headers.set("User-Agent", "custom-agent");
    options.body = model::Bytes{'a', 0x00, 'b', 0xff};
    auto request = model::makeRequestDescription(std::string("http://origin.test/upload"), options);

    auto response = transport.exchange(request, server.endpoint(), 2s);
    const auto& captured = server.finish();

    CHECK(response.status() == 201);
    CHECK(response.text() == "ok");
    CHECK(captured.targetPort == 80);
    CHECK(captured.request.find("User-Agent: custom-agent\r\n") != std::string::npos);
    CHECK(captured.request.find("proxyconn-test") == std::string::npos);
    CHECK(captured.request.size() >= 4);
    CHECK(captured.request.substr(captured.request.size() - 4) == std::string("a\0b\xff", 4));
}

TEST_CASE("SocksHttpTransport authenticates with username and password")
{
    SocksScript script;
    script.requireAuth = true;
    script.username = "alice";
    script.password = "secret";

    SUBCASE("accepted credentials")
    {
        FakeSocksServer server(script);
        auto transport = makeTransport();
        auto response = transport.exchange(model::makeRequestDescription(std::string("http://origin.test/")),
                                           server.endpoint("alice", "secret"), 2s);
        const auto& captured = server.finish();
        CHECK(captured.authenticated);
        CHECK(captured.methods == std::vector<std::uint8_t>{0x00, 0x02});
        CHECK(response.ok());
    }

    SUBCASE("rejected credentials")
    {
        FakeSocksServer server(script);
        auto transport = makeTransport();
        auto type = expectTransportError(transport, model::makeRequestDescription(std::string("http://origin.test/")),
                                         server.endpoint("alice", "wrong"));
        CHECK(type == proxy::ProxyTransportError::Type::authentication_failed);
    }

    SUBCASE("no credentials offered")
    {
        FakeSocksServer server(script);
        auto transport = makeTransport();
        auto type = expectTransportError(transport, model::makeRequestDescription(std::string("http://origin.test/")),
                                         server.endpoint());
        CHECK(type == proxy::ProxyTransportError::Type::authentication_failed);
    }
}

TEST_CASE("SocksHttpTransport reports a refused tunnel")
{
    SocksScript script;
    script.connectReply = 0x05;
    FakeSocksServer server(script);
    auto transport = makeTransport();

    try {
        transport.exchange(model::makeRequestDescription(std::string("http://origin.test/")), server.endpoint(), 2s);
        FAIL("expected ProxyTransportError");
    } catch (const proxy::ProxyTransportError& ex) {
        CHECK(ex.type() == proxy::ProxyTransportError::Type::tunnel_rejected);
        CHECK(std::string(ex.what()).find("connection refused") != std::string::npos);
        CHECK(ex.proxy().port == server.port());
    }
}

TEST_CASE("SocksHttpTransport classifies a malformed HTTP reply")
{
    SocksScript script;
    script.httpResponse = "garbage\r\n\r\n";
    FakeSocksServer server(script);
    auto transport = makeTransport();
    auto type = expectTransportError(transport, model::makeRequestDescription(std::string("http://origin.test/")),
                                     server.endpoint());
    CHECK(type == proxy::ProxyTransportError::Type::protocol_error);
}

TEST_CASE("SocksHttpTransport times out a stalled proxy")
{
    SocksScript script;
    script.stall = true;
    FakeSocksServer server(script);
    auto transport = makeTransport();

    auto started = std::chrono::steady_clock::now();
    CHECK_THROWS_AS(transport.exchange(model::makeRequestDescription(std::string("http://origin.test/")),
                                       server.endpoint(), 200ms),
                    proxy::ProxyTimeoutError);
    auto elapsed = std::chrono::steady_clock::now() - started;
    CHECK(elapsed >= 200ms);
    CHECK(elapsed < 2s);
}

TEST_CASE("SocksHttpTransport reports an unreachable proxy")
{
    std::uint16_t closedPort = 0;
    {
        boost::asio::io_context io;
        tcp::acceptor probe(io, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
        closedPort = probe.local_endpoint().port();
    }
    proxy::ProxyEndpoint unreachable;
    unreachable.host = "127.0.0.1";
    unreachable.port = closedPort;

    auto transport = makeTransport();
    auto type = expectTransportError(transport, model::makeRequestDescription(std::string("http://origin.test/")),
                                     unreachable);
    CHECK(type == proxy::ProxyTransportError::Type::connect_failed);
}

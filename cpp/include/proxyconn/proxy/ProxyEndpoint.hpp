#pragma once

#include <cstdint>
#include <string>

namespace proxyconn::proxy {

struct ProxyEndpoint {
    std::string host;
    std::uint16_t port{};
    std::string username;
    std::string password;

    [[nodiscard]] bool hasCredentials() const noexcept { return !username.empty() || !password.empty(); }

    // host:port, never includes credentials.
    [[nodiscard]] std::string toString() const { return host + ":" + std::to_string(port); }
};

} // namespace proxyconn::proxy

#pragma once

#include <cstdint>
#include <string>

namespace proxyconn::util {

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::uint16_t port{};
    std::string target;

    [[nodiscard]] bool secure() const noexcept { return scheme == "https"; }
    // host[:port], port omitted when it is the scheme default.
    [[nodiscard]] std::string authority() const;
    [[nodiscard]] std::string toString() const;
};

// Accepts absolute http:// and https:// URLs; throws std::invalid_argument otherwise.
ParsedUrl parseUrl(const std::string& url);

} // namespace proxyconn::util

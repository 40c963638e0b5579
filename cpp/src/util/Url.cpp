#include "proxyconn/util/Url.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace proxyconn::util {
namespace {

std::uint16_t defaultPort(const std::string& scheme) {
    return scheme == "https" ? 443 : 80;
}

std::uint16_t parsePort(const std::string& text, const std::string& url) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument("URL has invalid port: " + url);
    }
    unsigned long value = 0;
    try {
        value = std::stoul(text);
    } catch (const std::exception&) {
        throw std::invalid_argument("URL has invalid port: " + url);
    }
    if (value == 0 || value > 65535) {
        throw std::invalid_argument("URL port out of range: " + url);
    }
    return static_cast<std::uint16_t>(value);
}

} // namespace

std::string ParsedUrl::authority() const {
    std::string hostPart = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (port == defaultPort(scheme)) {
        return hostPart;
    }
    return hostPart + ":" + std::to_string(port);
}

std::string ParsedUrl::toString() const {
    return scheme + "://" + authority() + target;
}

ParsedUrl parseUrl(const std::string& url) {
    ParsedUrl parsed;
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("URL missing scheme: " + url);
    }
    parsed.scheme = url.substr(0, schemeEnd);
    std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + parsed.scheme);
    }

    auto hostStart = schemeEnd + 3;
    auto pathPos = url.find_first_of("/?#", hostStart);
    std::string hostPort = pathPos == std::string::npos ? url.substr(hostStart) : url.substr(hostStart, pathPos - hostStart);
    if (auto at = hostPort.rfind('@'); at != std::string::npos) {
        hostPort = hostPort.substr(at + 1);
    }

    if (!hostPort.empty() && hostPort.front() == '[') {
        auto close = hostPort.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("URL has unterminated IPv6 literal: " + url);
        }
        parsed.host = hostPort.substr(1, close - 1);
        auto rest = hostPort.substr(close + 1);
        parsed.port = rest.empty() ? defaultPort(parsed.scheme)
                                   : parsePort(rest.front() == ':' ? rest.substr(1) : rest, url);
    } else {
        auto colonPos = hostPort.find(':');
        if (colonPos == std::string::npos) {
            parsed.host = hostPort;
            parsed.port = defaultPort(parsed.scheme);
        } else {
            parsed.host = hostPort.substr(0, colonPos);
            parsed.port = parsePort(hostPort.substr(colonPos + 1), url);
        }
    }
    if (parsed.host.empty()) {
        throw std::invalid_argument("URL missing host: " + url);
    }

    parsed.target = pathPos == std::string::npos ? "/" : url.substr(pathPos);
    if (auto hash = parsed.target.find('#'); hash != std::string::npos) {
        parsed.target.erase(hash);
    }
    if (parsed.target.empty() || parsed.target.front() != '/') {
        parsed.target.insert(parsed.target.begin(), '/');
    }
    return parsed;
}

} // namespace proxyconn::util

#include "proxyconn/proxy/ProxyListLoader.hpp"

#include "proxyconn/config/ManagerConfig.hpp"
#include "proxyconn/util/JsonUtil.hpp"
#include "proxyconn/util/Logging.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>

namespace proxyconn::proxy {
namespace {

const boost::json::value* findEither(const boost::json::object& obj, const char* key, const char* alias) {
    if (auto it = obj.if_contains(key)) {
        return it;
    }
    return obj.if_contains(alias);
}

std::string readText(const boost::json::value* value) {
    if (value && value->is_string()) {
        return std::string(value->as_string());
    }
    return {};
}

long readPort(const boost::json::value& value, std::size_t index) {
    if (value.is_int64()) {
        return static_cast<long>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<long>(value.as_uint64());
    }
    if (value.is_string()) {
        std::string text(value.as_string());
        char* end = nullptr;
        long parsed = std::strtol(text.c_str(), &end, 10);
        if (end != text.c_str() && *end == '\0') {
            return parsed;
        }
    }
    throw config::ConfigError("proxy #" + std::to_string(index) + ": port must be an integer");
}

} // namespace

std::vector<ProxyEndpoint> parseProxyList(const boost::json::value& json) {
    if (!json.is_array()) {
        throw config::ConfigError("proxy list must be a JSON array");
    }
    std::vector<ProxyEndpoint> proxies;
    std::size_t index = 0;
    for (const auto& item : json.as_array()) {
        if (!item.is_object()) {
            throw config::ConfigError("proxy #" + std::to_string(index) + " is not an object");
        }
        const auto& obj = item.as_object();
        ProxyEndpoint endpoint;
        endpoint.host = readText(findEither(obj, "host", "ip"));
        if (endpoint.host.empty()) {
            throw config::ConfigError("proxy #" + std::to_string(index) + ": host is required");
        }
        auto port = obj.if_contains("port");
        if (!port) {
            throw config::ConfigError("proxy #" + std::to_string(index) + ": port is required");
        }
        long value = readPort(*port, index);
        if (value <= 0 || value > 65535) {
            throw config::ConfigError("proxy #" + std::to_string(index) + ": port " + std::to_string(value) +
                                      " is out of range");
        }
        endpoint.port = static_cast<std::uint16_t>(value);
        endpoint.username = readText(findEither(obj, "username", "user"));
        endpoint.password = readText(findEither(obj, "password", "pass"));
        proxies.push_back(std::move(endpoint));
        ++index;
    }
    return proxies;
}

std::vector<ProxyEndpoint> loadProxyList(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw config::ConfigError("cannot open proxy list " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    auto json = util::tryParseJson(content);
    if (!json) {
        throw config::ConfigError("proxy list " + path.string() + " is not valid JSON");
    }
    auto proxies = parseProxyList(*json);
    util::log(util::LogLevel::info, "Loaded " + std::to_string(proxies.size()) + " proxies from " + path.string());
    return proxies;
}

} // namespace proxyconn::proxy

#pragma once

#include "proxyconn/proxy/ProxyEndpoint.hpp"

#include <boost/json.hpp>

#include <filesystem>
#include <vector>

namespace proxyconn::proxy {

// Accepts an array of {host|ip, port, username|user, password|pass} objects.
// Throws config::ConfigError for a missing host or a port outside 1..65535.
std::vector<ProxyEndpoint> parseProxyList(const boost::json::value& json);
std::vector<ProxyEndpoint> loadProxyList(const std::filesystem::path& path);

} // namespace proxyconn::proxy

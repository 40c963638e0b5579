#pragma once

#include <boost/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace proxyconn::util {

std::optional<boost::json::value> tryParseJson(std::string_view payload);
std::string stringifyJson(const boost::json::value& value);

} // namespace proxyconn::util

#include "proxyconn/util/JsonUtil.hpp"

namespace proxyconn::util {

std::optional<boost::json::value> tryParseJson(std::string_view payload) {
    boost::system::error_code ec;
    auto value = boost::json::parse(boost::json::string_view(payload.data(), payload.size()), ec);
    if (ec) {
        return std::nullopt;
    }
    return value;
}

std::string stringifyJson(const boost::json::value& value) {
    return boost::json::serialize(value);
}

} // namespace proxyconn::util

#include "proxyconn/transport/Response.hpp"

#include "proxyconn/proxy/ProxyErrors.hpp"
#include "proxyconn/util/JsonUtil.hpp"

namespace proxyconn::transport {

Response::Response(int status, std::string statusText, model::Headers headers, std::string body, std::string url)
    : status_(status)
    , statusText_(std::move(statusText))
    , headers_(headers.normalized())
    , body_(std::move(body))
    , url_(std::move(url)) {}

std::string Response::consume() {
    if (bodyUsed_) {
        throw proxy::BodyAlreadyConsumedError();
    }
    bodyUsed_ = true;
    return std::move(body_);
}

std::string Response::text() {
    return consume();
}

boost::json::value Response::json() {
    auto payload = consume();
    if (auto parsed = util::tryParseJson(payload)) {
        return std::move(*parsed);
    }
    return boost::json::string(payload);
}

model::Bytes Response::bytes() {
    auto payload = consume();
    return model::Bytes(payload.begin(), payload.end());
}

Response Response::clone() const {
    if (bodyUsed_) {
        throw proxy::BodyAlreadyConsumedError();
    }
    return *this;
}

} // namespace proxyconn::transport

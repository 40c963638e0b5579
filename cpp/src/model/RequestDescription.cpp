#include "proxyconn/model/RequestDescription.hpp"

#include <boost/beast/http/verb.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>

namespace proxyconn::model {
namespace {

bool methodAllowsBody(const std::string& method) {
    return method != "GET" && method != "HEAD";
}

} // namespace

bool RequestDescription::carriesBody() const {
    return methodAllowsBody(method) && !body.empty();
}

std::string normalizeMethod(const std::string& method) {
    std::string upper;
    upper.reserve(method.size());
    std::transform(method.begin(), method.end(), std::back_inserter(upper), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (upper.empty()) {
        return "GET";
    }
    if (boost::beast::http::string_to_verb(upper) == boost::beast::http::verb::unknown ||
        upper == "CONNECT") {
        throw std::invalid_argument("Unsupported HTTP method: " + method);
    }
    return upper;
}

RequestDescription makeRequestDescription(const std::string& url, RequestOptions options) {
    if (options.timeout && options.timeout->count() <= 0) {
        throw std::invalid_argument("request timeout must be positive");
    }

    RequestDescription description;
    description.url = util::parseUrl(url);
    description.method = normalizeMethod(options.method.value_or("GET"));
    description.headers = std::move(options.headers);
    description.timeout = options.timeout;

    if (!methodAllowsBody(description.method)) {
        return description;
    }

    auto encoded = encodeBody(options.body);
    if (encoded.payload.empty() && std::holds_alternative<std::monostate>(options.body)) {
        return description;
    }
    if (encoded.contentType && (encoded.overrideContentType || !description.headers.has("content-type"))) {
        description.headers.set("content-type", *encoded.contentType);
    }
    description.headers.erase("transfer-encoding");
    description.headers.set("content-length", std::to_string(encoded.payload.size()));
    description.body = std::move(encoded.payload);
    return description;
}

RequestDescription resolveRequest(RequestTarget target, std::optional<RequestOptions> options) {
    if (auto* url = std::get_if<std::string>(&target)) {
        return makeRequestDescription(*url, options ? std::move(*options) : RequestOptions{});
    }
    auto description = std::get<RequestDescription>(std::move(target));
    description.method = normalizeMethod(description.method);
    if (description.url.host.empty()) {
        throw std::invalid_argument("request description has no target URL");
    }
    if (description.timeout && description.timeout->count() <= 0) {
        throw std::invalid_argument("request timeout must be positive");
    }
    if (options) {
        if (options->method) {
            description.method = normalizeMethod(*options->method);
        }
        for (const auto& [name, value] : options->headers) {
            description.headers.set(name, value);
        }
        if (options->timeout) {
            if (options->timeout->count() <= 0) {
                throw std::invalid_argument("request timeout must be positive");
            }
            description.timeout = options->timeout;
        }
        if (!std::holds_alternative<std::monostate>(options->body)) {
            auto url = description.urlString();
            RequestOptions rebuilt{description.method, description.headers, std::move(options->body), description.timeout};
            return makeRequestDescription(url, std::move(rebuilt));
        }
    }
    if (!methodAllowsBody(description.method)) {
        description.body.clear();
        description.headers.erase("content-length");
        description.headers.erase("transfer-encoding");
    } else if (description.carriesBody() && !description.headers.has("content-length")) {
        description.headers.set("content-length", std::to_string(description.body.size()));
    }
    return description;
}

} // namespace proxyconn::model

#pragma once

#include "proxyconn/model/Headers.hpp"
#include "proxyconn/model/RequestBody.hpp"
#include "proxyconn/util/Url.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <variant>

namespace proxyconn::model {

// Caller-facing shape, mirroring fetch-style (url, options) calls.
struct RequestOptions {
    // Unset means GET for a URL and "keep" for a description.
    std::optional<std::string> method;
    Headers headers;
    RequestBody body;
    std::optional<std::chrono::milliseconds> timeout;
};

// Canonical form used by the dispatcher and transports. The body is already
// encoded, so retries resend identical bytes.
struct RequestDescription {
    util::ParsedUrl url;
    std::string method{"GET"};
    Headers headers;
    std::string body;
    std::optional<std::chrono::milliseconds> timeout;

    [[nodiscard]] std::string urlString() const { return url.toString(); }
    [[nodiscard]] bool carriesBody() const;
};

// A bare URL or a full description; a URL combines with RequestOptions.
using RequestTarget = std::variant<std::string, RequestDescription>;

// Throws std::invalid_argument for a malformed URL, method or timeout.
RequestDescription makeRequestDescription(const std::string& url, RequestOptions options = {});
// Options given with a description override its method, headers, body and
// timeout. A bare description is checked the same way a URL call is.
RequestDescription resolveRequest(RequestTarget target, std::optional<RequestOptions> options = std::nullopt);

std::string normalizeMethod(const std::string& method);

} // namespace proxyconn::model

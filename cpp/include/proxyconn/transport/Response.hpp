#pragma once

#include "proxyconn/model/Headers.hpp"
#include "proxyconn/model/RequestBody.hpp"

#include <boost/json.hpp>

#include <string>

namespace proxyconn::transport {

/**
 * Fully buffered response. The body can be read once, through any one of
 * text(), json() or bytes(); later reads throw BodyAlreadyConsumedError.
 * Not safe to read from several threads at once.
 */
class Response {
public:
    Response() = default;
    Response(int status, std::string statusText, model::Headers headers, std::string body, std::string url);

    [[nodiscard]] int status() const noexcept { return status_; }
    [[nodiscard]] const std::string& statusText() const noexcept { return statusText_; }
    [[nodiscard]] bool ok() const noexcept { return status_ >= 200 && status_ < 300; }
    [[nodiscard]] const model::Headers& headers() const noexcept { return headers_; }
    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    [[nodiscard]] bool bodyUsed() const noexcept { return bodyUsed_; }
    [[nodiscard]] std::size_t bodySize() const noexcept { return body_.size(); }

    std::string text();
    // Non-JSON payloads come back as a JSON string holding the raw text.
    boost::json::value json();
    model::Bytes bytes();

    // Copy with its own unread body; throws if this body was already read.
    [[nodiscard]] Response clone() const;

private:
    std::string consume();

    int status_{0};
    std::string statusText_;
    model::Headers headers_;
    std::string body_;
    std::string url_;
    bool bodyUsed_{false};
};

} // namespace proxyconn::transport

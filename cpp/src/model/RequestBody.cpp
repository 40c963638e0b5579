#include "proxyconn/model/RequestBody.hpp"

#include "proxyconn/util/JsonUtil.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iterator>
#include <random>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace proxyconn::model {
namespace {

std::string formEncode(const std::string& value) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '*' || c == '-' || c == '_' || c == '.') {
            oss << static_cast<char>(c);
        } else if (c == ' ') {
            oss << '+';
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string quoteParameter(const std::string& value) {
    std::string quoted;
    quoted.reserve(value.size());
    for (char c : value) {
        if (c == '"') {
            quoted += "%22";
        } else if (c == '\r' || c == '\n') {
            quoted += ' ';
        } else {
            quoted.push_back(c);
        }
    }
    return quoted;
}

std::string drainStream(const StreamBody& body) {
    if (!body.stream) {
        return {};
    }
    std::string payload((std::istreambuf_iterator<char>(*body.stream)), std::istreambuf_iterator<char>());
    if (body.stream->bad()) {
        throw std::invalid_argument("request body stream failed while reading");
    }
    return payload;
}

} // namespace

void FormData::append(std::string name, std::string value) {
    fields_.push_back(Field{std::move(name), std::move(value)});
}

void FormData::appendFile(std::string name, FilePart file) {
    if (file.contentType.empty()) {
        file.contentType = "application/octet-stream";
    }
    fields_.push_back(Field{std::move(name), std::move(file)});
}

bool FormData::hasFiles() const {
    return std::any_of(fields_.begin(), fields_.end(), [](const Field& field) {
        return std::holds_alternative<FilePart>(field.value);
    });
}

std::string makeMultipartBoundary() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<int> digit(0, 9);
    std::string boundary(26, '-');
    for (int i = 0; i < 24; ++i) {
        boundary.push_back(static_cast<char>('0' + digit(engine)));
    }
    return boundary;
}

std::string encodeMultipart(const FormData& form, const std::string& boundary) {
    std::string out;
    for (const auto& field : form.fields()) {
        out += "--" + boundary + "\r\n";
        if (const auto* text = std::get_if<std::string>(&field.value)) {
            out += "Content-Disposition: form-data; name=\"" + quoteParameter(field.name) + "\"\r\n\r\n";
            out += *text;
        } else {
            const auto& file = std::get<FilePart>(field.value);
            out += "Content-Disposition: form-data; name=\"" + quoteParameter(field.name) + "\"; filename=\"" +
                   quoteParameter(file.filename) + "\"\r\n";
            out += "Content-Type: " + file.contentType + "\r\n\r\n";
            out += file.data;
        }
        out += "\r\n";
    }
    out += "--" + boundary + "--\r\n";
    return out;
}

std::string encodeUrlForm(const FormData& form) {
    std::string out;
    for (const auto& field : form.fields()) {
        if (!out.empty()) {
            out.push_back('&');
        }
        out += formEncode(field.name);
        out.push_back('=');
        if (const auto* text = std::get_if<std::string>(&field.value)) {
            out += formEncode(*text);
        } else {
            out += formEncode(std::get<FilePart>(field.value).data);
        }
    }
    return out;
}

EncodedBody encodeBody(const RequestBody& body) {
    EncodedBody encoded;
    std::visit([&encoded](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return;
        } else if constexpr (std::is_same_v<T, std::string>) {
            encoded.payload = value;
        } else if constexpr (std::is_same_v<T, Bytes>) {
            encoded.payload.assign(value.begin(), value.end());
        } else if constexpr (std::is_same_v<T, boost::json::value>) {
            encoded.payload = util::stringifyJson(value);
            encoded.contentType = "application/json";
        } else if constexpr (std::is_same_v<T, FormData>) {
            if (value.hasFiles()) {
                auto boundary = makeMultipartBoundary();
                encoded.payload = encodeMultipart(value, boundary);
                encoded.contentType = "multipart/form-data; boundary=" + boundary;
                encoded.overrideContentType = true;
            } else {
                encoded.payload = encodeUrlForm(value);
                encoded.contentType = "application/x-www-form-urlencoded";
                encoded.overrideContentType = true;
            }
        } else if constexpr (std::is_same_v<T, StreamBody>) {
            encoded.payload = drainStream(value);
            if (!value.contentType.empty()) {
                encoded.contentType = value.contentType;
            }
        }
    }, body);
    return encoded;
}

} // namespace proxyconn::model

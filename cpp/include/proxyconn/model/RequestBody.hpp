#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace proxyconn::model {

using Bytes = std::vector<std::uint8_t>;

struct FilePart {
    std::string filename;
    std::string contentType{"application/octet-stream"};
    std::string data;
};

class FormData {
public:
    struct Field {
        std::string name;
        std::variant<std::string, FilePart> value;
    };

    void append(std::string name, std::string value);
    void appendFile(std::string name, FilePart file);

    [[nodiscard]] bool hasFiles() const;
    [[nodiscard]] const std::vector<Field>& fields() const noexcept { return fields_; }
    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }

private:
    std::vector<Field> fields_;
};

// Read to EOF once when the request is built, so every attempt resends the same bytes.
struct StreamBody {
    std::shared_ptr<std::istream> stream;
    std::string contentType;
};

using RequestBody = std::variant<std::monostate, std::string, Bytes, boost::json::value, FormData, StreamBody>;

struct EncodedBody {
    std::string payload;
    std::optional<std::string> contentType;
    // Replace a caller-supplied content-type (multipart needs its boundary).
    bool overrideContentType{false};
};

EncodedBody encodeBody(const RequestBody& body);

std::string makeMultipartBoundary();
std::string encodeMultipart(const FormData& form, const std::string& boundary);
std::string encodeUrlForm(const FormData& form);

} // namespace proxyconn::model

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "proxyconn/model/RequestBody.hpp"

#include <memory>
#include <sstream>

using namespace proxyconn::model;

TEST_CASE("encodeBody passes raw payloads through untouched")
{
    SUBCASE("empty")
    {
        auto encoded = encodeBody(RequestBody{});
        CHECK(encoded.payload.empty());
        CHECK_FALSE(encoded.contentType.has_value());
    }

    SUBCASE("text")
    {
        auto encoded = encodeBody(RequestBody{std::string("hello world")});
        CHECK(encoded.payload == "hello world");
        CHECK_FALSE(encoded.contentType.has_value());
    }

    SUBCASE("binary bytes survive including NUL")
    {
        Bytes bytes{0x00, 0xff, 0x10, 0x00, 0x7f};
        auto encoded = encodeBody(RequestBody{bytes});
        REQUIRE(encoded.payload.size() == bytes.size());
        CHECK(static_cast<unsigned char>(encoded.payload[1]) == 0xff);
        CHECK(encoded.payload[3] == '\0');
    }

    SUBCASE("stream is drained once")
    {
        auto stream = std::make_shared<std::istringstream>("streamed payload");
        auto encoded = encodeBody(RequestBody{StreamBody{stream, "text/csv"}});
        CHECK(encoded.payload == "streamed payload");
        CHECK(encoded.contentType.value() == "text/csv");
        CHECK_FALSE(encoded.overrideContentType);
    }
}

TEST_CASE("encodeBody serializes JSON values")
{
    boost::json::value value = boost::json::object{{"name", "proxy"}, {"port", 1080}};
    auto encoded = encodeBody(RequestBody{value});
    CHECK(encoded.contentType.value() == "application/json");
    CHECK(boost::json::parse(encoded.payload) == value);
}

TEST_CASE("form data without files is url-encoded")
{
    FormData form;
    form.append("user name", "a&b");
    form.append("empty", "");
    auto encoded = encodeBody(RequestBody{form});
    CHECK(encoded.payload == "user+name=a%26b&empty=");
    CHECK(encoded.contentType.value() == "application/x-www-form-urlencoded");
}

TEST_CASE("form data with files is multipart")
{
    FormData form;
    form.append("title", "report");
    form.appendFile("upload", FilePart{"data.bin", "", std::string("\x01\x02\x03", 3)});

    auto encoded = encodeBody(RequestBody{form});
    REQUIRE(encoded.contentType.has_value());
    CHECK(encoded.overrideContentType);

    const std::string prefix = "multipart/form-data; boundary=";
    REQUIRE(encoded.contentType->rfind(prefix, 0) == 0);
    auto boundary = encoded.contentType->substr(prefix.size());
    CHECK(boundary.size() == 50);

    const auto& payload = encoded.payload;
    CHECK(payload.rfind("--" + boundary + "\r\n", 0) == 0);
    CHECK(payload.find("Content-Disposition: form-data; name=\"title\"\r\n\r\nreport\r\n") != std::string::npos);
    CHECK(payload.find("name=\"upload\"; filename=\"data.bin\"\r\n"
                       "Content-Type: application/octet-stream\r\n\r\n\x01\x02\x03\r\n") != std::string::npos);
    CHECK(payload.size() >= boundary.size() + 6);
    CHECK(payload.substr(payload.size() - boundary.size() - 6) == "--" + boundary + "--\r\n");
}

TEST_CASE("multipart boundaries differ between calls")
{
    CHECK(makeMultipartBoundary() != makeMultipartBoundary());
}

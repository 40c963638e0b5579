#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "proxyconn/model/RequestDescription.hpp"

#include <stdexcept>

using namespace proxyconn::model;

TEST_CASE("makeRequestDescription from a URL and options")
{
    SUBCASE("defaults to GET without a body")
    {
        auto description = makeRequestDescription("http://example.com/a");
        CHECK(description.method == "GET");
        CHECK(description.url.host == "example.com");
        CHECK(description.body.empty());
        CHECK_FALSE(description.headers.has("content-length"));
        CHECK_FALSE(description.timeout.has_value());
    }

    SUBCASE("method is upper-cased")
    {
        RequestOptions options;
        options.method = "post";
        options.body = std::string("x=1");
        auto description = makeRequestDescription("http://example.com/", options);
        CHECK(description.method == "POST");
        CHECK(description.body == "x=1");
        CHECK(description.headers.get("content-length").value() == "3");
    }

    SUBCASE("GET drops the body")
    {
        RequestOptions options;
        options.body = std::string("ignored");
        auto description = makeRequestDescription("http://example.com/", options);
        CHECK(description.body.empty());
        CHECK_FALSE(description.carriesBody());
    }

    SUBCASE("JSON body sets content-type only when absent")
    {
        RequestOptions options;
        options.method = "PUT";
        options.body = boost::json::value(boost::json::object{{"a", 1}});
        auto description = makeRequestDescription("http://example.com/", options);
        CHECK(description.headers.get("content-type").value() == "application/json");

        options.headers.set("Content-Type", "application/vnd.api+json");
        description = makeRequestDescription("http://example.com/", options);
        CHECK(description.headers.get("content-type").value() == "application/vnd.api+json");
    }

    SUBCASE("multipart replaces a caller content-type")
    {
        RequestOptions options;
        options.method = "POST";
        options.headers.set("Content-Type", "multipart/form-data");
        FormData form;
        form.appendFile("f", FilePart{"a.txt", "text/plain", "abc"});
        options.body = form;
        auto description = makeRequestDescription("http://example.com/upload", options);
        CHECK(description.headers.get("content-type").value().find("boundary=") != std::string::npos);
    }

    SUBCASE("transfer-encoding is replaced by content-length")
    {
        RequestOptions options;
        options.method = "POST";
        options.headers.set("Transfer-Encoding", "chunked");
        options.body = std::string("12345");
        auto description = makeRequestDescription("http://example.com/", options);
        CHECK_FALSE(description.headers.has("transfer-encoding"));
        CHECK(description.headers.get("content-length").value() == "5");
    }

    SUBCASE("timeout override")
    {
        RequestOptions options;
        options.timeout = std::chrono::milliseconds(250);
        CHECK(makeRequestDescription("http://example.com/", options).timeout == std::chrono::milliseconds(250));
    }
}

TEST_CASE("makeRequestDescription rejects malformed input")
{
    RequestOptions options;
    CHECK_THROWS_AS(makeRequestDescription("not a url", options), std::invalid_argument);

    options.method = "CONNECT";
    CHECK_THROWS_AS(makeRequestDescription("http://example.com/", options), std::invalid_argument);

    options.method = "FROB";
    CHECK_THROWS_AS(makeRequestDescription("http://example.com/", options), std::invalid_argument);

    options.method = "GET";
    options.timeout = std::chrono::milliseconds(0);
    CHECK_THROWS_AS(makeRequestDescription("http://example.com/", options), std::invalid_argument);
}

TEST_CASE("RequestTarget resolves either call shape")
{
    SUBCASE("URL string with options")
    {
        RequestOptions options;
        options.method = "DELETE";
        auto description = resolveRequest(RequestTarget{std::string("https://example.com/x")}, options);
        CHECK(description.method == "DELETE");
        CHECK(description.url.secure());
    }

    SUBCASE("description passes through")
    {
        auto original = makeRequestDescription("http://example.com/y");
        original.method = "patch";
        original.body = "abc";
        auto description = resolveRequest(RequestTarget{original});
        CHECK(description.method == "PATCH");
        CHECK(description.headers.get("content-length").value() == "3");
        CHECK(description.urlString() == "http://example.com/y");
    }

    SUBCASE("options override a description")
    {
        auto original = makeRequestDescription("http://example.com/z");
        RequestOptions options;
        options.method = "POST";
        options.headers.set("X-Trace", "1");
        options.body = std::string("payload");
        auto description = resolveRequest(RequestTarget{original}, options);
        CHECK(description.method == "POST");
        CHECK(description.headers.get("x-trace").value() == "1");
        CHECK(description.body == "payload");
    }

    SUBCASE("an explicit GET replaces a POST description and drops its body")
    {
        RequestOptions post;
        post.method = "POST";
        post.body = std::string("payload");
        auto original = makeRequestDescription("http://example.com/form", post);
        REQUIRE(original.method == "POST");

        RequestOptions options;
        options.method = "GET";
        auto description = resolveRequest(RequestTarget{original}, options);
        CHECK(description.method == "GET");
        CHECK(description.body.empty());
        CHECK_FALSE(description.headers.has("content-length"));
    }

    SUBCASE("options without a method keep the description's method")
    {
        RequestOptions put;
        put.method = "PUT";
        auto original = makeRequestDescription("http://example.com/item", put);

        RequestOptions options;
        options.headers.set("X-Trace", "2");
        auto description = resolveRequest(RequestTarget{original}, options);
        CHECK(description.method == "PUT");
        CHECK(description.headers.get("x-trace").value() == "2");
    }

    SUBCASE("a description without a host is rejected")
    {
        RequestDescription empty;
        CHECK_THROWS_AS(resolveRequest(RequestTarget{empty}), std::invalid_argument);
    }

    SUBCASE("a description with an unknown method is rejected")
    {
        auto original = makeRequestDescription("http://example.com/");
        original.method = "frob";
        CHECK_THROWS_AS(resolveRequest(RequestTarget{original}), std::invalid_argument);
    }
}

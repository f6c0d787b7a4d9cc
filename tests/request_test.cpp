#include <rawhttp/request.hpp>
#include <rawhttp/router.hpp>
#include <rawhttp/response.hpp>

#include <gtest/gtest.h>

using namespace rawhttp;

class RequestParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto noop = [](const HTTP_Request &, HTTP_Response &) {};
        router.add_route("GET", "/", noop);
        router.add_route("GET", "/echo/:str", noop);
        router.add_route("POST", "/files/:filename", noop);
    }

    Router router;
};

TEST_F(RequestParserTest, ParsesRequestLine) {
    auto request = parse_request("GET / HTTP/1.1\r\n\r\n", router);
    EXPECT_EQ(request.method, "GET");
    EXPECT_EQ(request.raw_path, "/");
    EXPECT_EQ(request.path, "/");
    EXPECT_EQ(request.version, "HTTP/1.1");
    EXPECT_TRUE(request.headers.empty());
    EXPECT_TRUE(request.body.empty());
}

TEST_F(RequestParserTest, NormalizesHeaderNames) {
    auto request = parse_request(
        "GET / HTTP/1.1\r\nHost: localhost:4221\r\nUser-Agent: curl/7.64.1\r\nAccept-Encoding: gzip, br\r\n\r\n",
        router);
    EXPECT_EQ(request.headers.at("host"), "localhost:4221");
    EXPECT_EQ(request.headers.at("user_agent"), "curl/7.64.1");
    EXPECT_EQ(request.headers.at("accept_encoding"), "gzip, br");
}

TEST_F(RequestParserTest, TrimsOnlyOneLeadingSpaceFromValues) {
    auto request = parse_request("GET / HTTP/1.1\r\nX-Pad:  two\r\nX-Tight:none\r\n\r\n", router);
    EXPECT_EQ(request.headers.at("x_pad"), " two");
    EXPECT_EQ(request.headers.at("x_tight"), "none");
}

TEST_F(RequestParserTest, NormalizeHeaderNameMapsEveryHyphen) {
    EXPECT_EQ(normalize_header_name("X-Forwarded-For"), "x_forwarded_for");
    EXPECT_EQ(normalize_header_name("HOST"), "host");
}

TEST_F(RequestParserTest, ResolvesParameterizedPath) {
    auto request = parse_request("GET /echo/hello HTTP/1.1\r\n\r\n", router);
    EXPECT_EQ(request.raw_path, "/echo/hello");
    EXPECT_EQ(request.path, "/echo/:str");
    EXPECT_EQ(request.params.at("str"), "hello");
}

TEST_F(RequestParserTest, KeepsRawPathWhenNothingMatches) {
    auto request = parse_request("GET /unregistered/path HTTP/1.1\r\n\r\n", router);
    EXPECT_EQ(request.path, "/unregistered/path");
    EXPECT_TRUE(request.params.empty());
}

TEST_F(RequestParserTest, ReadsBodyAfterBlankLine) {
    auto request = parse_request(
        "POST /files/new.txt HTTP/1.1\r\nContent-Type: application/octet-stream\r\nContent-Length: 11\r\n\r\nhello world",
        router);
    EXPECT_EQ(request.method, "POST");
    EXPECT_EQ(request.path, "/files/:filename");
    EXPECT_EQ(request.params.at("filename"), "new.txt");
    EXPECT_EQ(request.body, "hello world");
    EXPECT_EQ(request.headers.size(), 2u);
}

TEST_F(RequestParserTest, BodyMayContainLineBreaks) {
    auto request = parse_request("POST /files/a HTTP/1.1\r\n\r\nline one\r\nline two\r\n", router);
    EXPECT_EQ(request.body, "line one\r\nline two\r\n");
    EXPECT_TRUE(request.headers.empty());
}

TEST_F(RequestParserTest, WithoutBlankLineLastLineIsBody) {
    auto request = parse_request("POST /files/a HTTP/1.1\r\nHost: x\r\ntrailing", router);
    EXPECT_EQ(request.headers.at("host"), "x");
    EXPECT_EQ(request.body, "trailing");
}

TEST_F(RequestParserTest, MalformedInputDegradesToMiss) {
    auto request = parse_request("garbage", router);
    EXPECT_EQ(request.method, "garbage");
    EXPECT_TRUE(request.raw_path.empty());
    EXPECT_TRUE(request.body.empty());

    auto empty = parse_request("", router);
    EXPECT_TRUE(empty.method.empty());
    EXPECT_TRUE(empty.path.empty());
}

TEST_F(RequestParserTest, SkipsHeaderLinesWithoutName) {
    auto request = parse_request("GET / HTTP/1.1\r\nno colon here\r\n: empty\r\nA: b\r\n\r\n", router);
    EXPECT_EQ(request.headers.size(), 1u);
    EXPECT_EQ(request.headers.at("a"), "b");
}

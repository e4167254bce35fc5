#include "http_client.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(UrlTest, ParsesHttpsWithDefaultPort) {
    Url url = Url::parse("https://api.openai.com/v1/audio/speech");
    EXPECT_EQ(url.scheme, "https");
    EXPECT_EQ(url.host, "api.openai.com");
    EXPECT_EQ(url.port, "443");
    EXPECT_EQ(url.path, "/v1/audio/speech");
}

TEST(UrlTest, ParsesExplicitPortAndBarePath) {
    Url url = Url::parse("HTTP://localhost:8080");
    EXPECT_EQ(url.scheme, "http");
    EXPECT_EQ(url.host, "localhost");
    EXPECT_EQ(url.port, "8080");
    EXPECT_EQ(url.path, "/");
}

TEST(UrlTest, RejectsUnsupportedUrls) {
    EXPECT_THROW(Url::parse("ftp://example.com/file"), std::runtime_error);
    EXPECT_THROW(Url::parse("example.com/v1"), std::runtime_error);
    EXPECT_THROW(Url::parse("https:///v1"), std::runtime_error);
}

TEST(HttpResponseTest, ParsesStatusHeadersAndBody) {
    HttpResponse response = parse_http_response(
        "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nX-Request-Id:  abc \r\n\r\n{\"text\":\"hi\"}");
    EXPECT_EQ(response.status, 200);
    EXPECT_TRUE(response.ok());
    EXPECT_EQ(response.headers["content-type"], "application/json");
    EXPECT_EQ(response.headers["x-request-id"], "abc");
    EXPECT_EQ(response.body, "{\"text\":\"hi\"}");
}

TEST(HttpResponseTest, ErrorStatusIsNotOk) {
    HttpResponse response = parse_http_response("HTTP/1.1 401 Unauthorized\r\n\r\n{\"error\":{}}");
    EXPECT_EQ(response.status, 401);
    EXPECT_FALSE(response.ok());
}

TEST(HttpResponseTest, DecodesChunkedBody) {
    HttpResponse response = parse_http_response(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
        "5\r\nHello\r\n7;ext=1\r\n, world\r\n0\r\n\r\n");
    EXPECT_EQ(response.body, "Hello, world");
}

TEST(HttpResponseTest, MalformedResponsesThrow) {
    EXPECT_THROW(parse_http_response("garbage"), std::runtime_error);
    EXPECT_THROW(parse_http_response("SMTP 220 ready\r\n\r\n"), std::runtime_error);
    EXPECT_THROW(decode_chunked("zz\r\nabc"), std::runtime_error);
    EXPECT_THROW(decode_chunked("10\r\nshort\r\n"), std::runtime_error);
}

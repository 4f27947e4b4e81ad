/**
 * @file test_response.cpp
 * @brief Unit tests for HTTP response serialization and parsing of upstream answers
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "http/response.hpp"

#include <stdexcept>
#include <string>

using http::response;
using ::testing::HasSubstr;
using ::testing::StartsWith;

TEST(ResponseTest, SerializesStatusHeadersAndBody) {
    response res {412};
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_body("nope");

    std::string raw = res.to_string();
    EXPECT_THAT(raw, StartsWith("HTTP/1.1 412 Precondition Failed\r\n"));
    EXPECT_THAT(raw, HasSubstr("\r\nAccess-Control-Allow-Origin: *\r\n"));
    EXPECT_THAT(raw, HasSubstr("\r\nContent-Length: 4\r\n"));
    EXPECT_THAT(raw, HasSubstr("\r\nDate: "));
    EXPECT_EQ(raw.substr(raw.size() - 8), "\r\n\r\nnope");
}

TEST(ResponseTest, CustomPhraseIsKept) {
    response res;
    res.set_code(299, "Whatever");

    EXPECT_THAT(res.to_string(), StartsWith("HTTP/1.1 299 Whatever\r\n"));
}

TEST(ResponseTest, EmptyBodyStillAnnouncesLength) {
    response res {200};

    EXPECT_THAT(res.to_string(), HasSubstr("\r\nContent-Length: 0\r\n"));
}

TEST(ResponseTest, ParsesContentLengthBody) {
    response res = response::parse(
        "HTTP/1.1 200 OK\r\nContent-Type: text/xml\r\nContent-Length: 6\r\n\r\n<a/>\r\nextra");

    EXPECT_EQ(res.get_code(), 200);
    EXPECT_EQ(res.get_phrase(), "OK");
    EXPECT_EQ(res.get_header("content-type"), "text/xml");
    EXPECT_EQ(res.get_body(), "<a/>\r\n");
}

TEST(ResponseTest, ParsesChunkedBody) {
    std::string raw =
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
        "5\r\nhello\r\n"
        "7;ext=1\r\n, world\r\n"
        "0\r\n\r\n";

    response res = response::parse(raw);
    EXPECT_EQ(res.get_body(), "hello, world");

    auto size = response::complete_size(raw);
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(*size, raw.size());
}

TEST(ResponseTest, BodyUntilConnectionClose) {
    response res = response::parse("HTTP/1.0 500 Internal Server Error\r\n\r\n<error/>");

    EXPECT_EQ(res.get_code(), 500);
    EXPECT_EQ(res.get_body(), "<error/>");
    EXPECT_FALSE(response::complete_size("HTTP/1.0 500 Internal Server Error\r\n\r\n<error/>").has_value());
}

TEST(ResponseTest, CompleteSizeWaitsForWholeBody) {
    EXPECT_FALSE(response::complete_size("HTTP/1.1 200 OK\r\nContent-Length: 4\r\n").has_value());
    EXPECT_FALSE(response::complete_size("HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\nab").has_value());
    EXPECT_FALSE(response::complete_size("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n2\r\nab\r\n").has_value());

    auto size = response::complete_size("HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\nabcd");
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(*size, 42u);

    auto no_content = response::complete_size("HTTP/1.1 204 No Content\r\n\r\n");
    ASSERT_TRUE(no_content.has_value());
}

TEST(ResponseTest, MalformedResponsesAreRejected) {
    EXPECT_THROW(response::parse("SSH-2.0-OpenSSH\r\n\r\n"), std::invalid_argument);
    EXPECT_THROW(response::parse("HTTP/1.1 abc OK\r\n\r\n"), std::invalid_argument);
    EXPECT_THROW(response::parse("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort"), std::invalid_argument);
    EXPECT_THROW(response::parse("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n"), std::invalid_argument);
}

TEST(ResponseTest, HugeChunkSizeIsIncomplete) {
    const std::string raw =
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
        "fffffffffffffffd\r\nXYZ";

    EXPECT_THROW(response::parse(raw), std::invalid_argument);
    EXPECT_FALSE(response::complete_size(raw).has_value());

    EXPECT_THROW(response::parse(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nffffffffffffffff\r\n"), std::invalid_argument);
}

TEST(ResponseTest, PhraseTable) {
    EXPECT_EQ(http::get_http_phrase(502), "Bad Gateway");
    EXPECT_EQ(http::get_http_phrase(404), "Not Found");
    EXPECT_EQ(http::get_http_phrase(799), "Unknown");
}

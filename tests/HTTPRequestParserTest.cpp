#include "HTTPRequestParser.hpp"

#include <gtest/gtest.h>

#include <map>
#include <string>

using namespace HTTP;

// ---------------------------------------------------------------------------
// Well-formed requests
// ---------------------------------------------------------------------------
TEST(HTTPRequestParserTest, ParsesCompleteRequest) {
    HttpRequest req = HTTPRequestParser::parse(
        "GET /example HTTP/1.1\r\nHost: localhost:3000\r\nUser-Agent: curl/8.5.0\r\nAccept: */*\r\n\r\nhello world!");

    std::map<std::string, std::string> expected{
        {"Host", "localhost:3000"},
        {"User-Agent", "curl/8.5.0"},
        {"Accept", "*/*"},
    };
    EXPECT_EQ(req.method, Method::GET);
    EXPECT_EQ(req.version, Version::V1_1);
    EXPECT_EQ(req.resource, Resource::Path("/example"));
    EXPECT_EQ(req.headers, expected);
    EXPECT_EQ(req.msg_body, "hello world!");
}

TEST(HTTPRequestParserTest, ParsesCurlStyleRequest) {
    HttpRequest req = HTTPRequestParser::parse(
        "POST /greeting HTTP/2.0\r\nHost: localhost:3000\r\nUser-Agent: curl/7.64.1\r\nAccept: */*\r\n\r\ntestbody123");

    EXPECT_EQ(req.method, Method::POST);
    EXPECT_EQ(req.version, Version::V2_0);
    EXPECT_EQ(req.resource, Resource::Path("/greeting"));
    EXPECT_EQ(req.headers.size(), 3u);
    EXPECT_EQ(req.headers.at("User-Agent"), "curl/7.64.1");
    EXPECT_EQ(req.msg_body, "testbody123");
}

TEST(HTTPRequestParserTest, ResourceIsKeptVerbatim) {
    HttpRequest req = HTTPRequestParser::parse("GET /a%20b/../c?x=1#frag HTTP/1.1\r\n\r\n");
    EXPECT_EQ(req.resource, Resource::Path("/a%20b/../c?x=1#frag"));
}

// ---------------------------------------------------------------------------
// Missing or malformed request line tokens
// ---------------------------------------------------------------------------
TEST(HTTPRequestParserTest, MissingTokensUseDefaults) {
    HttpRequest req = HTTPRequestParser::parse("GET\r\n\r\n");

    EXPECT_EQ(req.method, Method::GET);
    EXPECT_EQ(req.resource, Resource::Path(""));
    EXPECT_EQ(req.version, Version::UNINITIALIZED);
    EXPECT_TRUE(req.headers.empty());
    EXPECT_EQ(req.msg_body, "");
}

TEST(HTTPRequestParserTest, EmptyInputYieldsDefaults) {
    HttpRequest req = HTTPRequestParser::parse("");

    EXPECT_EQ(req.method, Method::UNINITIALIZED);
    EXPECT_EQ(req.resource, Resource::Path(""));
    EXPECT_EQ(req.version, Version::UNINITIALIZED);
    EXPECT_TRUE(req.headers.empty());
    EXPECT_EQ(req.msg_body, "");
}

TEST(HTTPRequestParserTest, UnknownMethodAndVersionFallBack) {
    HttpRequest req = HTTPRequestParser::parse("BREW /pot HTTP/9.9\r\n\r\n");

    EXPECT_EQ(req.method, Method::UNINITIALIZED);
    EXPECT_EQ(req.resource, Resource::Path("/pot"));
    EXPECT_EQ(req.version, Version::UNINITIALIZED);
}

TEST(HTTPRequestParserTest, ExtraRequestLineTokensIgnored) {
    HttpRequest req = HTTPRequestParser::parse("DELETE /item HTTP/1.1 trailing junk\r\n\r\n");

    EXPECT_EQ(req.method, Method::DELETE);
    EXPECT_EQ(req.resource, Resource::Path("/item"));
    EXPECT_EQ(req.version, Version::V1_1);
}

TEST(HTTPRequestParserTest, RequestLineWithoutTerminator) {
    HttpRequest req = HTTPRequestParser::parse("PUT /upload HTTP/1.1");

    EXPECT_EQ(req.method, Method::PUT);
    EXPECT_EQ(req.resource, Resource::Path("/upload"));
    EXPECT_EQ(req.version, Version::V1_1);
    EXPECT_TRUE(req.headers.empty());
    EXPECT_EQ(req.msg_body, "");
}

TEST(HTTPRequestParserTest, BareLineFeedIsNotALineBreak) {
    HttpRequest req = HTTPRequestParser::parse("GET / HTTP/1.1\nHost: x\n\nbody");

    EXPECT_EQ(req.method, Method::GET);
    EXPECT_EQ(req.resource, Resource::Path("/"));
    EXPECT_EQ(req.version, Version::UNINITIALIZED);  // Token is "HTTP/1.1\nHost:"
    EXPECT_TRUE(req.headers.empty());
    EXPECT_EQ(req.msg_body, "");
}

// ---------------------------------------------------------------------------
// Headers
// ---------------------------------------------------------------------------
TEST(HTTPRequestParserTest, HeaderWithoutColonIsDropped) {
    HttpRequest req = HTTPRequestParser::parse(
        "GET / HTTP/1.1\r\nNoColonHere\r\nHost: example.com\r\n\r\n");

    EXPECT_EQ(req.headers.size(), 1u);
    EXPECT_EQ(req.headers.at("Host"), "example.com");
    EXPECT_EQ(req.headers.count("NoColonHere"), 0u);
}

TEST(HTTPRequestParserTest, DuplicateHeaderLastWins) {
    HttpRequest req = HTTPRequestParser::parse(
        "GET / HTTP/1.1\r\nX-Token: first\r\nX-Token: second\r\n\r\n");

    EXPECT_EQ(req.headers.size(), 1u);
    EXPECT_EQ(req.headers.at("X-Token"), "second");
}

TEST(HTTPRequestParserTest, HeaderKeysAndValuesAreTrimmed) {
    HttpRequest req = HTTPRequestParser::parse(
        "GET / HTTP/1.1\r\n  Content-Type \t:   text/plain  \r\n\r\n");

    EXPECT_EQ(req.headers.at("Content-Type"), "text/plain");
}

TEST(HTTPRequestParserTest, HeaderTrimRemovesFormFeedAndVerticalTab) {
    HttpRequest req = HTTPRequestParser::parse(
        "GET / HTTP/1.1\r\n\vX-Id\f: \f42\v\r\n\r\n");

    ASSERT_EQ(req.headers.count("X-Id"), 1u);
    EXPECT_EQ(req.headers.at("X-Id"), "42");
}

TEST(HTTPRequestParserTest, HeaderSplitsOnFirstColonOnly) {
    HttpRequest req = HTTPRequestParser::parse(
        "GET / HTTP/1.1\r\nReferer: http://example.com:8080/x\r\n\r\n");

    EXPECT_EQ(req.headers.at("Referer"), "http://example.com:8080/x");
}

TEST(HTTPRequestParserTest, EmptyHeaderValueIsKept) {
    HttpRequest req = HTTPRequestParser::parse("GET / HTTP/1.1\r\nX-Empty:\r\n\r\n");

    ASSERT_EQ(req.headers.count("X-Empty"), 1u);
    EXPECT_EQ(req.headers.at("X-Empty"), "");
}

TEST(HTTPRequestParserTest, HeaderWithEmptyKeyIsDropped) {
    HttpRequest req = HTTPRequestParser::parse("GET / HTTP/1.1\r\n: orphan\r\n\r\n");
    EXPECT_TRUE(req.headers.empty());
}

TEST(HTTPRequestParserTest, HeadersWithoutBlankLine) {
    HttpRequest req = HTTPRequestParser::parse("GET / HTTP/1.1\r\nHost: a\r\nAccept: b");

    EXPECT_EQ(req.headers.size(), 2u);
    EXPECT_EQ(req.headers.at("Accept"), "b");
    EXPECT_EQ(req.msg_body, "");
}

// ---------------------------------------------------------------------------
// Body
// ---------------------------------------------------------------------------
TEST(HTTPRequestParserTest, MultiLineBodyIsPreserved) {
    HttpRequest req = HTTPRequestParser::parse(
        "POST /submit HTTP/1.1\r\nContent-Length: 20\r\n\r\nline one\r\nline two\r\n");

    EXPECT_EQ(req.msg_body, "line one\r\nline two\r\n");
}

TEST(HTTPRequestParserTest, OnlyFirstBlankLineEndsHeaders) {
    HttpRequest req = HTTPRequestParser::parse(
        "POST / HTTP/1.1\r\nA: 1\r\n\r\nB: 2\r\n\r\ntail");

    EXPECT_EQ(req.headers.size(), 1u);
    EXPECT_EQ(req.headers.count("B"), 0u);
    EXPECT_EQ(req.msg_body, "B: 2\r\n\r\ntail");
}

TEST(HTTPRequestParserTest, BodyStartingWithCRLF) {
    HttpRequest req = HTTPRequestParser::parse("POST / HTTP/1.1\r\n\r\n\r\nafter");
    EXPECT_EQ(req.msg_body, "\r\nafter");
}

// ---------------------------------------------------------------------------
// Lookup helpers
// ---------------------------------------------------------------------------
TEST(HTTPRequestParserTest, GetHeaderIsCaseInsensitive) {
    HttpRequest req = HTTPRequestParser::parse("GET / HTTP/1.1\r\nContent-Type: text/html\r\n\r\n");

    EXPECT_EQ(HTTPRequestParser::getHeader(req, "Content-Type"), "text/html");
    EXPECT_EQ(HTTPRequestParser::getHeader(req, "content-type"), "text/html");
    EXPECT_EQ(HTTPRequestParser::getHeader(req, "X-Missing"), "");
}

TEST(HTTPRequestParserTest, ContentLength) {
    EXPECT_EQ(HTTPRequestParser::getContentLength(
        HTTPRequestParser::parse("POST / HTTP/1.1\r\ncontent-length: 42\r\n\r\n")), 42u);
    EXPECT_EQ(HTTPRequestParser::getContentLength(
        HTTPRequestParser::parse("POST / HTTP/1.1\r\nContent-Length: abc\r\n\r\n")), 0u);
    EXPECT_EQ(HTTPRequestParser::getContentLength(
        HTTPRequestParser::parse("GET / HTTP/1.1\r\n\r\n")), 0u);
}

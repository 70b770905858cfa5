#include "netloom/request-parser.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <string_view>

#include "netloom/byte-stream-reader.hpp"
#include "netloom/http-constants.hpp"
#include "netloom/http-error.hpp"
#include "netloom/http-method.hpp"
#include "netloom/http-request.hpp"
#include "netloom/http-server-config.hpp"
#include "netloom/http-version.hpp"
#include "netloom/scripted-transport.hpp"
#include "netloom/transport.hpp"

namespace netloom {

class RequestParserTest : public ::testing::Test {
 protected:
  ParseResult parse(std::string_view raw, std::size_t segmentSize = 4096) {
    transport.addSplit(raw, segmentSize);
    return parser.parse(reader, request);
  }

  HttpServerConfig config;
  test::ScriptedTransport transport;
  ByteStreamReader reader{transport, config.maxHeaderBytes};
  RequestParser parser{config};
  HttpRequest request;
};

TEST_F(RequestParserTest, SimpleGet) {
  auto result = parse("GET /hello HTTP/1.1\r\nHost: localhost\r\n\r\n");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(request.method(), http::Method::GET);
  EXPECT_EQ(request.path(), "/hello");
  EXPECT_EQ(request.target(), "/hello");
  EXPECT_EQ(request.version(), http::Version::Http11);
  EXPECT_EQ(request.headerValueOrEmpty("host"), "localhost");
  EXPECT_TRUE(request.body().empty());
  EXPECT_TRUE(request.wantsKeepAlive());
  EXPECT_EQ(request.wireSize(), 40U);
}

TEST_F(RequestParserTest, FormBodyDecoded) {
  auto result = parse(
      "POST /form HTTP/1.1\r\nContent-Type: application/x-www-form-urlencoded\r\nContent-Length: 17\r\n\r\n"
      "name=Alice&age=30");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(request.method(), http::Method::POST);
  EXPECT_EQ(request.body(), "name=Alice&age=30");
  ASSERT_EQ(request.formParams().size(), 2U);
  EXPECT_EQ(request.formValue("name"), "Alice");
  EXPECT_EQ(request.formValue("age"), "30");
  EXPECT_FALSE(request.formValue("missing"));
}

TEST_F(RequestParserTest, FormBodyWithCharsetAndEscapes) {
  auto result = parse(
      "POST /form HTTP/1.1\r\nContent-Type: Application/X-WWW-Form-Urlencoded; charset=utf-8\r\n"
      "Content-Length: 24\r\n\r\nmsg=hello+world%21&empty");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(request.formValue("msg"), "hello world!");
  EXPECT_EQ(request.formValue("empty"), "");
}

TEST_F(RequestParserTest, NonFormBodyKeptRaw) {
  auto result = parse("PUT /data HTTP/1.1\r\nContent-Type: application/json\r\nContent-Length: 9\r\n\r\n{\"a\":\"b\"}");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(request.body(), R"({"a":"b"})");
  EXPECT_TRUE(request.formParams().empty());
}

TEST_F(RequestParserTest, BodyReadExactlyAcrossSplits) {
  const std::string body(1000, 'x');
  const std::string raw = "POST /upload HTTP/1.1\r\nContent-Length: 1000\r\n\r\n" + body + "GET /next HTTP/1.1\r\n\r\n";
  for (std::size_t segmentSize : {1U, 5U, 13U, 512U}) {
    test::ScriptedTransport splitTransport;
    splitTransport.addSplit(raw, segmentSize);
    ByteStreamReader splitReader(splitTransport, config.maxHeaderBytes);

    ASSERT_TRUE(parser.parse(splitReader, request).ok()) << "segment size " << segmentSize;
    EXPECT_EQ(request.body(), body);

    // the pipelined request is intact
    ASSERT_TRUE(parser.parse(splitReader, request).ok());
    EXPECT_EQ(request.path(), "/next");
    EXPECT_TRUE(request.body().empty());
  }
}

TEST_F(RequestParserTest, PathAndQueryDecoding) {
  auto result = parse("GET /a%20b/c+d?x=1&y=hello+there&x=2&flag&z=%41 HTTP/1.1\r\n\r\n");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(request.path(), "/a b/c+d");
  EXPECT_EQ(request.rawQuery(), "x=1&y=hello+there&x=2&flag&z=%41");
  EXPECT_EQ(request.queryParam("x"), "2");
  EXPECT_EQ(request.queryParam("y"), "hello there");
  EXPECT_EQ(request.queryParam("flag"), "");
  EXPECT_EQ(request.queryParam("z"), "A");
  EXPECT_FALSE(request.queryParam("w"));
}

TEST_F(RequestParserTest, DuplicateHeadersAreJoined) {
  auto result = parse(
      "GET / HTTP/1.1\r\nAccept: text/html\r\naccept: application/json\r\nCookie: a=1\r\nCookie: b=2\r\n"
      "X-Empty:\r\nX-Empty: v\r\n\r\n");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(request.headerValueOrEmpty("Accept"), "text/html, application/json");
  EXPECT_EQ(request.headerValueOrEmpty(http::CookieHeader), "a=1; b=2");
  EXPECT_EQ(request.headerValueOrEmpty("X-Empty"), "v");
  EXPECT_EQ(request.headers().size(), 3U);
  ASSERT_EQ(request.cookies().size(), 2U);
  EXPECT_EQ(request.cookie("a"), "1");
  EXPECT_EQ(request.cookie("b"), "2");
}

TEST_F(RequestParserTest, HeaderValuesAreTrimmed) {
  auto result = parse("GET / HTTP/1.1\r\nX-Test: \t value with spaces \t\r\nX-Present:\r\n\r\n");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(request.headerValueOrEmpty("x-test"), "value with spaces");
  ASSERT_TRUE(request.headerValue("X-Present"));
  EXPECT_EQ(*request.headerValue("X-Present"), "");
  EXPECT_FALSE(request.headerValue("X-Absent"));
}

TEST_F(RequestParserTest, LeadingEmptyLinesIgnored) {
  auto result = parse("\r\n\r\nGET /x HTTP/1.0\r\n\r\n");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(request.path(), "/x");
  EXPECT_EQ(request.version(), http::Version::Http10);
  EXPECT_FALSE(request.wantsKeepAlive());
}

TEST_F(RequestParserTest, KeepAliveDecision) {
  ASSERT_TRUE(parse("GET / HTTP/1.1\r\nConnection: close\r\n\r\n").ok());
  EXPECT_FALSE(request.wantsKeepAlive());
  ASSERT_TRUE(parse("GET / HTTP/1.0\r\nConnection: Keep-Alive\r\n\r\n").ok());
  EXPECT_TRUE(request.wantsKeepAlive());
}

TEST_F(RequestParserTest, MalformedRequestLines) {
  for (std::string_view line : {"GET /\r\n\r\n", "GET / HTTP/1.1 extra\r\n\r\n", "GET  / HTTP/1.1\r\n\r\n",
                                "get / HTTP/1.1\r\n\r\n", "FETCH / HTTP/1.1\r\n\r\n", "GET hello HTTP/1.1\r\n\r\n",
                                "GET / HTTP/2.0\r\n\r\n", "GET / http/1.1\r\n\r\n", "GET /%zz HTTP/1.1\r\n\r\n",
                                "GET /%4 HTTP/1.1\r\n\r\n"}) {
    test::ScriptedTransport lineTransport{line};
    ByteStreamReader lineReader(lineTransport, config.maxHeaderBytes);
    const auto result = parser.parse(lineReader, request);
    EXPECT_EQ(result.status, ParseResult::Status::Error) << line;
    EXPECT_EQ(result.error, http::ErrorKind::MalformedRequestLine) << line;
  }
}

TEST_F(RequestParserTest, MalformedHeaders) {
  for (std::string_view raw : {"GET / HTTP/1.1\r\nNoColon\r\n\r\n", "GET / HTTP/1.1\r\nBad Name: x\r\n\r\n",
                               "GET / HTTP/1.1\r\n: empty\r\n\r\n", "GET / HTTP/1.1\r\nA: b\r\n folded\r\n\r\n",
                               "GET / HTTP/1.1\r\nContent-Length: abc\r\n\r\n",
                               "GET / HTTP/1.1\r\nContent-Length: -1\r\n\r\n",
                               "GET / HTTP/1.1\r\nContent-Length: 1\r\nContent-Length: 2\r\n\r\nab"}) {
    test::ScriptedTransport headerTransport{raw};
    ByteStreamReader headerReader(headerTransport, config.maxHeaderBytes);
    const auto result = parser.parse(headerReader, request);
    EXPECT_EQ(result.status, ParseResult::Status::Error) << raw;
    EXPECT_EQ(result.error, http::ErrorKind::MalformedHeader) << raw;
  }
}

TEST_F(RequestParserTest, IdenticalDuplicateContentLengthAccepted) {
  auto result = parse("POST / HTTP/1.1\r\nContent-Length: 2\r\nContent-Length: 2\r\n\r\nok");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(request.body(), "ok");
}

TEST_F(RequestParserTest, ChunkedIsRejected) {
  auto result = parse("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nhello\r\n0\r\n\r\n");
  EXPECT_EQ(result.status, ParseResult::Status::Error);
  EXPECT_EQ(result.error, http::ErrorKind::UnsupportedEncoding);
  EXPECT_EQ(http::StatusCodeFor(result.error), 400);
}

TEST_F(RequestParserTest, AnyTransferEncodingIsRejected) {
  auto result = parse("POST / HTTP/1.1\r\nTransfer-Encoding: gzip\r\nContent-Length: 0\r\n\r\n");
  EXPECT_EQ(result.error, http::ErrorKind::UnsupportedEncoding);
}

TEST_F(RequestParserTest, IncompleteBody) {
  auto result = parse("POST / HTTP/1.1\r\nContent-Length: 10\r\n\r\nshort");
  EXPECT_EQ(result.status, ParseResult::Status::Error);
  EXPECT_EQ(result.error, http::ErrorKind::IncompleteBody);
}

TEST_F(RequestParserTest, BodyTimeout) {
  transport.endWith(TransportHint::Timeout);
  auto result = parse("POST / HTTP/1.1\r\nContent-Length: 10\r\n\r\nshort");
  EXPECT_EQ(result.error, http::ErrorKind::RequestTimeout);
}

TEST_F(RequestParserTest, HeadersTimeout) {
  transport.endWith(TransportHint::Timeout);
  auto result = parse("GET / HTTP/1.1\r\nHost: x\r\n");
  EXPECT_EQ(result.status, ParseResult::Status::Error);
  EXPECT_EQ(result.error, http::ErrorKind::RequestTimeout);
}

TEST_F(RequestParserTest, PayloadTooLarge) {
  config.withMaxBodyBytes(8);
  RequestParser smallParser(config);
  transport.addSegment("POST / HTTP/1.1\r\nContent-Length: 9\r\n\r\n123456789");
  auto result = smallParser.parse(reader, request);
  EXPECT_EQ(result.error, http::ErrorKind::PayloadTooLarge);
  EXPECT_EQ(http::StatusCodeFor(result.error), 413);
}

TEST_F(RequestParserTest, HeadersTooLarge) {
  config.withMaxHeaderBytes(64);
  RequestParser smallParser(config);
  transport.addSegment("GET / HTTP/1.1\r\nX-A: 0123456789012345678901234567890\r\nX-B: 0123456789012345678\r\n\r\n");
  auto result = smallParser.parse(reader, request);
  EXPECT_EQ(result.error, http::ErrorKind::HeadersTooLarge);
  EXPECT_EQ(http::StatusCodeFor(result.error), 431);
}

TEST_F(RequestParserTest, UriTooLong) {
  config.withMaxHeaderBytes(64);
  RequestParser smallParser(config);
  transport.addSegment("GET /" + std::string(100, 'a') + " HTTP/1.1\r\n\r\n");
  auto result = smallParser.parse(reader, request);
  EXPECT_EQ(result.error, http::ErrorKind::UriTooLong);
}

TEST_F(RequestParserTest, ClosedBeforeAnyByte) {
  EXPECT_EQ(parse("").status, ParseResult::Status::Closed);
}

TEST_F(RequestParserTest, IdleTimeoutBeforeAnyByteIsAClose) {
  transport.endWith(TransportHint::Timeout);
  EXPECT_EQ(parse("").status, ParseResult::Status::Closed);
}

TEST_F(RequestParserTest, HeaderReadTimeoutAppliedOnceRequestStarted) {
  config.withHeaderReadTimeout(std::chrono::milliseconds{1234});
  RequestParser timedParser(config);
  transport.setReadTimeout(std::chrono::milliseconds{-1});
  transport.addSegment("GET / HTTP/1.1\r\n\r\n");
  ASSERT_TRUE(timedParser.parse(reader, request).ok());
  EXPECT_EQ(transport.readTimeout(), std::chrono::milliseconds{1234});
}

TEST_F(RequestParserTest, PartialRequestLineThenClose) {
  auto result = parse("GET /hel");
  EXPECT_EQ(result.status, ParseResult::Status::Error);
  EXPECT_EQ(result.error, http::ErrorKind::MalformedRequestLine);
}

}  // namespace netloom

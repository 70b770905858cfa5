#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "netloom/compression-middleware.hpp"
#include "netloom/context.hpp"
#include "netloom/cookie.hpp"
#include "netloom/http-constants.hpp"
#include "netloom/http-error.hpp"
#include "netloom/http-method.hpp"
#include "netloom/http-response.hpp"
#include "netloom/http-server-config.hpp"
#include "netloom/http-server.hpp"
#include "netloom/http-status-code.hpp"
#include "netloom/router.hpp"
#include "netloom/server-event.hpp"
#include "netloom/test_server_fixture.hpp"
#include "netloom/test_util.hpp"
#include "spdlog/fmt/fmt.h"

using namespace std::chrono_literals;
using namespace netloom;

namespace {

test::ParsedResponse Get(uint16_t port, std::string_view target,
                         std::vector<std::pair<std::string, std::string>> headers = {}) {
  test::RequestOptions opt;
  opt.target = target;
  opt.headers = std::move(headers);
  return test::parseResponseOrThrow(test::requestOrThrow(port, opt));
}

Router HelloRouter() {
  Router router;
  router.addRoute(http::Method::GET, "/hello", [](Context&) { return HttpResponse().body("hello"); });
  return router;
}

}  // namespace

TEST(HttpCore, HelloExactBytes) {
  test::TestServer ts(HttpServerConfig{}, HelloRouter());
  test::ClientConnection cnx(ts.port());
  ASSERT_TRUE(test::sendAll(cnx.fd(), "GET /hello HTTP/1.1\r\nHost: x\r\n\r\n"));
  EXPECT_EQ(test::recvWithTimeout(cnx.fd()), "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhello");
}

TEST(HttpCore, CloseRequestedByClient) {
  test::TestServer ts(HttpServerConfig{}, HelloRouter());
  const std::string raw = test::sendAndCollect(ts.port(), "GET /hello HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n");
  EXPECT_EQ(raw, "HTTP/1.1 200 OK\r\nContent-Length: 5\r\nConnection: close\r\n\r\nhello");
}

TEST(HttpCore, CustomStatusAndHeaders) {
  Router router;
  router.addRoute(http::Method::GET, "/h", [](Context&) {
    HttpResponse resp;
    resp.status(http::StatusCodeCreated).reason("Made");
    resp.header("X-One", "1").header("X-Two", "two");
    resp.header("x-cAsE", "one").header("X-Case", "two").header("X-CASE", "three");
    resp.body("B");
    return resp;
  });
  test::TestServer ts(HttpServerConfig{}, std::move(router));
  const std::string raw = test::requestOrThrow(ts.port());
  auto resp = test::parseResponseOrThrow(raw);
  EXPECT_EQ(resp.statusCode, http::StatusCodeCreated);
  EXPECT_EQ(resp.reason, "Made");
  EXPECT_EQ(resp.header("X-One"), "1");
  EXPECT_EQ(resp.header("X-Two"), "two");
  EXPECT_EQ(resp.header(http::ContentLength), "1");
  EXPECT_EQ(resp.header(http::Connection), "close");
  // first casing is kept, value replaced
  EXPECT_TRUE(raw.contains("x-cAsE: three")) << raw;
  EXPECT_EQ(resp.headerCount("x-case"), 1U);
  EXPECT_EQ(resp.body, "B");
}

TEST(HttpCore, QueryAndPathParams) {
  Router router;
  router.addRoute(http::Method::GET, "/users/:id", [](Context& ctx) {
    return HttpResponse().body(fmt::format("id={} q={}", *ctx.pathParam("id"), ctx.queryParam("q").value_or("-")));
  });
  test::TestServer ts(HttpServerConfig{}, std::move(router));
  EXPECT_EQ(Get(ts.port(), "/users/42?q=a%20b+c").body, "id=42 q=a b c");
  EXPECT_EQ(Get(ts.port(), "/users/a%20b").body, "id=a b q=-");
}

TEST(HttpCore, FormBodyIsDecoded) {
  Router router;
  router.addRoute(http::Method::POST, "/form", [](Context& ctx) {
    return HttpResponse().body(fmt::format("{}:{}:{}", ctx.formValue("name").value_or("?"),
                                           ctx.formValue("age").value_or("?"), ctx.request().formParams().size()));
  });
  test::TestServer ts(HttpServerConfig{}, std::move(router));
  test::RequestOptions opt;
  opt.method = "POST";
  opt.target = "/form";
  opt.body = "name=Alice&age=30";
  opt.headers.emplace_back("Content-Type", "application/x-www-form-urlencoded");
  auto resp = test::parseResponseOrThrow(test::requestOrThrow(ts.port(), opt));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.body, "Alice:30:2");
}

TEST(HttpCore, BodyEcho) {
  Router router;
  router.addRoute(http::Method::PUT, "/echo",
                  [](Context& ctx) { return HttpResponse().body(std::string(ctx.request().body())); });
  test::TestServer ts(HttpServerConfig{}, std::move(router));
  std::string payload(100000, 'p');
  payload.back() = 'Z';
  test::RequestOptions opt;
  opt.method = "PUT";
  opt.target = "/echo";
  opt.body = payload;
  auto resp = test::parseResponseOrThrow(test::requestOrThrow(ts.port(), opt));
  EXPECT_EQ(resp.body, payload);
}

TEST(HttpCore, HeadSuppressesBody) {
  test::TestServer ts(HttpServerConfig{}, HelloRouter());
  const std::string raw = test::sendAndCollect(ts.port(), "HEAD /hello HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n");
  EXPECT_EQ(raw, "HTTP/1.1 200 OK\r\nContent-Length: 5\r\nConnection: close\r\n\r\n");
}

TEST(HttpCore, GlobalHeadersDoNotOverrideHandlerOnes) {
  Router router;
  router.addRoute(http::Method::GET, "/plain", [](Context&) { return HttpResponse().body("p"); });
  router.addRoute(http::Method::GET, "/custom",
                  [](Context&) { return HttpResponse().header("Server", "custom").body("c"); });
  test::TestServer ts(HttpServerConfig{}.withGlobalHeader("Server", "netloom").withGlobalHeader("X-Global", "g"),
                      std::move(router));
  auto plain = Get(ts.port(), "/plain");
  EXPECT_EQ(plain.header("Server"), "netloom");
  EXPECT_EQ(plain.header("X-Global"), "g");
  auto custom = Get(ts.port(), "/custom");
  EXPECT_EQ(custom.header("Server"), "custom");
  EXPECT_EQ(custom.headerCount("Server"), 1U);
  EXPECT_EQ(custom.header("X-Global"), "g");
  // errors produced by the server also carry them
  EXPECT_EQ(Get(ts.port(), "/nope").header("X-Global"), "g");
}

TEST(HttpCore, HandlerExceptionGives500) {
  Router router;
  router.addRoute(http::Method::GET, "/throw", [](Context&) -> HttpResponse { throw std::runtime_error("boom"); });
  test::TestServer ts(HttpServerConfig{}, std::move(router));
  auto resp = Get(ts.port(), "/throw");
  EXPECT_EQ(resp.statusCode, http::StatusCodeInternalServerError);
  EXPECT_EQ(resp.body, "Internal Server Error\n");
}

TEST(HttpCore, CustomErrorHandler) {
  Router router;
  router.addRoute(http::Method::GET, "/throw", [](Context&) -> HttpResponse { throw std::runtime_error("boom"); });
  router.setErrorHandler([](Context&, const std::exception& ex) {
    return HttpResponse(http::StatusCodeServiceUnavailable).body(fmt::format("failed: {}", ex.what()));
  });
  test::TestServer ts(HttpServerConfig{}, std::move(router));
  auto resp = Get(ts.port(), "/throw");
  EXPECT_EQ(resp.statusCode, http::StatusCodeServiceUnavailable);
  EXPECT_EQ(resp.body, "failed: boom");
}

TEST(HttpCore, BodyProducerFailureAfterHeadClosesWithoutSecondResponse) {
  Router router;
  router.addRoute(http::Method::GET, "/partial", [](Context&) {
    StreamedBody body{100, [nbCalls = 0](std::span<char> buf) mutable -> std::size_t {
                        if (nbCalls++ != 0) {
                          throw std::runtime_error("disk vanished");
                        }
                        std::fill_n(buf.begin(), 10, 'p');
                        return 10;
                      }};
    return HttpResponse().body(std::move(body), http::ContentTypeTextPlain);
  });
  router.addRoute(http::Method::GET, "/hello", [](Context&) { return HttpResponse().body("hello"); });
  test::TestServer ts(HttpServerConfig{}, std::move(router));

  const std::string raw = test::sendAndCollect(ts.port(), "GET /partial HTTP/1.1\r\nHost: x\r\n\r\n");
  EXPECT_EQ(test::countOccurrences(raw, "HTTP/1.1 "), 1) << raw;
  EXPECT_TRUE(raw.starts_with("HTTP/1.1 200 OK\r\nContent-Length: 100\r\n")) << raw;
  EXPECT_TRUE(raw.ends_with("\r\n\r\npppppppppp")) << raw;

  EXPECT_EQ(Get(ts.port(), "/hello").body, "hello");
}

TEST(HttpCore, NonStandardExceptionFromEventSinkOnlyDropsItsConnection) {
  EventSink sink = [](const ServerEvent& event) {
    if (event.kind == ServerEvent::Kind::RequestReceived && event.path == "/boom") {
      throw 42;
    }
  };
  Router router;
  router.addRoute(http::Method::GET, "/*", [](Context&) { return HttpResponse().body("fine"); });
  test::TestServer ts(HttpServerConfig{}.withNbThreads(1), std::move(router), std::move(sink));

  EXPECT_EQ(test::sendAndCollect(ts.port(), "GET /boom HTTP/1.1\r\nHost: x\r\n\r\n"), "");
  // the single worker survived
  EXPECT_EQ(Get(ts.port(), "/ok").body, "fine");
}

TEST(HttpCore, RedirectHelper) {
  Router router;
  router.addRoute(http::Method::GET, "/old", [](Context& ctx) {
    ctx.redirect(http::StatusCodeMovedPermanently, "/new");
    return std::move(ctx.response());
  });
  test::TestServer ts(HttpServerConfig{}, std::move(router));
  auto resp = Get(ts.port(), "/old");
  EXPECT_EQ(resp.statusCode, http::StatusCodeMovedPermanently);
  EXPECT_EQ(resp.header(http::Location), "/new");
  EXPECT_EQ(resp.header(http::ContentLength), "0");
}

TEST(HttpCore, Cookies) {
  Router router;
  router.addRoute(http::Method::GET, "/cookies", [](Context& ctx) {
    http::Cookie session{"session", "xyz"};
    session.path = "/";
    session.httpOnly = true;
    ctx.setCookie(session);
    ctx.setCookie(http::Cookie{"theme", "dark"});
    ctx.sendString(http::StatusCodeOK, fmt::format("{}|{}", ctx.cookie("user").value_or("-"),
                                                   ctx.cookie("lang").value_or("-")));
    return std::move(ctx.response());
  });
  test::TestServer ts(HttpServerConfig{}, std::move(router));
  const std::string raw = test::requestOrThrow(
      ts.port(), test::RequestOptions{.target = "/cookies", .headers = {{"Cookie", "user=bob; lang=fr"}}});
  auto resp = test::parseResponseOrThrow(raw);
  EXPECT_EQ(resp.body, "bob|fr");
  EXPECT_EQ(resp.headerCount(http::SetCookie), 2U);
  EXPECT_TRUE(raw.contains("Set-Cookie: session=xyz; Path=/; HttpOnly\r\n")) << raw;
  EXPECT_TRUE(raw.contains("Set-Cookie: theme=dark\r\n")) << raw;
}

TEST(HttpCore, GzipCompressionNegotiated) {
  std::string text;
  for (int i = 0; i < 100; ++i) {
    text.append("compressible text body ");
  }
  Router router;
  router.use(CompressionMiddleware{});
  router.addRoute(http::Method::GET, "/text",
                  [text](Context&) { return HttpResponse().body(text, http::ContentTypeTextPlain); });
  test::TestServer ts(HttpServerConfig{}, std::move(router));

  auto compressed = Get(ts.port(), "/text", {{"Accept-Encoding", "deflate;q=0.5, gzip"}});
  EXPECT_EQ(compressed.header(http::ContentEncoding), "gzip");
  EXPECT_EQ(compressed.header(http::Vary), "Accept-Encoding");
  EXPECT_LT(compressed.body.size(), text.size());

  auto identity = Get(ts.port(), "/text");
  EXPECT_FALSE(identity.header(http::ContentEncoding));
  EXPECT_EQ(identity.body, text);
}

TEST(HttpCore, ConcurrentConnections) {
  Router router;
  router.addRoute(http::Method::GET, "/slow/:id", [](Context& ctx) {
    std::this_thread::sleep_for(50ms);
    return HttpResponse().body(std::string(*ctx.pathParam("id")));
  });
  test::TestServer ts(HttpServerConfig{}.withNbThreads(4), std::move(router));

  static constexpr int kNbClients = 8;
  std::atomic<int> nbOk{0};
  const auto start = std::chrono::steady_clock::now();
  {
    std::vector<std::jthread> clients;
    for (int clientPos = 0; clientPos < kNbClients; ++clientPos) {
      clients.emplace_back([&nbOk, &ts, clientPos] {
        auto resp = test::parseResponse(
            test::request(ts.port(), test::RequestOptions{.target = fmt::format("/slow/{}", clientPos)})
                .value_or(""));
        if (resp && resp->statusCode == http::StatusCodeOK && resp->body == std::to_string(clientPos)) {
          ++nbOk;
        }
      });
    }
  }
  const auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_EQ(nbOk.load(), kNbClients);
  // 8 requests of 50 ms on 4 workers, far from the 400 ms of a sequential server
  EXPECT_LT(elapsed, 350ms);
}

TEST(HttpCore, EventsArePushedToTheSink) {
  std::mutex mutex;
  std::vector<ServerEvent::Kind> kinds;
  std::vector<std::string> patterns;
  std::vector<http::StatusCode> statuses;
  std::vector<http::ErrorKind> errors;
  EventSink sink = [&](const ServerEvent& event) {
    std::scoped_lock lock(mutex);
    kinds.push_back(event.kind);
    if (event.kind == ServerEvent::Kind::RouteMatched) {
      patterns.emplace_back(event.routePattern);
    }
    if (event.kind == ServerEvent::Kind::ResponseSent) {
      statuses.push_back(event.status);
    }
    if (event.error) {
      errors.push_back(*event.error);
    }
  };
  Router router;
  router.addRoute(http::Method::GET, "/items/:id", [](Context&) { return HttpResponse().body("item"); });
  {
    test::TestServer ts(HttpServerConfig{}, std::move(router), sink);
    EXPECT_EQ(Get(ts.port(), "/items/3").statusCode, http::StatusCodeOK);
    EXPECT_EQ(Get(ts.port(), "/missing").statusCode, http::StatusCodeNotFound);
  }
  std::scoped_lock lock(mutex);
  EXPECT_EQ(kinds, (std::vector<ServerEvent::Kind>{ServerEvent::Kind::RequestReceived, ServerEvent::Kind::RouteMatched,
                                                   ServerEvent::Kind::ResponseSent, ServerEvent::Kind::RequestReceived,
                                                   ServerEvent::Kind::Error, ServerEvent::Kind::ResponseSent}));
  EXPECT_EQ(patterns, std::vector<std::string>{"/items/:id"});
  EXPECT_EQ(statuses, (std::vector<http::StatusCode>{http::StatusCodeOK, http::StatusCodeNotFound}));
  EXPECT_EQ(errors, std::vector<http::ErrorKind>{http::ErrorKind::RouteNotFound});
}

TEST(HttpServer, ConstructionValidatesConfig) {
  EXPECT_THROW(HttpServer(HttpServerConfig{}.withNbThreads(0), Router{}), std::invalid_argument);
  EXPECT_THROW(HttpServer(HttpServerConfig{}.withGlobalHeader("Content-Length", "1"), Router{}),
               std::invalid_argument);
}

TEST(HttpServer, RouterIsFrozen) {
  HttpServer server(HttpServerConfig{}.withHideBanner(), HelloRouter());
  EXPECT_TRUE(server.router().frozen());
  EXPECT_NE(server.port(), 0);
  EXPECT_FALSE(server.isRunning());
}

TEST(HttpServer, PortAlreadyInUse) {
  HttpServer first(HttpServerConfig{}.withHideBanner(), Router{});
  EXPECT_THROW(HttpServer(HttpServerConfig{}.withPort(first.port()).withHideBanner(), Router{}), std::system_error);
}

TEST(HttpServer, RunUntilPredicate) {
  HttpServer server(HttpServerConfig{}.withHideBanner().withPollInterval(5ms), HelloRouter());
  std::atomic<bool> done{false};
  std::jthread loop([&] { server.runUntil([&] { return done.load(); }); });
  auto resp = Get(server.port(), "/hello");
  EXPECT_EQ(resp.body, "hello");
  EXPECT_TRUE(server.isRunning());
  done = true;
  loop.join();
  EXPECT_FALSE(server.isRunning());
  // a server runs once
  EXPECT_THROW(server.run(), std::logic_error);
}

#include "netloom/server-event.hpp"

#include <gtest/gtest.h>

#include "netloom/http-error.hpp"
#include "netloom/http-method.hpp"

namespace netloom {

TEST(ServerEvent, KindNames) {
  EXPECT_EQ(ServerEventKindName(ServerEvent::Kind::RequestReceived), "RequestReceived");
  EXPECT_EQ(ServerEventKindName(ServerEvent::Kind::RouteMatched), "RouteMatched");
  EXPECT_EQ(ServerEventKindName(ServerEvent::Kind::ResponseSent), "ResponseSent");
  EXPECT_EQ(ServerEventKindName(ServerEvent::Kind::Error), "Error");
}

TEST(ServerEvent, LoggingSinkAcceptsEveryKind) {
  EventSink sink = LoggingEventSink();
  ASSERT_TRUE(sink);

  ServerEvent event;
  event.method = http::Method::POST;
  event.path = "/users/42";
  event.routePattern = "/users/:id";
  EXPECT_NO_THROW(sink(event));
  event.kind = ServerEvent::Kind::RouteMatched;
  EXPECT_NO_THROW(sink(event));
  event.kind = ServerEvent::Kind::ResponseSent;
  event.status = 201;
  EXPECT_NO_THROW(sink(event));
  event.kind = ServerEvent::Kind::Error;
  event.error = http::ErrorKind::MiddlewareAborted;
  event.detail = "boom";
  EXPECT_NO_THROW(sink(event));
  event.error.reset();
  EXPECT_NO_THROW(sink(event));
}

}  // namespace netloom

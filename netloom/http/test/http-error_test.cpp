#include "netloom/http-error.hpp"

#include <gtest/gtest.h>

#include "netloom/http-status-code.hpp"

namespace netloom::http {

static_assert(StatusCodeFor(ErrorKind::MalformedRequestLine) == StatusCodeBadRequest);
static_assert(StatusCodeFor(ErrorKind::FileUnreadable) == StatusCodeInternalServerError);

TEST(HttpError, StatusCodes) {
  EXPECT_EQ(StatusCodeFor(ErrorKind::MalformedHeader), StatusCodeBadRequest);
  EXPECT_EQ(StatusCodeFor(ErrorKind::IncompleteBody), StatusCodeBadRequest);
  EXPECT_EQ(StatusCodeFor(ErrorKind::UnsupportedEncoding), StatusCodeBadRequest);
  EXPECT_EQ(StatusCodeFor(ErrorKind::UriTooLong), 414);
  EXPECT_EQ(StatusCodeFor(ErrorKind::HeadersTooLarge), 431);
  EXPECT_EQ(StatusCodeFor(ErrorKind::PayloadTooLarge), 413);
  EXPECT_EQ(StatusCodeFor(ErrorKind::RequestTimeout), 408);
  EXPECT_EQ(StatusCodeFor(ErrorKind::RouteNotFound), StatusCodeNotFound);
  EXPECT_EQ(StatusCodeFor(ErrorKind::MethodNotAllowed), StatusCodeMethodNotAllowed);
  EXPECT_EQ(StatusCodeFor(ErrorKind::MiddlewareAborted), StatusCodeInternalServerError);
  EXPECT_EQ(StatusCodeFor(ErrorKind::ForbiddenPath), StatusCodeForbidden);
  EXPECT_EQ(StatusCodeFor(ErrorKind::FileNotFound), StatusCodeNotFound);
}

TEST(HttpError, ParseErrors) {
  EXPECT_TRUE(IsParseError(ErrorKind::MalformedRequestLine));
  EXPECT_TRUE(IsParseError(ErrorKind::RequestTimeout));
  EXPECT_FALSE(IsParseError(ErrorKind::RouteNotFound));
  EXPECT_FALSE(IsParseError(ErrorKind::FileUnreadable));
}

TEST(HttpError, Names) {
  EXPECT_EQ(ErrorKindName(ErrorKind::PayloadTooLarge), "PayloadTooLarge");
  EXPECT_EQ(ErrorKindName(ErrorKind::ForbiddenPath), "ForbiddenPath");
}

}  // namespace netloom::http

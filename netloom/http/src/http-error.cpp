#include "netloom/http-error.hpp"

#include <string_view>

namespace netloom::http {

std::string_view ErrorKindName(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::MalformedRequestLine:
      return "MalformedRequestLine";
    case ErrorKind::MalformedHeader:
      return "MalformedHeader";
    case ErrorKind::IncompleteBody:
      return "IncompleteBody";
    case ErrorKind::UnsupportedEncoding:
      return "UnsupportedEncoding";
    case ErrorKind::UriTooLong:
      return "UriTooLong";
    case ErrorKind::HeadersTooLarge:
      return "HeadersTooLarge";
    case ErrorKind::PayloadTooLarge:
      return "PayloadTooLarge";
    case ErrorKind::RequestTimeout:
      return "RequestTimeout";
    case ErrorKind::RouteNotFound:
      return "RouteNotFound";
    case ErrorKind::MethodNotAllowed:
      return "MethodNotAllowed";
    case ErrorKind::MiddlewareAborted:
      return "MiddlewareAborted";
    case ErrorKind::ForbiddenPath:
      return "ForbiddenPath";
    case ErrorKind::FileNotFound:
      return "FileNotFound";
    case ErrorKind::FileUnreadable:
      return "FileUnreadable";
    default:
      return "Unknown";
  }
}

}  // namespace netloom::http

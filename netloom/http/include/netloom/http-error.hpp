#pragma once

#include <cstdint>
#include <string_view>

#include "netloom/http-status-code.hpp"

namespace netloom::http {

// Every error the engine recovers from, with the response status it produces.
enum class ErrorKind : std::uint8_t {
  // request parsing - the connection is closed after the error response
  MalformedRequestLine,
  MalformedHeader,
  IncompleteBody,
  UnsupportedEncoding,
  UriTooLong,
  HeadersTooLarge,
  PayloadTooLarge,
  RequestTimeout,
  // routing
  RouteNotFound,
  MethodNotAllowed,
  // middleware / handler execution
  MiddlewareAborted,
  // static files
  ForbiddenPath,
  FileNotFound,
  FileUnreadable
};

constexpr StatusCode StatusCodeFor(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::MalformedRequestLine:
      [[fallthrough]];
    case ErrorKind::MalformedHeader:
      [[fallthrough]];
    case ErrorKind::IncompleteBody:
      [[fallthrough]];
    case ErrorKind::UnsupportedEncoding:
      return StatusCodeBadRequest;
    case ErrorKind::UriTooLong:
      return StatusCodeURITooLong;
    case ErrorKind::HeadersTooLarge:
      return StatusCodeRequestHeaderFieldsTooLarge;
    case ErrorKind::PayloadTooLarge:
      return StatusCodePayloadTooLarge;
    case ErrorKind::RequestTimeout:
      return StatusCodeRequestTimeout;
    case ErrorKind::RouteNotFound:
      return StatusCodeNotFound;
    case ErrorKind::MethodNotAllowed:
      return StatusCodeMethodNotAllowed;
    case ErrorKind::ForbiddenPath:
      return StatusCodeForbidden;
    case ErrorKind::FileNotFound:
      return StatusCodeNotFound;
    case ErrorKind::MiddlewareAborted:
      [[fallthrough]];
    case ErrorKind::FileUnreadable:
      [[fallthrough]];
    default:
      return StatusCodeInternalServerError;
  }
}

std::string_view ErrorKindName(ErrorKind kind) noexcept;

// True for errors detected while parsing a request, after which the connection cannot be reused.
constexpr bool IsParseError(ErrorKind kind) noexcept { return kind <= ErrorKind::RequestTimeout; }

}  // namespace netloom::http

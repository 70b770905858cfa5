#pragma once

#include <cstdint>
#include <string_view>

namespace netloom::http {

using StatusCode = int16_t;

inline constexpr StatusCode StatusCodeContinue = 100;
inline constexpr StatusCode StatusCodeSwitchingProtocols = 101;

inline constexpr StatusCode StatusCodeOK = 200;
inline constexpr StatusCode StatusCodeCreated = 201;
inline constexpr StatusCode StatusCodeAccepted = 202;
inline constexpr StatusCode StatusCodeNoContent = 204;
inline constexpr StatusCode StatusCodePartialContent = 206;

inline constexpr StatusCode StatusCodeMovedPermanently = 301;
inline constexpr StatusCode StatusCodeFound = 302;
inline constexpr StatusCode StatusCodeSeeOther = 303;
inline constexpr StatusCode StatusCodeNotModified = 304;
inline constexpr StatusCode StatusCodeTemporaryRedirect = 307;
inline constexpr StatusCode StatusCodePermanentRedirect = 308;

inline constexpr StatusCode StatusCodeBadRequest = 400;
inline constexpr StatusCode StatusCodeUnauthorized = 401;
inline constexpr StatusCode StatusCodeForbidden = 403;
inline constexpr StatusCode StatusCodeNotFound = 404;
inline constexpr StatusCode StatusCodeMethodNotAllowed = 405;
inline constexpr StatusCode StatusCodeNotAcceptable = 406;
inline constexpr StatusCode StatusCodeRequestTimeout = 408;
inline constexpr StatusCode StatusCodeConflict = 409;
inline constexpr StatusCode StatusCodeGone = 410;
inline constexpr StatusCode StatusCodeLengthRequired = 411;
inline constexpr StatusCode StatusCodePayloadTooLarge = 413;
inline constexpr StatusCode StatusCodeURITooLong = 414;
inline constexpr StatusCode StatusCodeUnsupportedMediaType = 415;
inline constexpr StatusCode StatusCodeImATeapot = 418;
inline constexpr StatusCode StatusCodeUnprocessableEntity = 422;
inline constexpr StatusCode StatusCodeTooManyRequests = 429;
inline constexpr StatusCode StatusCodeRequestHeaderFieldsTooLarge = 431;

inline constexpr StatusCode StatusCodeInternalServerError = 500;
inline constexpr StatusCode StatusCodeNotImplemented = 501;
inline constexpr StatusCode StatusCodeBadGateway = 502;
inline constexpr StatusCode StatusCodeServiceUnavailable = 503;
inline constexpr StatusCode StatusCodeGatewayTimeout = 504;
inline constexpr StatusCode StatusCodeHTTPVersionNotSupported = 505;

// Canonical reason phrase of given status code, or an empty string_view for unknown codes.
constexpr std::string_view ReasonPhraseFor(StatusCode status) noexcept {
  switch (status) {
    case StatusCodeContinue:
      return "Continue";
    case StatusCodeSwitchingProtocols:
      return "Switching Protocols";
    case StatusCodeOK:
      return "OK";
    case StatusCodeCreated:
      return "Created";
    case StatusCodeAccepted:
      return "Accepted";
    case StatusCodeNoContent:
      return "No Content";
    case StatusCodePartialContent:
      return "Partial Content";
    case StatusCodeMovedPermanently:
      return "Moved Permanently";
    case StatusCodeFound:
      return "Found";
    case StatusCodeSeeOther:
      return "See Other";
    case StatusCodeNotModified:
      return "Not Modified";
    case StatusCodeTemporaryRedirect:
      return "Temporary Redirect";
    case StatusCodePermanentRedirect:
      return "Permanent Redirect";
    case StatusCodeBadRequest:
      return "Bad Request";
    case StatusCodeUnauthorized:
      return "Unauthorized";
    case StatusCodeForbidden:
      return "Forbidden";
    case StatusCodeNotFound:
      return "Not Found";
    case StatusCodeMethodNotAllowed:
      return "Method Not Allowed";
    case StatusCodeNotAcceptable:
      return "Not Acceptable";
    case StatusCodeRequestTimeout:
      return "Request Timeout";
    case StatusCodeConflict:
      return "Conflict";
    case StatusCodeGone:
      return "Gone";
    case StatusCodeLengthRequired:
      return "Length Required";
    case StatusCodePayloadTooLarge:
      return "Payload Too Large";
    case StatusCodeURITooLong:
      return "URI Too Long";
    case StatusCodeUnsupportedMediaType:
      return "Unsupported Media Type";
    case StatusCodeImATeapot:
      return "I'm a teapot";
    case StatusCodeUnprocessableEntity:
      return "Unprocessable Entity";
    case StatusCodeTooManyRequests:
      return "Too Many Requests";
    case StatusCodeRequestHeaderFieldsTooLarge:
      return "Request Header Fields Too Large";
    case StatusCodeInternalServerError:
      return "Internal Server Error";
    case StatusCodeNotImplemented:
      return "Not Implemented";
    case StatusCodeBadGateway:
      return "Bad Gateway";
    case StatusCodeServiceUnavailable:
      return "Service Unavailable";
    case StatusCodeGatewayTimeout:
      return "Gateway Timeout";
    case StatusCodeHTTPVersionNotSupported:
      return "HTTP Version Not Supported";
    default:
      return {};
  }
}

}  // namespace netloom::http

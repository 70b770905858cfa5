#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "netloom/http-constants.hpp"
#include "netloom/http-header.hpp"
#include "netloom/http-status-code.hpp"

namespace netloom {

// Body whose bytes are produced on demand while the response is written, for contents too large to be held
// in memory (static files).
// 'produce' fills the given buffer and returns the number of bytes written into it. It is called until
// 'length' bytes have been produced; returning 0 before that aborts the write (and the connection).
// Whatever 'produce' captures (typically an open file) is released with the response.
struct StreamedBody {
  std::size_t length{};
  std::function<std::size_t(std::span<char>)> produce;
};

// -----------------------------------------------------------------------------
// HttpResponse
// -----------------------------------------------------------------------------
// Status, headers and body of a response, built by handlers and middleware and serialized by the
// ResponseWriter.
//
// Framing headers (Content-Length, Transfer-Encoding, Connection) are owned by the server and cannot be set
// by user code: Content-Length is always computed from the body, and Connection: close is emitted when the
// server decides to close the connection.
//
// Setters come in pairs (lvalue / rvalue) so that a response can be built fluently:
//   return HttpResponse(http::StatusCodeCreated).header("X-Id", "42").body("done", http::ContentTypeTextPlain);
class HttpResponse {
 public:
  using Body = std::variant<std::string, StreamedBody>;

  explicit HttpResponse(http::StatusCode statusCode = http::StatusCodeOK) noexcept : _statusCode(statusCode) {}

  [[nodiscard]] http::StatusCode status() const noexcept { return _statusCode; }

  // The reason phrase. Defaults to the standard one for the status code when not set explicitly.
  [[nodiscard]] std::string_view reason() const noexcept;

  // Sets the status code. An explicitly set reason phrase is kept.
  HttpResponse& status(http::StatusCode statusCode) & noexcept {
    _statusCode = statusCode;
    return *this;
  }

  HttpResponse&& status(http::StatusCode statusCode) && noexcept {
    _statusCode = statusCode;
    return std::move(*this);
  }

  // Overrides the reason phrase. Throws std::invalid_argument if it contains CR or LF.
  HttpResponse& reason(std::string_view reason) & {
    setReason(reason);
    return *this;
  }

  HttpResponse&& reason(std::string_view reason) && {
    setReason(reason);
    return std::move(*this);
  }

  // Sets 'key' to 'value', replacing all previous values of 'key' (case-insensitive).
  // Throws std::invalid_argument for an invalid name or value, or a framing header.
  HttpResponse& header(std::string_view key, std::string_view value) & {
    setHeader(key, value);
    return *this;
  }

  HttpResponse&& header(std::string_view key, std::string_view value) && {
    setHeader(key, value);
    return std::move(*this);
  }

  // Appends a header line, keeping the existing ones with the same name (ex: several Set-Cookie).
  // Same validation as header().
  HttpResponse& addHeader(std::string_view key, std::string_view value) & {
    appendHeader(key, value);
    return *this;
  }

  HttpResponse&& addHeader(std::string_view key, std::string_view value) && {
    appendHeader(key, value);
    return std::move(*this);
  }

  HttpResponse& location(std::string_view src) & { return header(http::Location, src); }

  HttpResponse&& location(std::string_view src) && {
    setHeader(http::Location, src);
    return std::move(*this);
  }

  // Sets an in-memory body. If 'contentType' is not empty, the Content-Type header is set accordingly,
  // otherwise the current Content-Type (if any) is kept.
  HttpResponse& body(std::string body, std::string_view contentType = {}) & {
    setBody(std::move(body), contentType);
    return *this;
  }

  HttpResponse&& body(std::string body, std::string_view contentType = {}) && {
    setBody(std::move(body), contentType);
    return std::move(*this);
  }

  // Sets a streamed body. Same Content-Type semantics as the in-memory version.
  // Throws std::invalid_argument if the producer is empty while length is not 0.
  HttpResponse& body(StreamedBody body, std::string_view contentType = {}) & {
    setBody(std::move(body), contentType);
    return *this;
  }

  HttpResponse&& body(StreamedBody body, std::string_view contentType = {}) && {
    setBody(std::move(body), contentType);
    return std::move(*this);
  }

  // Value of the first header named 'key' (case-insensitive), if any.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept;

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view key) const noexcept {
    return headerValue(key).value_or(std::string_view{});
  }

  // Removes all headers named 'key'. Returns the number of removed headers.
  std::size_t eraseHeader(std::string_view key) noexcept;

  // Headers in insertion order.
  [[nodiscard]] const std::vector<http::Header>& headers() const noexcept { return _headers; }

  [[nodiscard]] const Body& bodyVariant() const noexcept { return _body; }

  // In-memory body, or nullptr if the body is streamed.
  [[nodiscard]] const std::string* bodyInMemory() const noexcept { return std::get_if<std::string>(&_body); }

  [[nodiscard]] const StreamedBody* bodyStreamed() const noexcept { return std::get_if<StreamedBody>(&_body); }

  // Value of the Content-Length that will be emitted.
  [[nodiscard]] std::size_t bodyLength() const noexcept;

 private:
  void setReason(std::string_view reason);
  void setHeader(std::string_view key, std::string_view value);
  void appendHeader(std::string_view key, std::string_view value);
  void setBody(std::string body, std::string_view contentType);
  void setBody(StreamedBody body, std::string_view contentType);

  std::vector<http::Header> _headers;
  Body _body;
  std::string _reason;
  http::StatusCode _statusCode;
};

// Plain text response whose body is the reason phrase of 'statusCode' followed by a new line.
HttpResponse MakeStatusResponse(http::StatusCode statusCode);

}  // namespace netloom

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "netloom/byte-stream-reader.hpp"
#include "netloom/http-error.hpp"
#include "netloom/http-request.hpp"
#include "netloom/http-server-config.hpp"

namespace netloom {

struct ParseResult {
  enum class Status : uint8_t {
    Ok,      // a complete request has been parsed
    Closed,  // the peer closed (or stayed idle) before sending any byte of a new request
    Error    // invalid or incomplete request, see 'error'
  };

  static constexpr ParseResult Success() noexcept { return {Status::Ok, {}}; }
  static constexpr ParseResult ConnectionClosed() noexcept { return {Status::Closed, {}}; }
  static constexpr ParseResult Failure(http::ErrorKind error) noexcept { return {Status::Error, error}; }

  [[nodiscard]] constexpr bool ok() const noexcept { return status == Status::Ok; }

  Status status;
  http::ErrorKind error;
};

// Reads one HTTP/1.x request at a time from a ByteStreamReader.
// Errors are reported as values; the parser never throws on malformed input.
// The read timeout configured on the reader by the caller applies until the first byte of the request line;
// the rest of the request is read with the header read timeout.
class RequestParser {
 public:
  explicit RequestParser(const HttpServerConfig& config) noexcept
      : _headerReadTimeout(config.headerReadTimeout),
        _maxHeaderBytes(config.maxHeaderBytes),
        _maxBodyBytes(config.maxBodyBytes) {}

  // Parses the next request from 'reader' into 'request' (which is cleared first).
  ParseResult parse(ByteStreamReader& reader, HttpRequest& request) const;

 private:
  static constexpr int kMaxLeadingEmptyLines = 8;

  ParseResult parseRequestLine(ByteStreamReader& reader, HttpRequest& request) const;
  ParseResult parseHeaders(ByteStreamReader& reader, HttpRequest& request, std::size_t headStart) const;
  ParseResult parseBody(ByteStreamReader& reader, HttpRequest& request) const;

  std::chrono::milliseconds _headerReadTimeout;
  std::size_t _maxHeaderBytes;
  std::size_t _maxBodyBytes;
};

}  // namespace netloom

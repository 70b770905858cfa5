#pragma once

#include <cstddef>
#include <string>

#include "netloom/http-response.hpp"
#include "netloom/transport.hpp"

namespace netloom {

// Serializes HttpResponse objects to the wire format and writes them to a transport.
//
// Wire format:
//   HTTP/1.1 SP status SP reason CRLF
//   Content-Length: <body length> CRLF
//   <user headers, in insertion order> CRLF
//   [Connection: close CRLF]            (only when the connection will be closed)
//   CRLF
//   <body>                              (omitted for HEAD requests, Content-Length kept)
class ResponseWriter {
 public:
  static constexpr std::size_t kDefaultChunkSize = 64UL * 1024UL;

  explicit ResponseWriter(ITransport& transport, std::size_t chunkSize = kDefaultChunkSize) noexcept
      : _transport(transport), _chunkSize(chunkSize == 0 ? kDefaultChunkSize : chunkSize) {}

  // Status line and headers, terminated by the empty line.
  static std::string SerializeHead(const HttpResponse& response, bool closeConnection);

  // Whole response with an in-memory body.
  // Throws std::invalid_argument if the body is streamed.
  static std::string Serialize(const HttpResponse& response, bool closeConnection, bool headOnly = false);

  // Writes the full response. Streamed bodies are pulled chunk by chunk from their producer.
  // Returns false if the transport failed or the body producer stopped early, in which case the
  // connection cannot be reused.
  [[nodiscard]] bool write(const HttpResponse& response, bool closeConnection, bool headOnly);

  // Total bytes written so far.
  [[nodiscard]] std::size_t bytesWritten() const noexcept { return _bytesWritten; }

 private:
  bool writeAll(std::string_view data);

  ITransport& _transport;
  std::size_t _chunkSize;
  std::size_t _bytesWritten{};
};

}  // namespace netloom

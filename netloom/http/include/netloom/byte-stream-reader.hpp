#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "netloom/transport.hpp"

namespace netloom {

// Buffered reader over a blocking transport, delivering lines and fixed-size blocks.
// Bytes received beyond what was asked are kept for the next call, so pipelined requests sent in a single
// segment are not lost, and a message split over several segments is reassembled.
class ByteStreamReader {
 public:
  enum class ReadStatus : std::uint8_t {
    Ok,
    EndOfStream,      // orderly close before any byte of the requested unit
    ConnectionReset,  // I/O error, or close in the middle of a line
    Timeout,          // no byte within the read timeout
    LineTooLong,
    IncompleteBody  // close before the requested number of bytes was received
  };

  static constexpr std::size_t kReadChunkSize = 4096;

  ByteStreamReader(ITransport& transport, std::size_t maxLineLength) noexcept
      : _transport(transport), _maxLineLength(maxLineLength) {}

  // Reads the next line, terminated by CRLF or by a bare LF. The terminator is stripped.
  // On Ok, the line is available through line() until the next read call.
  ReadStatus readLine();

  // Reads exactly n bytes, pulling from the transport as many times as needed.
  // On Ok, the bytes are available through data() until the next read call.
  ReadStatus readExact(std::size_t n);

  [[nodiscard]] std::string_view line() const noexcept { return _line; }

  [[nodiscard]] std::string_view data() const noexcept { return _data; }

  // Maximum line length, terminator excluded.
  void setMaxLineLength(std::size_t maxLineLength) noexcept { _maxLineLength = maxLineLength; }

  [[nodiscard]] std::size_t maxLineLength() const noexcept { return _maxLineLength; }

  // Applies to subsequent reads on the underlying transport.
  void setReadTimeout(std::chrono::milliseconds timeout) noexcept { _transport.setReadTimeout(timeout); }

  // Number of received bytes not consumed yet.
  [[nodiscard]] std::size_t pendingBytes() const noexcept { return _buf.size() - _pos; }

  // Total number of bytes consumed since construction (terminators included).
  [[nodiscard]] std::size_t consumedBytes() const noexcept { return _consumedBytes; }

 private:
  // Appends at most kReadChunkSize bytes from the transport to the buffer.
  TransportHint fill(std::size_t& nbRead);

  void consume(std::size_t n);

  ITransport& _transport;
  std::size_t _maxLineLength;
  std::string _buf;
  std::size_t _pos{};
  std::size_t _consumedBytes{};
  std::string _line;
  std::string _data;
};

}  // namespace netloom

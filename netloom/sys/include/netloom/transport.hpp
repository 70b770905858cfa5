#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace netloom {

// What stopped an I/O operation before it completed.
enum class TransportHint : uint8_t {
  None,     // operation completed (for read: 0 bytes means orderly close)
  Timeout,  // no progress within the read (or write) timeout
  Error     // fatal error (connection reset, broken pipe...)
};

// Base transport abstraction over a connected stream.
class ITransport {
 public:
  virtual ~ITransport() = default;

  struct TransportResult {
    std::size_t bytesProcessed;  // bytes read for read operations, or written for write operations
    TransportHint hint;
  };

  // Blocking read of at most len bytes. Returns as soon as some bytes are available.
  virtual TransportResult read(char* buf, std::size_t len) = 0;

  // Blocking write of the whole buffer. On error or timeout, bytesProcessed tells how much was written.
  virtual TransportResult write(std::string_view data) = 0;

  // Maximum time a read may wait for the first byte. A negative value waits forever.
  void setReadTimeout(std::chrono::milliseconds timeout) noexcept { _readTimeout = timeout; }

  [[nodiscard]] std::chrono::milliseconds readTimeout() const noexcept { return _readTimeout; }

  // Maximum time a write may wait for the peer to make room for more bytes. A negative value waits forever.
  void setWriteTimeout(std::chrono::milliseconds timeout) noexcept { _writeTimeout = timeout; }

  [[nodiscard]] std::chrono::milliseconds writeTimeout() const noexcept { return _writeTimeout; }

 private:
  std::chrono::milliseconds _readTimeout{-1};
  std::chrono::milliseconds _writeTimeout{-1};
};

// Plain transport directly operating on a blocking socket fd (not owned).
class PlainTransport : public ITransport {
 public:
  explicit PlainTransport(int fd) noexcept : _fd(fd) {}

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

 private:
  int _fd;
};

}  // namespace netloom

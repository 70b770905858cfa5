#pragma once

#include <cstdint>

#include "netloom/base-fd.hpp"

namespace netloom {

// RAII class wrapping a blocking TCP (IPv4) socket file descriptor.
class Socket {
 public:
  Socket() noexcept = default;

  struct Open {};

  // Create a new TCP socket. Throws std::system_error on failure.
  explicit Socket(Open);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Bind to INADDR_ANY on the given port and start listening.
  // If port is 0, an ephemeral port is chosen and written back to the argument.
  // Throws std::system_error on failure.
  void bindAndListen(bool reusePort, bool tcpNoDelay, uint16_t& port);

  // Accept a pending connection. Returns a closed BaseFd if no connection could be accepted
  // (interrupted, aborted by the peer, or out of descriptors - the latter is logged).
  [[nodiscard]] BaseFd accept() const;

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace netloom

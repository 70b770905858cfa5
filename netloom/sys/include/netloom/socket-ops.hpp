#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace netloom {

// Thin wrappers over socket related system calls so that higher level modules never include
// networking headers directly.

// Enable TCP_NODELAY (disable Nagle's algorithm) on a TCP socket.
// Returns true on success.
bool SetTcpNoDelay(int fd) noexcept;

// Send data on a connected socket without raising SIGPIPE if the peer is gone.
// Returns the number of bytes sent, or -1 on error (errno is set).
int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept;

inline int64_t SafeSend(int fd, std::string_view data) noexcept { return SafeSend(fd, data.data(), data.size()); }

// Same as SafeSend, but never blocks: sends what fits in the socket buffer and returns -1 with errno set to
// EAGAIN when it is full.
int64_t SendNoWait(int fd, const void* data, std::size_t len) noexcept;

// Shutdown the read half of a socket connection: pending and future reads report an orderly close while
// writes are still possible.
bool ShutdownRead(int fd) noexcept;

// Shutdown both halves of a socket connection: blocked reads and writes return immediately.
bool ShutdownReadWrite(int fd) noexcept;

enum class PollStatus : std::uint8_t { Ready, Timeout, Error };

// Wait until 'fd' is readable (or the peer hung up), at most 'timeout'.
// A negative timeout waits forever. EINTR is retried with the remaining time.
PollStatus WaitReadable(int fd, std::chrono::milliseconds timeout) noexcept;

// Wait until some data can be written to 'fd' (or an error is pending on it), at most 'timeout'.
// Same timeout semantics as WaitReadable.
PollStatus WaitWritable(int fd, std::chrono::milliseconds timeout) noexcept;

}  // namespace netloom

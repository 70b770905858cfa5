#include "netloom/socket-ops.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace netloom {

bool SetTcpNoDelay(int fd) noexcept {
  static constexpr int kEnable = 1;
  return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) == 0;
}

int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept {
  return static_cast<int64_t>(::send(fd, data, len, MSG_NOSIGNAL));
}

int64_t SendNoWait(int fd, const void* data, std::size_t len) noexcept {
  return static_cast<int64_t>(::send(fd, data, len, MSG_NOSIGNAL | MSG_DONTWAIT));
}

bool ShutdownRead(int fd) noexcept { return ::shutdown(fd, SHUT_RD) == 0; }

bool ShutdownReadWrite(int fd) noexcept { return ::shutdown(fd, SHUT_RDWR) == 0; }

namespace {

PollStatus WaitForEvents(int fd, short events, std::chrono::milliseconds timeout) noexcept {
  using Clock = std::chrono::steady_clock;

  const bool infinite = timeout.count() < 0;
  const auto deadline = Clock::now() + (infinite ? std::chrono::milliseconds{0} : timeout);

  pollfd pfd{fd, events, 0};
  while (true) {
    int waitMs = -1;
    if (!infinite) {
      const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
      waitMs = remaining.count() > 0 ? static_cast<int>(remaining.count()) : 0;
    }
    const int ret = ::poll(&pfd, 1, waitMs);
    if (ret > 0) {
      // POLLHUP / POLLERR are reported as ready: the following read or write will observe them.
      return PollStatus::Ready;
    }
    if (ret == 0) {
      return PollStatus::Timeout;
    }
    if (errno != EINTR) {
      return PollStatus::Error;
    }
  }
}

}  // namespace

PollStatus WaitReadable(int fd, std::chrono::milliseconds timeout) noexcept {
  return WaitForEvents(fd, POLLIN, timeout);
}

PollStatus WaitWritable(int fd, std::chrono::milliseconds timeout) noexcept {
  return WaitForEvents(fd, POLLOUT, timeout);
}

}  // namespace netloom

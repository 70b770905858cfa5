#include "netloom/socket.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstdint>
#include <cstring>

#include "netloom/base-fd.hpp"
#include "netloom/errno-throw.hpp"
#include "netloom/log.hpp"
#include "netloom/socket-ops.hpp"

namespace netloom {

Socket::Socket(Open) : _baseFd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

void Socket::bindAndListen(bool reusePort, bool tcpNoDelay, uint16_t& port) {
  const int fd = _baseFd.fd();
  static constexpr int kEnable = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) < 0) {
    throw_errno("setsockopt(SO_REUSEADDR) failed");
  }
  if (reusePort && ::setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &kEnable, sizeof(kEnable)) < 0) {
    throw_errno("setsockopt(SO_REUSEPORT) failed");
  }
  if (tcpNoDelay && !SetTcpNoDelay(fd)) {
    throw_errno("setsockopt(TCP_NODELAY) failed");
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port);
  if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
    throw_errno("bind failed on port {}", port);
  }
  if (::listen(fd, SOMAXCONN) < 0) {
    throw_errno("listen failed on port {}", port);
  }
  if (port == 0) {
    sockaddr_in actual{};
    socklen_t len = sizeof(actual);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&actual), &len) < 0) {
      throw_errno("getsockname failed");
    }
    port = ntohs(actual.sin_port);
  }
}

BaseFd Socket::accept() const {
  BaseFd client(::accept4(_baseFd.fd(), nullptr, nullptr, SOCK_CLOEXEC));
  if (!client) {
    const int err = errno;
    if (err != EINTR && err != EAGAIN && err != ECONNABORTED) {
      log::error("accept on fd # {} failed: {}", _baseFd.fd(), std::strerror(err));
    }
  }
  return client;
}

}  // namespace netloom

#include "netloom/transport.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <string_view>

#include "netloom/socket-ops.hpp"

namespace netloom {

ITransport::TransportResult PlainTransport::read(char* buf, std::size_t len) {
  switch (WaitReadable(_fd, readTimeout())) {
    case PollStatus::Ready:
      break;
    case PollStatus::Timeout:
      return {0, TransportHint::Timeout};
    default:
      return {0, TransportHint::Error};
  }
  while (true) {
    const auto nbRead = ::read(_fd, buf, len);
    if (nbRead >= 0) {
      return {static_cast<std::size_t>(nbRead), TransportHint::None};
    }
    if (errno != EINTR) {
      return {0, TransportHint::Error};
    }
  }
}

ITransport::TransportResult PlainTransport::write(std::string_view data) {
  TransportResult ret{0, TransportHint::None};

  while (ret.bytesProcessed < data.size()) {
    const auto nbWritten = SendNoWait(_fd, data.data() + ret.bytesProcessed, data.size() - ret.bytesProcessed);
    if (nbWritten >= 0) {
      ret.bytesProcessed += static_cast<std::size_t>(nbWritten);
      continue;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      // ECONNRESET, EPIPE...
      ret.hint = TransportHint::Error;
      break;
    }
    // socket buffer full: wait for the peer to read, at most the write timeout
    const PollStatus pollStatus = WaitWritable(_fd, writeTimeout());
    if (pollStatus == PollStatus::Timeout) {
      ret.hint = TransportHint::Timeout;
      break;
    }
    if (pollStatus == PollStatus::Error) {
      ret.hint = TransportHint::Error;
      break;
    }
  }

  return ret;
}

}  // namespace netloom

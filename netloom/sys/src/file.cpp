#include "netloom/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <span>
#include <string>

#include "netloom/log.hpp"

namespace netloom {

File::File(const std::string& path) : _fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC)) {
  if (!_fd) {
    _openErrno = errno;
    log::error("Unable to open file '{}' (errno {}: {})", path, _openErrno, std::strerror(_openErrno));
    return;
  }
  struct stat st{};
  if (::fstat(_fd.fd(), &st) == 0) {
    _fileSize = static_cast<std::size_t>(st.st_size);
  } else {
    log::error("Unable to stat file '{}' (errno {}: {})", path, errno, std::strerror(errno));
  }
}

std::size_t File::readAt(std::span<char> dst, std::size_t offset) const {
  while (true) {
    const auto nbRead = ::pread(_fd.fd(), dst.data(), dst.size(), static_cast<off_t>(offset));
    if (nbRead >= 0) {
      return static_cast<std::size_t>(nbRead);
    }
    if (errno != EINTR) {
      log::error("pread on fd # {} failed: {}", _fd.fd(), std::strerror(errno));
      return kError;
    }
  }
}

}  // namespace netloom

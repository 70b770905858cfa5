#pragma once

#include <cstddef>
#include <limits>
#include <span>
#include <string>

#include "netloom/base-fd.hpp"

namespace netloom {

// Read-only file opened at construction, closed on destruction.
class File {
 public:
  static constexpr std::size_t kError = std::numeric_limits<std::size_t>::max();

  // Default-constructed File is closed.
  File() noexcept = default;

  // Open a file for reading. Does not throw on failure: operator bool() returns false and
  // openErrno() gives the reason.
  explicit File(const std::string& path);

  // Returns true when the File currently holds an opened descriptor.
  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // errno captured by a failed open, 0 otherwise.
  [[nodiscard]] int openErrno() const noexcept { return _openErrno; }

  // File size in bytes at the time of opening, kError if unknown.
  [[nodiscard]] std::size_t size() const noexcept { return _fileSize; }

  // Read up to dst.size() bytes starting at the given absolute offset, retrying on EINTR.
  // Returns the number of bytes read (0 on EOF), kError on error.
  [[nodiscard]] std::size_t readAt(std::span<char> dst, std::size_t offset) const;

 private:
  BaseFd _fd;
  std::size_t _fileSize{kError};
  int _openErrno{0};
};

}  // namespace netloom

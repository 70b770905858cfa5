#pragma once

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <system_error>
#include <utility>

namespace netloom {

// Capture errno immediately and throw std::system_error with a formatted message.
// Usage: throw_errno("bind failed for port {}", port);
template <typename... Args>
[[noreturn]] void throw_errno(fmt::format_string<Args...> fmt, Args&&... args) {
  const int savedErr = errno;
  throw std::system_error(std::error_code(savedErr, std::generic_category()),
                          fmt::format(fmt, std::forward<Args>(args)...));
}

}  // namespace netloom

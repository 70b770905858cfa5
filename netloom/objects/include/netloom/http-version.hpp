#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "netloom/http-constants.hpp"

namespace netloom::http {

// Supported HTTP/1.x versions (RFC 9112 §2.5).
enum class Version : uint8_t { Http10, Http11 };

constexpr std::string_view VersionToStr(Version version) noexcept {
  return version == Version::Http10 ? HTTP10Sv : HTTP11Sv;
}

// Exact, case-sensitive match of the version token.
constexpr std::optional<Version> VersionFromStr(std::string_view str) noexcept {
  if (str == HTTP11Sv) {
    return Version::Http11;
  }
  if (str == HTTP10Sv) {
    return Version::Http10;
  }
  return std::nullopt;
}

}  // namespace netloom::http

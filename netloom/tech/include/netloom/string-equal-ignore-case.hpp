#pragma once

#include <cstddef>
#include <string_view>

#include "netloom/string-trim.hpp"

namespace netloom {

constexpr char tolower(char ch) noexcept {
  if (ch >= 'A' && ch <= 'Z') {
    return static_cast<char>(ch | 0x20);
  }
  return ch;
}

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < lhs.size(); ++pos) {
    if (tolower(lhs[pos]) != tolower(rhs[pos])) {
      return false;
    }
  }
  return true;
}

// True if 'value' contains 'token' as a comma separated element, ignoring case and OWS.
// Ex: CaseInsensitiveContainsToken("gzip, Chunked", "chunked") is true.
constexpr bool CaseInsensitiveContainsToken(std::string_view value, std::string_view token) noexcept {
  while (!value.empty()) {
    const auto commaPos = value.find(',');
    if (CaseInsensitiveEqual(TrimOws(value.substr(0, commaPos)), token)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    value.remove_prefix(commaPos + 1);
  }
  return false;
}

struct CaseInsensitiveHashFunc {
  using is_transparent = void;

  constexpr std::size_t operator()(std::string_view str) const noexcept {
    std::size_t hash = 0;
    for (char ch : str) {
      hash ^= static_cast<std::size_t>(static_cast<unsigned char>(tolower(ch))) + 0x9e3779b97f4a7c15ULL + (hash << 6) +
              (hash >> 2);
    }
    return hash;
  }
};

struct CaseInsensitiveEqualFunc {
  using is_transparent = void;

  constexpr bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
    return CaseInsensitiveEqual(lhs, rhs);
  }
};

}  // namespace netloom

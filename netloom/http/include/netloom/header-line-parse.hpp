#pragma once

#include <string_view>

#include "netloom/string-trim.hpp"

namespace netloom::http {

struct HeaderView {
  std::string_view name;
  std::string_view value;
};

// Parse a single header line 'Name: Value' (without its line terminator).
// The value is stripped of surrounding optional whitespace. The name is returned verbatim (it should be validated
// by the caller, whitespace before the colon is not allowed).
// Returns an empty name on failure (no colon).
constexpr HeaderView ParseHeaderLine(std::string_view line) noexcept {
  const auto colonPos = line.find(':');
  if (colonPos == std::string_view::npos) {
    return {};
  }
  return {line.substr(0, colonPos), TrimOws(line.substr(colonPos + 1))};
}

}  // namespace netloom::http

#pragma once

#include <string>
#include <string_view>

namespace netloom::http {

struct Header {
  std::string name;
  std::string value;

  bool operator==(const Header&) const noexcept = default;
};

// token chars allowed in a header field name (RFC 9110 tchar).
constexpr bool IsTchar(char ch) noexcept {
  if ((ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z')) {
    return true;
  }
  switch (ch) {
    case '!':
    case '#':
    case '$':
    case '%':
    case '&':
    case '\'':
    case '*':
    case '+':
    case '-':
    case '.':
    case '^':
    case '_':
    case '`':
    case '|':
    case '~':
      return true;
    default:
      return false;
  }
}

constexpr bool IsValidHeaderName(std::string_view name) noexcept {
  if (name.empty()) {
    return false;
  }
  for (char ch : name) {
    if (!IsTchar(ch)) {
      return false;
    }
  }
  return true;
}

// Visible ASCII, SP, HTAB and obs-text. CR, LF and other controls are rejected.
constexpr bool IsValidHeaderValue(std::string_view value) noexcept {
  for (char ch : value) {
    const auto uch = static_cast<unsigned char>(ch);
    if (uch != '\t' && (uch < 0x20 || uch == 0x7F)) {
      return false;
    }
  }
  return true;
}

// Response headers managed by the server itself (message framing) that applications may not set.
bool IsReservedResponseHeader(std::string_view name) noexcept;

}  // namespace netloom::http

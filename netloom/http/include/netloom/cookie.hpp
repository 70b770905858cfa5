#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace netloom::http {

struct Cookie {
  std::string name;
  std::string value;
  std::string path;
  std::string domain;
  std::string expires;  // already formatted HTTP date, emitted verbatim
  std::optional<int64_t> maxAge;
  bool secure{false};
  bool httpOnly{false};

  // Renders the value of a Set-Cookie header for this cookie, attributes in the order
  // Path, Domain, Expires, Max-Age, Secure, HttpOnly (absent ones are omitted).
  // Throws std::invalid_argument if the name is empty or the name / value contain forbidden characters.
  [[nodiscard]] std::string toSetCookieValue() const;

  bool operator==(const Cookie&) const noexcept = default;
};

using CookiePairs = std::vector<std::pair<std::string, std::string>>;

// Parses the value of a Cookie request header ("a=1; b=2") into name / value pairs in order of appearance.
// Elements are trimmed, elements without '=' or with an empty name are ignored, and a value surrounded by
// double quotes is unquoted.
CookiePairs ParseCookieHeader(std::string_view headerValue);

}  // namespace netloom::http

#include "netloom/cookie.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

#include "netloom/string-trim.hpp"
#include "spdlog/fmt/fmt.h"

namespace netloom::http {

namespace {

constexpr bool IsCookieOctet(char ch) noexcept {
  const auto uch = static_cast<unsigned char>(ch);
  return uch > 0x20 && uch < 0x7F && ch != '"' && ch != ',' && ch != ';' && ch != '\\';
}

constexpr bool IsValidAttributeValue(std::string_view value) noexcept {
  for (char ch : value) {
    const auto uch = static_cast<unsigned char>(ch);
    if (uch < 0x20 || uch == 0x7F || ch == ';') {
      return false;
    }
  }
  return true;
}

}  // namespace

std::string Cookie::toSetCookieValue() const {
  if (name.empty()) {
    throw std::invalid_argument("Cookie name cannot be empty");
  }
  for (char ch : name) {
    if (!IsCookieOctet(ch) || ch == '=') {
      throw std::invalid_argument(fmt::format("Invalid character in cookie name '{}'", name));
    }
  }
  for (char ch : value) {
    if (!IsCookieOctet(ch)) {
      throw std::invalid_argument(fmt::format("Invalid character in value of cookie '{}'", name));
    }
  }
  if (!IsValidAttributeValue(path) || !IsValidAttributeValue(domain) || !IsValidAttributeValue(expires)) {
    throw std::invalid_argument(fmt::format("Invalid attribute value for cookie '{}'", name));
  }

  std::string ret;
  ret.reserve(name.size() + 1U + value.size() + 64U);
  ret.append(name);
  ret.push_back('=');
  ret.append(value);
  if (!path.empty()) {
    ret.append("; Path=").append(path);
  }
  if (!domain.empty()) {
    ret.append("; Domain=").append(domain);
  }
  if (!expires.empty()) {
    ret.append("; Expires=").append(expires);
  }
  if (maxAge) {
    ret.append("; Max-Age=").append(std::to_string(*maxAge));
  }
  if (secure) {
    ret.append("; Secure");
  }
  if (httpOnly) {
    ret.append("; HttpOnly");
  }
  return ret;
}

CookiePairs ParseCookieHeader(std::string_view headerValue) {
  CookiePairs ret;
  while (!headerValue.empty()) {
    const auto semiPos = headerValue.find(';');
    const std::string_view elem = TrimOws(headerValue.substr(0, semiPos));
    headerValue = semiPos == std::string_view::npos ? std::string_view{} : headerValue.substr(semiPos + 1);

    const auto eqPos = elem.find('=');
    if (eqPos == std::string_view::npos) {
      continue;
    }
    const std::string_view name = TrimOws(elem.substr(0, eqPos));
    std::string_view value = TrimOws(elem.substr(eqPos + 1));
    if (name.empty()) {
      continue;
    }
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
      value = value.substr(1, value.size() - 2);
    }
    ret.emplace_back(name, value);
  }
  return ret;
}

}  // namespace netloom::http

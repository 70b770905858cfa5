#include "netloom/context.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "netloom/cookie.hpp"
#include "netloom/http-constants.hpp"
#include "netloom/http-response.hpp"
#include "netloom/http-status-code.hpp"
#include "spdlog/fmt/fmt.h"

namespace netloom {

std::optional<std::string_view> Context::pathParam(std::string_view name) const noexcept {
  for (const auto& [paramName, paramValue] : _pathParams) {
    if (paramName == name) {
      return std::string_view(paramValue);
    }
  }
  return std::nullopt;
}

HttpResponse& Context::sendString(http::StatusCode statusCode, std::string body) {
  return send(statusCode, std::move(body), http::ContentTypeTextPlain);
}

HttpResponse& Context::send(http::StatusCode statusCode, std::string body, std::string_view contentType) {
  return _response.status(statusCode).body(std::move(body), contentType);
}

HttpResponse& Context::redirect(http::StatusCode statusCode, std::string_view location) {
  if (statusCode < 300 || statusCode > 399) {
    throw std::invalid_argument(fmt::format("Redirect status should be 3xx, got {}", statusCode));
  }
  if (location.empty()) {
    throw std::invalid_argument("Redirect location cannot be empty");
  }
  return _response.status(statusCode).location(location).body(std::string{});
}

HttpResponse& Context::setCookie(const http::Cookie& cookie) {
  return _response.addHeader(http::SetCookie, cookie.toSetCookieValue());
}

bool Context::erase(std::string_view keyName) {
  auto it = _extensions.find(keyName);
  if (it == _extensions.end()) {
    return false;
  }
  _extensions.erase(it);
  return true;
}

}  // namespace netloom

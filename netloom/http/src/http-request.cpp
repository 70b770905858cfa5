#include "netloom/http-request.hpp"

#include <optional>
#include <string_view>

#include "netloom/http-constants.hpp"
#include "netloom/http-version.hpp"
#include "netloom/string-equal-ignore-case.hpp"

namespace netloom {

namespace {

std::optional<std::string_view> Find(const ParamsMap& params, std::string_view key) noexcept {
  const auto it = params.find(key);
  if (it == params.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

}  // namespace

std::string_view HttpRequest::rawQuery() const noexcept {
  const auto qPos = std::string_view(_target).find('?');
  if (qPos == std::string_view::npos) {
    return {};
  }
  return std::string_view(_target).substr(qPos + 1);
}

std::optional<std::string_view> HttpRequest::headerValue(std::string_view headerKey) const noexcept {
  const auto it = _headers.find(headerKey);
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

std::string_view HttpRequest::headerValueOrEmpty(std::string_view headerKey) const noexcept {
  return headerValue(headerKey).value_or(std::string_view{});
}

std::optional<std::string_view> HttpRequest::queryParam(std::string_view key) const noexcept {
  return Find(_queryParams, key);
}

std::optional<std::string_view> HttpRequest::formValue(std::string_view key) const noexcept {
  return Find(_formParams, key);
}

std::optional<std::string_view> HttpRequest::cookie(std::string_view name) const noexcept {
  for (const auto& [cookieName, cookieValue] : _cookies) {
    if (cookieName == name) {
      return std::string_view(cookieValue);
    }
  }
  return std::nullopt;
}

bool HttpRequest::wantsKeepAlive() const noexcept {
  const std::string_view connection = headerValueOrEmpty(http::Connection);
  if (_version == http::Version::Http11) {
    return !CaseInsensitiveContainsToken(connection, http::close);
  }
  return CaseInsensitiveContainsToken(connection, http::keepalive);
}

void HttpRequest::clear() noexcept {
  _target.clear();
  _path.clear();
  _body.clear();
  _headers.clear();
  _queryParams.clear();
  _formParams.clear();
  _cookies.clear();
  _wireSize = 0;
  _method = http::Method::GET;
  _version = http::Version::Http11;
}

}  // namespace netloom

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "netloom/cookie.hpp"
#include "netloom/http-method.hpp"
#include "netloom/http-version.hpp"
#include "netloom/string-equal-ignore-case.hpp"

namespace netloom {

// Case-insensitive map of request headers, at most one entry per header name.
using HeadersMap = std::unordered_map<std::string, std::string, CaseInsensitiveHashFunc, CaseInsensitiveEqualFunc>;

struct TransparentStringHash {
  using is_transparent = void;

  std::size_t operator()(std::string_view str) const noexcept { return std::hash<std::string_view>{}(str); }
};

// Decoded key / value map (query string, form body). The last occurrence of a key wins.
using ParamsMap = std::unordered_map<std::string, std::string, TransparentStringHash, std::equal_to<>>;

class RequestParser;

// A fully received HTTP/1.x request. It owns all its data, so it can outlive the connection buffers.
class HttpRequest {
 public:
  HttpRequest() noexcept = default;

  // The method of the request (GET, PUT, ...)
  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // The URL decoded path (the target without the query string).
  // It cannot be empty.
  // Example:
  //  GET /path               -> '/path'
  //  GET /path?key=val       -> '/path'
  //  GET /path%2Caaa?key=val -> '/path,aaa'
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // The raw request target, as received (not decoded, query string included).
  [[nodiscard]] std::string_view target() const noexcept { return _target; }

  // The raw query string (without the '?'), not decoded. Empty if there is none.
  [[nodiscard]] std::string_view rawQuery() const noexcept;

  [[nodiscard]] http::Version version() const noexcept { return _version; }

  // Returns the (possibly merged) header value for the given key, or std::nullopt if absent.
  // Lookup is case-insensitive. Duplicate request headers are joined in arrival order with ", ",
  // except Cookie which is joined with "; ". Values are trimmed of surrounding whitespace.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view headerKey) const noexcept;

  // Like headerValue() but returns an empty string_view when absent.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view headerKey) const noexcept;

  [[nodiscard]] const HeadersMap& headers() const noexcept { return _headers; }

  // Decoded query parameters ('+' is a space). The last value of a repeated key wins.
  [[nodiscard]] const ParamsMap& queryParams() const noexcept { return _queryParams; }

  [[nodiscard]] std::optional<std::string_view> queryParam(std::string_view key) const noexcept;

  // The request body, exactly Content-Length bytes (empty if there is none).
  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Decoded fields of an application/x-www-form-urlencoded body. Empty for other content types.
  [[nodiscard]] const ParamsMap& formParams() const noexcept { return _formParams; }

  [[nodiscard]] std::optional<std::string_view> formValue(std::string_view key) const noexcept;

  // Cookies from the Cookie header, in order of appearance.
  [[nodiscard]] const http::CookiePairs& cookies() const noexcept { return _cookies; }

  // Value of the first cookie named 'name', if any.
  [[nodiscard]] std::optional<std::string_view> cookie(std::string_view name) const noexcept;

  // Whether the client asks for the connection to stay open after this request, according to its version
  // and Connection header.
  [[nodiscard]] bool wantsKeepAlive() const noexcept;

  // Number of bytes of the request on the wire (head and body).
  [[nodiscard]] std::size_t wireSize() const noexcept { return _wireSize; }

 private:
  friend class RequestParser;

  void clear() noexcept;

  std::string _target;
  std::string _path;
  std::string _body;
  HeadersMap _headers;
  ParamsMap _queryParams;
  ParamsMap _formParams;
  http::CookiePairs _cookies;
  std::size_t _wireSize{};
  http::Method _method{http::Method::GET};
  http::Version _version{http::Version::Http11};
};

}  // namespace netloom

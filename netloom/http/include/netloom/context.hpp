#pragma once

#include <any>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "netloom/cookie.hpp"
#include "netloom/http-request.hpp"
#include "netloom/http-response.hpp"
#include "netloom/http-status-code.hpp"

namespace netloom {

// Values captured by the route pattern, in pattern order. A wildcard capture is stored under its name, or "*".
using PathParams = std::vector<std::pair<std::string, std::string>>;

// Typed key of the Context extension store. Two keys with the same name refer to the same slot.
template <class T>
class ContextKey {
 public:
  explicit constexpr ContextKey(std::string_view name) noexcept : _name(name) {}

  [[nodiscard]] constexpr std::string_view name() const noexcept { return _name; }

 private:
  std::string_view _name;
};

// Per request state shared by the middleware chain and the handler: the parsed request, the captured path
// parameters, the response being built and an extension store where middleware can leave typed values for
// later stages (authenticated user, request id...).
// A Context lives for a single request and is owned by the connection serving it.
class Context {
 public:
  Context(HttpRequest request, PathParams pathParams, std::string_view routePattern = {})
      : _request(std::move(request)), _pathParams(std::move(pathParams)), _routePattern(routePattern) {}

  [[nodiscard]] const HttpRequest& request() const noexcept { return _request; }

  [[nodiscard]] HttpResponse& response() noexcept { return _response; }
  [[nodiscard]] const HttpResponse& response() const noexcept { return _response; }

  [[nodiscard]] const PathParams& pathParams() const noexcept { return _pathParams; }

  // Pattern of the matched route (ex: "/users/:id").
  [[nodiscard]] std::string_view routePattern() const noexcept { return _routePattern; }

  [[nodiscard]] std::optional<std::string_view> pathParam(std::string_view name) const noexcept;

  [[nodiscard]] std::optional<std::string_view> queryParam(std::string_view key) const noexcept {
    return _request.queryParam(key);
  }

  [[nodiscard]] std::optional<std::string_view> formValue(std::string_view key) const noexcept {
    return _request.formValue(key);
  }

  [[nodiscard]] std::optional<std::string_view> cookie(std::string_view name) const noexcept {
    return _request.cookie(name);
  }

  [[nodiscard]] std::optional<std::string_view> header(std::string_view key) const noexcept {
    return _request.headerValue(key);
  }

  // Response helpers. They replace the status and the body of the current response, keeping its headers.
  HttpResponse& sendString(http::StatusCode statusCode, std::string body);

  HttpResponse& send(http::StatusCode statusCode, std::string body, std::string_view contentType);

  // Throws std::invalid_argument if 'statusCode' is not a redirection (3xx) or 'location' is empty.
  HttpResponse& redirect(http::StatusCode statusCode, std::string_view location);

  // Appends a Set-Cookie header. Throws std::invalid_argument for an invalid cookie.
  HttpResponse& setCookie(const http::Cookie& cookie);

  // Extension store.
  template <class T>
  void set(const ContextKey<T>& key, T value) {
    _extensions.insert_or_assign(std::string(key.name()), std::any(std::move(value)));
  }

  // Returns nullptr if the key is absent or holds a value of another type.
  template <class T>
  [[nodiscard]] T* get(const ContextKey<T>& key) noexcept {
    auto it = _extensions.find(key.name());
    return it == _extensions.end() ? nullptr : std::any_cast<T>(&it->second);
  }

  template <class T>
  [[nodiscard]] const T* get(const ContextKey<T>& key) const noexcept {
    auto it = _extensions.find(key.name());
    return it == _extensions.end() ? nullptr : std::any_cast<T>(&it->second);
  }

  [[nodiscard]] bool contains(std::string_view keyName) const noexcept { return _extensions.contains(keyName); }

  // Returns true if a value was removed.
  bool erase(std::string_view keyName);

 private:
  HttpRequest _request;
  PathParams _pathParams;
  std::string_view _routePattern;
  HttpResponse _response;
  std::map<std::string, std::any, std::less<>> _extensions;
};

}  // namespace netloom

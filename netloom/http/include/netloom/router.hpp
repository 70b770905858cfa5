#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "netloom/context.hpp"
#include "netloom/http-error.hpp"
#include "netloom/http-method.hpp"
#include "netloom/middleware.hpp"
#include "netloom/router-config.hpp"
#include "netloom/static-file-config.hpp"

namespace netloom {

class Router;

// Handle on a group of routes sharing a path prefix and group-scoped middleware, created by Router::group().
// It refers to the Router that created it and should not outlive it.
class RouteGroup {
 public:
  // Adds a middleware executed, after the global ones, for every route of this group (including routes
  // added before this call).
  RouteGroup& use(Middleware middleware);

  // Registers a route whose pattern is appended to the group prefix.
  RouteGroup& addRoute(http::MethodBmp methods, std::string_view pattern, std::vector<Middleware> middleware,
                       RequestHandler handler);

  RouteGroup& addRoute(http::MethodBmp methods, std::string_view pattern, RequestHandler handler);

  RouteGroup& addRoute(http::Method method, std::string_view pattern, std::vector<Middleware> middleware,
                       RequestHandler handler);

  RouteGroup& addRoute(http::Method method, std::string_view pattern, RequestHandler handler);

  [[nodiscard]] std::string_view prefix() const noexcept;

 private:
  friend class Router;

  RouteGroup(Router& router, std::size_t groupIdx) noexcept : _pRouter(&router), _groupIdx(groupIdx) {}

  Router* _pRouter;
  std::size_t _groupIdx;
};

// Ordered route table.
//
// Pattern syntax: '/'-separated segments, each one being
//   - a literal, matched exactly (case-sensitive)
//   - ':name', a parameter matching any non-empty segment, captured as text under 'name'
//   - '*' or '*name', a wildcard, only allowed as the last segment, capturing the rest of the path
//     (without its leading '/', possibly empty) under 'name' (or "*")
// Examples:
//   "/users/:id"         matches "/users/42"         with id=42
//   "/static/*"          matches "/static/css/a.css" with *=css/a.css
//
// Matching tries routes in registration order and the first route whose pattern matches and whose method
// set contains the request method wins. A HEAD request falls back to a GET route if no route explicitly
// allows HEAD.
//
// The Router is populated before starting the server, which freezes it. It is then shared read-only
// between all connections.
class Router {
 public:
  struct RoutingResult {
    enum class Status : std::uint8_t { Matched, NotFound, MethodNotAllowed };

    [[nodiscard]] bool matched() const noexcept { return status == Status::Matched; }

    // Error to report when not matched.
    [[nodiscard]] http::ErrorKind error() const noexcept {
      return status == Status::NotFound ? http::ErrorKind::RouteNotFound : http::ErrorKind::MethodNotAllowed;
    }

    Status status{Status::NotFound};
    // Handler of the matched route, nullptr if not matched.
    const RequestHandler* pHandler{nullptr};
    // Middleware to apply, in execution order. The spans point into the Router.
    std::span<const Middleware> globalMiddleware;
    std::span<const Middleware> groupMiddleware;
    std::span<const Middleware> routeMiddleware;
    PathParams pathParams;
    // Methods allowed for the path (set when Status::MethodNotAllowed), HEAD included when GET is.
    http::MethodBmp allowedMethods{};
    // Full pattern of the matched route (group prefix included).
    std::string_view pattern;
  };

  // Creates an empty Router with a 'Normalize' trailing slash policy.
  Router() = default;

  explicit Router(RouterConfig config);

  // Adds a global middleware, executed first for every matched route.
  Router& use(Middleware middleware);

  // Registers a route. Throws std::invalid_argument for an invalid pattern, an empty method set, or an empty
  // handler or middleware, and std::logic_error if the route conflicts with an existing one (same pattern
  // shape with overlapping methods) or if the Router is frozen.
  // A route that may shadow (or be shadowed by) an existing one, such as '/users/:id' and '/users/all',
  // is accepted with a warning: the first registered wins.
  Router& addRoute(http::MethodBmp methods, std::string_view pattern, std::vector<Middleware> middleware,
                   RequestHandler handler);

  Router& addRoute(http::MethodBmp methods, std::string_view pattern, RequestHandler handler);

  Router& addRoute(http::Method method, std::string_view pattern, std::vector<Middleware> middleware,
                   RequestHandler handler);

  Router& addRoute(http::Method method, std::string_view pattern, RequestHandler handler);

  // Creates a group of routes under 'prefix' (ex: "/api"). "/" or an empty prefix means no prefix.
  RouteGroup group(std::string_view prefix);

  // Registers GET and HEAD 'urlPrefix/*' serving files below 'rootDirectory' with a StaticFileHandler.
  // Throws std::invalid_argument if 'rootDirectory' is not an existing directory.
  Router& serveStatic(std::string_view urlPrefix, const std::filesystem::path& rootDirectory,
                      const StaticFileConfig& config = {});

  // Replaces the handler building the response when a middleware or a handler throws.
  Router& setErrorHandler(ErrorHandler errorHandler);

  [[nodiscard]] const ErrorHandler& errorHandler() const noexcept { return _errorHandler; }

  [[nodiscard]] RoutingResult match(http::Method method, std::string_view path) const;

  // After this call, any registration throws std::logic_error.
  void freeze() noexcept { _frozen = true; }

  [[nodiscard]] bool frozen() const noexcept { return _frozen; }

  [[nodiscard]] std::size_t nbRoutes() const noexcept { return _routes.size(); }

  [[nodiscard]] const RouterConfig& config() const noexcept { return _config; }

  // Allow header value for the given methods, in the order of http::Method ("GET, HEAD, POST").
  static std::string AllowHeaderValue(http::MethodBmp methods);

 private:
  friend class RouteGroup;

  static constexpr std::size_t kNoGroup = static_cast<std::size_t>(-1);

  struct Segment {
    enum class Kind : std::uint8_t { Literal, Param, Wildcard };

    Kind kind;
    std::string text;  // literal value, or parameter name
  };

  struct Route {
    std::string pattern;
    std::vector<Segment> segments;
    std::vector<Middleware> middleware;
    RequestHandler handler;
    std::size_t groupIdx;
    http::MethodBmp methods;
  };

  struct Group {
    std::string prefix;
    std::vector<Middleware> middleware;
  };

  void registerRoute(std::size_t groupIdx, http::MethodBmp methods, std::string_view pattern,
                     std::vector<Middleware> middleware, RequestHandler handler);

  void checkNotFrozen() const;

  void checkConflicts(const Route& newRoute) const;

  static std::vector<Segment> CompilePattern(std::string_view pattern);

  static bool MatchRoute(const Route& route, std::string_view path, PathParams& pathParams);

  RoutingResult makeResult(const Route& route, PathParams& pathParams) const;

  RouterConfig _config;
  std::vector<Route> _routes;
  std::vector<Group> _groups;
  std::vector<Middleware> _globalMiddleware;
  ErrorHandler _errorHandler{DefaultErrorHandler};
  bool _frozen{false};
};

}  // namespace netloom

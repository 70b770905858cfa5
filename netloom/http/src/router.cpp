#include "netloom/router.hpp"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "netloom/context.hpp"
#include "netloom/http-method.hpp"
#include "netloom/log.hpp"
#include "netloom/middleware.hpp"
#include "netloom/router-config.hpp"
#include "netloom/static-file-config.hpp"
#include "netloom/static-file-handler.hpp"
#include "spdlog/fmt/fmt.h"

namespace netloom {

namespace {

// Removes trailing slashes, keeping the root "/".
constexpr std::string_view StripTrailingSlashes(std::string_view path) noexcept {
  while (path.size() > 1 && path.back() == '/') {
    path.remove_suffix(1);
  }
  return path;
}

// Normalized group prefix: "" for the root, otherwise starting with '/' and without trailing '/'.
std::string NormalizePrefix(std::string_view prefix) {
  prefix = StripTrailingSlashes(prefix);
  if (prefix.empty() || prefix == "/") {
    return {};
  }
  if (prefix.front() != '/') {
    throw std::invalid_argument(fmt::format("Route prefix '{}' must begin with '/'", prefix));
  }
  return std::string(prefix);
}

std::string JoinPattern(std::string_view prefix, std::string_view pattern) {
  if (pattern.empty() || pattern.front() != '/') {
    throw std::invalid_argument(fmt::format("Route pattern '{}' must begin with '/'", pattern));
  }
  pattern = StripTrailingSlashes(pattern);
  if (prefix.empty()) {
    return std::string(pattern);
  }
  if (pattern == "/") {
    return std::string(prefix);
  }
  std::string ret(prefix);
  ret.append(pattern);
  return ret;
}

}  // namespace

RouteGroup& RouteGroup::use(Middleware middleware) {
  _pRouter->checkNotFrozen();
  if (!middleware) {
    throw std::invalid_argument("Cannot add an empty middleware");
  }
  _pRouter->_groups[_groupIdx].middleware.push_back(std::move(middleware));
  return *this;
}

RouteGroup& RouteGroup::addRoute(http::MethodBmp methods, std::string_view pattern,
                                 std::vector<Middleware> middleware, RequestHandler handler) {
  _pRouter->registerRoute(_groupIdx, methods, pattern, std::move(middleware), std::move(handler));
  return *this;
}

RouteGroup& RouteGroup::addRoute(http::MethodBmp methods, std::string_view pattern, RequestHandler handler) {
  return addRoute(methods, pattern, {}, std::move(handler));
}

RouteGroup& RouteGroup::addRoute(http::Method method, std::string_view pattern, std::vector<Middleware> middleware,
                                 RequestHandler handler) {
  return addRoute(static_cast<http::MethodBmp>(method), pattern, std::move(middleware), std::move(handler));
}

RouteGroup& RouteGroup::addRoute(http::Method method, std::string_view pattern, RequestHandler handler) {
  return addRoute(static_cast<http::MethodBmp>(method), pattern, {}, std::move(handler));
}

std::string_view RouteGroup::prefix() const noexcept { return _pRouter->_groups[_groupIdx].prefix; }

Router::Router(RouterConfig config) : _config(config) {}

Router& Router::use(Middleware middleware) {
  checkNotFrozen();
  if (!middleware) {
    throw std::invalid_argument("Cannot add an empty middleware");
  }
  _globalMiddleware.push_back(std::move(middleware));
  return *this;
}

Router& Router::addRoute(http::MethodBmp methods, std::string_view pattern, std::vector<Middleware> middleware,
                         RequestHandler handler) {
  registerRoute(kNoGroup, methods, pattern, std::move(middleware), std::move(handler));
  return *this;
}

Router& Router::addRoute(http::MethodBmp methods, std::string_view pattern, RequestHandler handler) {
  return addRoute(methods, pattern, {}, std::move(handler));
}

Router& Router::addRoute(http::Method method, std::string_view pattern, std::vector<Middleware> middleware,
                         RequestHandler handler) {
  return addRoute(static_cast<http::MethodBmp>(method), pattern, std::move(middleware), std::move(handler));
}

Router& Router::addRoute(http::Method method, std::string_view pattern, RequestHandler handler) {
  return addRoute(static_cast<http::MethodBmp>(method), pattern, {}, std::move(handler));
}

RouteGroup Router::group(std::string_view prefix) {
  checkNotFrozen();
  _groups.emplace_back(NormalizePrefix(prefix), std::vector<Middleware>{});
  return {*this, _groups.size() - 1U};
}

Router& Router::serveStatic(std::string_view urlPrefix, const std::filesystem::path& rootDirectory,
                            const StaticFileConfig& config) {
  std::string pattern = NormalizePrefix(urlPrefix);
  pattern.append("/*");
  return addRoute(http::Method::GET | http::Method::HEAD, pattern, StaticFileHandler(rootDirectory, config));
}

Router& Router::setErrorHandler(ErrorHandler errorHandler) {
  checkNotFrozen();
  if (!errorHandler) {
    throw std::invalid_argument("Cannot set an empty error handler");
  }
  _errorHandler = std::move(errorHandler);
  return *this;
}

void Router::checkNotFrozen() const {
  if (_frozen) {
    throw std::logic_error("Router cannot be modified once the server is started");
  }
}

std::vector<Router::Segment> Router::CompilePattern(std::string_view pattern) {
  std::vector<Segment> segments;
  // root pattern "/" has no segments
  std::string_view rest = pattern.substr(1);
  while (!rest.empty()) {
    if (!segments.empty() && segments.back().kind == Segment::Kind::Wildcard) {
      throw std::invalid_argument(fmt::format("Wildcard segment must be terminal in '{}'", pattern));
    }
    const auto slashPos = rest.find('/');
    const std::string_view segment = rest.substr(0, slashPos);
    rest = slashPos == std::string_view::npos ? std::string_view{} : rest.substr(slashPos + 1);
    if (segment.empty()) {
      throw std::invalid_argument(fmt::format("Route pattern '{}' contains an empty segment", pattern));
    }
    if (segment.front() == ':' || segment.front() == '*') {
      const bool isWildcard = segment.front() == '*';
      std::string_view name = segment.substr(1);
      if (name.empty()) {
        if (!isWildcard) {
          throw std::invalid_argument(fmt::format("Empty parameter name in '{}'", pattern));
        }
        name = "*";
      }
      if (std::ranges::any_of(segments, [name](const Segment& seg) {
            return seg.kind != Segment::Kind::Literal && seg.text == name;
          })) {
        throw std::invalid_argument(fmt::format("Duplicate parameter name '{}' in '{}'", name, pattern));
      }
      segments.emplace_back(isWildcard ? Segment::Kind::Wildcard : Segment::Kind::Param, std::string(name));
    } else {
      segments.emplace_back(Segment::Kind::Literal, std::string(segment));
    }
  }
  return segments;
}

void Router::checkConflicts(const Route& newRoute) const {
  for (const Route& route : _routes) {
    if ((route.methods & newRoute.methods) == 0) {
      continue;
    }
    // a terminal wildcard matches any rest of the path, possibly empty, whatever its number of segments
    bool sameShape = true;
    bool mayOverlap = true;
    bool wildcardReached = false;
    std::size_t segIdx = 0;
    for (; segIdx < route.segments.size() && segIdx < newRoute.segments.size(); ++segIdx) {
      const Segment& lhs = route.segments[segIdx];
      const Segment& rhs = newRoute.segments[segIdx];
      if (lhs.kind == Segment::Kind::Wildcard || rhs.kind == Segment::Kind::Wildcard) {
        sameShape = sameShape && lhs.kind == rhs.kind;
        wildcardReached = true;
        break;
      }
      if (lhs.kind == Segment::Kind::Literal && rhs.kind == Segment::Kind::Literal) {
        if (lhs.text != rhs.text) {
          mayOverlap = false;
          break;
        }
      } else if (lhs.kind != rhs.kind) {
        sameShape = false;
      }
    }
    if (!mayOverlap) {
      continue;
    }
    if (!wildcardReached && route.segments.size() != newRoute.segments.size()) {
      // the longer one can only match the shorter path through a wildcard capturing the empty rest
      const auto& longer = route.segments.size() > segIdx ? route.segments : newRoute.segments;
      if (longer[segIdx].kind != Segment::Kind::Wildcard) {
        continue;
      }
      sameShape = false;
    }
    if (sameShape) {
      throw std::logic_error(fmt::format("Route '{}' conflicts with already registered route '{}'", newRoute.pattern,
                                         route.pattern));
    }
    log::warn("Route '{}' overlaps with route '{}' registered before it, which takes precedence on common paths",
              newRoute.pattern, route.pattern);
  }
}

void Router::registerRoute(std::size_t groupIdx, http::MethodBmp methods, std::string_view pattern,
                           std::vector<Middleware> middleware, RequestHandler handler) {
  checkNotFrozen();
  if ((methods & http::kAllMethods) == 0) {
    throw std::invalid_argument(fmt::format("Empty method set for route '{}'", pattern));
  }
  if (!handler) {
    throw std::invalid_argument(fmt::format("Cannot set empty RequestHandler for route '{}'", pattern));
  }
  if (std::ranges::any_of(middleware, [](const Middleware& mw) { return !mw; })) {
    throw std::invalid_argument(fmt::format("Empty middleware for route '{}'", pattern));
  }

  const std::string_view prefix = groupIdx == kNoGroup ? std::string_view{} : _groups[groupIdx].prefix;
  Route route{JoinPattern(prefix, pattern), {}, std::move(middleware), std::move(handler), groupIdx,
              static_cast<http::MethodBmp>(methods & http::kAllMethods)};
  route.segments = CompilePattern(route.pattern);
  checkConflicts(route);

  log::debug("Registered route '{}' for methods {}", route.pattern, AllowHeaderValue(route.methods));
  _routes.push_back(std::move(route));
}

bool Router::MatchRoute(const Route& route, std::string_view path, PathParams& pathParams) {
  pathParams.clear();
  std::string_view rest = path.substr(1);
  bool hasMore = !rest.empty();
  for (const Segment& segment : route.segments) {
    if (segment.kind == Segment::Kind::Wildcard) {
      pathParams.emplace_back(segment.text, hasMore ? rest : std::string_view{});
      return true;
    }
    if (!hasMore) {
      return false;
    }
    const auto slashPos = rest.find('/');
    const std::string_view current = rest.substr(0, slashPos);
    hasMore = slashPos != std::string_view::npos;
    rest = hasMore ? rest.substr(slashPos + 1) : std::string_view{};
    if (segment.kind == Segment::Kind::Literal) {
      if (current != segment.text) {
        return false;
      }
    } else {
      if (current.empty()) {
        return false;
      }
      pathParams.emplace_back(segment.text, current);
    }
  }
  return !hasMore;
}

Router::RoutingResult Router::makeResult(const Route& route, PathParams& pathParams) const {
  RoutingResult result;
  result.status = RoutingResult::Status::Matched;
  result.pHandler = &route.handler;
  result.globalMiddleware = _globalMiddleware;
  if (route.groupIdx != kNoGroup) {
    result.groupMiddleware = _groups[route.groupIdx].middleware;
  }
  result.routeMiddleware = route.middleware;
  result.pathParams = std::move(pathParams);
  result.allowedMethods = route.methods;
  result.pattern = route.pattern;
  return result;
}

Router::RoutingResult Router::match(http::Method method, std::string_view path) const {
  if (path.empty() || path.front() != '/') {
    return {};
  }
  if (_config.trailingSlashPolicy == RouterConfig::TrailingSlashPolicy::Normalize) {
    path = StripTrailingSlashes(path);
  }

  PathParams pathParams;
  http::MethodBmp allowedMethods = 0;
  for (const Route& route : _routes) {
    if (!MatchRoute(route, path, pathParams)) {
      continue;
    }
    if (http::IsMethodSet(route.methods, method)) {
      return makeResult(route, pathParams);
    }
    allowedMethods |= route.methods;
  }

  if (method == http::Method::HEAD && http::IsMethodSet(allowedMethods, http::Method::GET)) {
    for (const Route& route : _routes) {
      if (http::IsMethodSet(route.methods, http::Method::GET) && MatchRoute(route, path, pathParams)) {
        return makeResult(route, pathParams);
      }
    }
  }

  RoutingResult result;
  if (allowedMethods != 0) {
    if (http::IsMethodSet(allowedMethods, http::Method::GET)) {
      allowedMethods = allowedMethods | http::Method::HEAD;
    }
    result.status = RoutingResult::Status::MethodNotAllowed;
    result.allowedMethods = allowedMethods;
  }
  return result;
}

std::string Router::AllowHeaderValue(http::MethodBmp methods) {
  std::string ret;
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    const http::Method method = http::MethodFromIdx(methodIdx);
    if (http::IsMethodSet(methods, method)) {
      if (!ret.empty()) {
        ret.append(", ");
      }
      ret.append(http::MethodToStr(method));
    }
  }
  return ret;
}

}  // namespace netloom

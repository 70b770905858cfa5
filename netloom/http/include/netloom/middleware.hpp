#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <span>

#include "netloom/context.hpp"
#include "netloom/http-response.hpp"

namespace netloom {

class MiddlewareChain;

// Continue capability given to a middleware. Calling it runs the rest of the chain (next middleware, or the
// handler) and returns once the response has been produced, so code placed after the call can amend it.
// Not calling it short-circuits the chain: the current ctx.response() is sent as is.
// Calling it twice throws std::logic_error.
class Next {
 public:
  void operator()();

  [[nodiscard]] bool called() const noexcept { return _called; }

 private:
  friend class MiddlewareChain;

  Next(MiddlewareChain& chain, Context& ctx, std::size_t nextIdx) noexcept
      : _pChain(&chain), _pCtx(&ctx), _nextIdx(nextIdx) {}

  MiddlewareChain* _pChain;
  Context* _pCtx;
  std::size_t _nextIdx;
  bool _called{false};
};

// Middleware: may mutate the Context, then either call next() or leave without calling it (short-circuit),
// or throw to abort the request.
using Middleware = std::function<void(Context&, Next&)>;

// Terminal handler of a route. Its returned response becomes ctx.response().
using RequestHandler = std::function<HttpResponse(Context&)>;

// Builds the response sent when a middleware or a handler throws.
using ErrorHandler = std::function<HttpResponse(Context&, const std::exception&)>;

// 500 Internal Server Error, with body "Internal Server Error\n".
HttpResponse DefaultErrorHandler(Context& ctx, const std::exception& ex);

// Runs the middleware of a matched route (global first, then group, then route) and its handler, strictly
// sequentially in the calling thread.
class MiddlewareChain {
 public:
  enum class Outcome : std::uint8_t {
    Completed,       // the handler was reached
    ShortCircuited,  // a middleware did not call next()
    Aborted          // an exception escaped a middleware or the handler, the error handler built the response
  };

  MiddlewareChain(std::span<const Middleware> globalMiddleware, std::span<const Middleware> groupMiddleware,
                  std::span<const Middleware> routeMiddleware, const RequestHandler& handler) noexcept
      : _globalMiddleware(globalMiddleware),
        _groupMiddleware(groupMiddleware),
        _routeMiddleware(routeMiddleware),
        _handler(handler) {}

  // Runs the chain, leaving the response to send in ctx.response().
  // The error handler is called on failure; if it throws as well, DefaultErrorHandler is used.
  Outcome execute(Context& ctx, const ErrorHandler& errorHandler);

  [[nodiscard]] std::size_t nbMiddleware() const noexcept {
    return _globalMiddleware.size() + _groupMiddleware.size() + _routeMiddleware.size();
  }

 private:
  friend class Next;

  void runFrom(Context& ctx, std::size_t idx);

  const Middleware& middlewareAt(std::size_t idx) const noexcept;

  std::span<const Middleware> _globalMiddleware;
  std::span<const Middleware> _groupMiddleware;
  std::span<const Middleware> _routeMiddleware;
  const RequestHandler& _handler;
  bool _handlerReached{false};
};

}  // namespace netloom

#include "netloom/middleware.hpp"

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>

#include "netloom/context.hpp"
#include "netloom/http-constants.hpp"
#include "netloom/http-error.hpp"
#include "netloom/http-method.hpp"
#include "netloom/http-response.hpp"
#include "netloom/http-status-code.hpp"
#include "netloom/log.hpp"

namespace netloom {

void Next::operator()() {
  if (_called) {
    throw std::logic_error("next() can only be called once");
  }
  _called = true;
  _pChain->runFrom(*_pCtx, _nextIdx);
}

HttpResponse DefaultErrorHandler([[maybe_unused]] Context& ctx, [[maybe_unused]] const std::exception& ex) {
  return MakeStatusResponse(http::StatusCodeInternalServerError);
}

const Middleware& MiddlewareChain::middlewareAt(std::size_t idx) const noexcept {
  if (idx < _globalMiddleware.size()) {
    return _globalMiddleware[idx];
  }
  idx -= _globalMiddleware.size();
  if (idx < _groupMiddleware.size()) {
    return _groupMiddleware[idx];
  }
  return _routeMiddleware[idx - _groupMiddleware.size()];
}

void MiddlewareChain::runFrom(Context& ctx, std::size_t idx) {
  if (idx == nbMiddleware()) {
    _handlerReached = true;
    ctx.response() = _handler(ctx);
    return;
  }
  Next next(*this, ctx, idx + 1);
  middlewareAt(idx)(ctx, next);
}

namespace {

void BuildErrorResponse(Context& ctx, const ErrorHandler& errorHandler, const std::exception& ex) {
  log::error("{} on {} {}: {}", http::ErrorKindName(http::ErrorKind::MiddlewareAborted),
             http::MethodToStr(ctx.request().method()), ctx.request().path(), ex.what());
  if (!errorHandler) {
    ctx.response() = DefaultErrorHandler(ctx, ex);
    return;
  }
  try {
    ctx.response() = errorHandler(ctx, ex);
  } catch (const std::exception& handlerEx) {
    log::error("Error handler failed: {}", handlerEx.what());
    ctx.response() = DefaultErrorHandler(ctx, ex);
  }
}

}  // namespace

MiddlewareChain::Outcome MiddlewareChain::execute(Context& ctx, const ErrorHandler& errorHandler) {
  _handlerReached = false;
  try {
    runFrom(ctx, 0);
    return _handlerReached ? Outcome::Completed : Outcome::ShortCircuited;
  } catch (const std::exception& ex) {
    BuildErrorResponse(ctx, errorHandler, ex);
  } catch (...) {
    BuildErrorResponse(ctx, errorHandler, std::runtime_error("unknown exception"));
  }
  return Outcome::Aborted;
}

}  // namespace netloom

#include "netloom/http-server.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <thread>
#include <utility>

#include "netloom/base-fd.hpp"
#include "netloom/byte-stream-reader.hpp"
#include "netloom/context.hpp"
#include "netloom/http-constants.hpp"
#include "netloom/http-error.hpp"
#include "netloom/http-header.hpp"
#include "netloom/http-method.hpp"
#include "netloom/http-request.hpp"
#include "netloom/http-response.hpp"
#include "netloom/http-server-config.hpp"
#include "netloom/log.hpp"
#include "netloom/middleware.hpp"
#include "netloom/request-parser.hpp"
#include "netloom/response-writer.hpp"
#include "netloom/router.hpp"
#include "netloom/server-event.hpp"
#include "netloom/socket-ops.hpp"
#include "netloom/socket.hpp"
#include "netloom/thread-pool.hpp"
#include "netloom/transport.hpp"

namespace netloom {

namespace {

HttpResponse MakeErrorResponse(http::ErrorKind kind) { return MakeStatusResponse(http::StatusCodeFor(kind)); }

}  // namespace

HttpServer::HttpServer(HttpServerConfig config, Router router)
    : _config(std::move(config)),
      _router(std::move(router)),
      _parser(_config),
      _listenSocket(Socket::Open{}),
      _port(_config.port) {
  _config.validate();
  _listenSocket.bindAndListen(_config.reusePort, _config.tcpNoDelay, _port);
  _router.freeze();
}

void HttpServer::setEventSink(EventSink eventSink) {
  if (isRunning()) {
    throw std::logic_error("Cannot change the event sink of a running server");
  }
  _eventSink = std::move(eventSink);
}

void HttpServer::runUntil(const std::function<bool()>& predicate) {
  if (_running.exchange(true, std::memory_order_acq_rel)) {
    throw std::logic_error("Server is already running");
  }
  if (!_listenSocket) {
    _running.store(false, std::memory_order_release);
    throw std::logic_error("Server has already been stopped");
  }
  if (!_config.hideBanner) {
    log::info("HTTP server running on port {}", _port);
  }

  {
    ThreadPool pool(_config.nbThreads);
    while (!_stopRequested.load(std::memory_order_acquire) && !(predicate && predicate())) {
      const PollStatus pollStatus = WaitReadable(_listenSocket.fd(), _config.pollInterval);
      if (pollStatus == PollStatus::Timeout) {
        continue;
      }
      if (pollStatus == PollStatus::Error) {
        log::error("Unable to poll the listening socket of port {}, stopping", _port);
        break;
      }
      BaseFd connection = _listenSocket.accept();
      if (!connection) {
        continue;
      }
      // std::function requires a copyable callable, hence the raw fd
      pool.submit([this, fd = connection.release()] { serveConnection(BaseFd(fd)); });
    }

    _stopRequested.store(true, std::memory_order_release);
    _listenSocket.close();
    shutdownOpenConnections(false);
    // responses in progress get at most one write timeout to complete, then their connections are cut
    const auto graceDeadline = std::chrono::steady_clock::now() + _config.writeTimeout;
    while (nbOpenConnections() != 0 && std::chrono::steady_clock::now() < graceDeadline) {
      std::this_thread::sleep_for(_config.pollInterval);
    }
    shutdownOpenConnections(true);
    // pool destruction waits for the connections being served
  }

  _running.store(false, std::memory_order_release);
  log::info("HTTP server on port {} stopped", _port);
}

void HttpServer::registerConnection(int fd) {
  std::scoped_lock lock(_connectionsMutex);
  _openConnections.insert(fd);
  if (_stopRequested.load(std::memory_order_acquire)) {
    // accepted just before the stop, not reached by shutdownOpenConnections
    if (!ShutdownRead(fd)) {
      log::debug("Unable to shutdown the read side of fd # {}", fd);
    }
  }
}

void HttpServer::unregisterConnection(int fd) {
  std::scoped_lock lock(_connectionsMutex);
  _openConnections.erase(fd);
}

std::size_t HttpServer::nbOpenConnections() const {
  std::scoped_lock lock(_connectionsMutex);
  return _openConnections.size();
}

void HttpServer::shutdownOpenConnections(bool readAndWrite) {
  std::scoped_lock lock(_connectionsMutex);
  for (int fd : _openConnections) {
    if (readAndWrite) {
      // unblocks the workers still writing
      if (!ShutdownReadWrite(fd)) {
        log::debug("Unable to shutdown fd # {}", fd);
      }
      continue;
    }
    // wakes up the workers waiting for a new request, responses in progress can still be written
    if (!ShutdownRead(fd)) {
      log::debug("Unable to shutdown the read side of fd # {}", fd);
    }
  }
}

void HttpServer::serveConnection(BaseFd connection) {
  const int fd = connection.fd();
  registerConnection(fd);

  PlainTransport transport(fd);
  ByteStreamReader reader(transport, _config.maxHeaderBytes);
  ResponseWriter writer(transport);
  HttpRequest request;

  transport.setWriteTimeout(_config.writeTimeout);
  try {
    reader.setReadTimeout(_config.headerReadTimeout);
    for (uint32_t nbRequests = 1;; ++nbRequests) {
      const ParseResult parseResult = _parser.parse(reader, request);
      if (parseResult.status == ParseResult::Status::Closed) {
        break;
      }
      if (parseResult.status == ParseResult::Status::Error) {
        ServerEvent event;
        event.kind = ServerEvent::Kind::Error;
        event.method = request.method();
        event.path = request.path();
        event.error = parseResult.error;
        event.detail = "invalid request";
        emit(event);
        HttpResponse response = MakeErrorResponse(parseResult.error);
        if (!sendResponse(writer, response, request.method(), request.path(), true)) {
          log::debug("Unable to send the {} response on fd # {}", response.status(), fd);
        }
        break;
      }

      const bool keepAlive = _config.enableKeepAlive && request.wantsKeepAlive() &&
                             nbRequests < _config.maxRequestsPerConnection &&
                             !_stopRequested.load(std::memory_order_acquire);
      const std::size_t bytesWrittenBefore = writer.bytesWritten();
      try {
        if (!processRequest(request, writer, !keepAlive) || !keepAlive) {
          break;
        }
      } catch (const std::exception& ex) {
        log::error("Exception while serving a request on fd # {}: {}", fd, ex.what());
        // a partially written response cannot be replaced, the connection is just closed
        if (writer.bytesWritten() == bytesWrittenBefore) {
          HttpResponse response = MakeStatusResponse(http::StatusCodeInternalServerError);
          if (!writer.write(response, true, false)) {
            log::debug("Unable to send the error response on fd # {}", fd);
          }
        }
        break;
      }
      reader.setReadTimeout(_config.keepAliveTimeout);
    }
  } catch (const std::exception& ex) {
    log::error("Connection on fd # {} aborted: {}", fd, ex.what());
  } catch (...) {
    log::error("Connection on fd # {} aborted by an unknown exception", fd);
  }

  unregisterConnection(fd);
}

bool HttpServer::processRequest(HttpRequest& request, ResponseWriter& writer, bool closeConnection) {
  const http::Method method = request.method();
  emit(ServerEvent::Kind::RequestReceived, method, request.path());

  Router::RoutingResult routing = _router.match(method, request.path());
  if (!routing.matched()) {
    HttpResponse response = MakeErrorResponse(routing.error());
    if (routing.status == Router::RoutingResult::Status::MethodNotAllowed) {
      response.header(http::Allow, Router::AllowHeaderValue(routing.allowedMethods));
    }
    ServerEvent event;
    event.kind = ServerEvent::Kind::Error;
    event.method = method;
    event.path = request.path();
    event.error = routing.error();
    emit(event);
    return sendResponse(writer, response, method, request.path(), closeConnection);
  }

  Context ctx(std::move(request), std::move(routing.pathParams), routing.pattern);
  const std::string_view path = ctx.request().path();

  ServerEvent matchedEvent;
  matchedEvent.kind = ServerEvent::Kind::RouteMatched;
  matchedEvent.method = method;
  matchedEvent.path = path;
  matchedEvent.routePattern = routing.pattern;
  emit(matchedEvent);

  MiddlewareChain chain(routing.globalMiddleware, routing.groupMiddleware, routing.routeMiddleware,
                        *routing.pHandler);
  if (chain.execute(ctx, _router.errorHandler()) == MiddlewareChain::Outcome::Aborted) {
    ServerEvent event;
    event.kind = ServerEvent::Kind::Error;
    event.method = method;
    event.path = path;
    event.routePattern = routing.pattern;
    event.error = http::ErrorKind::MiddlewareAborted;
    emit(event);
  }
  return sendResponse(writer, ctx.response(), method, path, closeConnection);
}

bool HttpServer::sendResponse(ResponseWriter& writer, HttpResponse& response, http::Method method,
                              std::string_view path, bool closeConnection) {
  for (const http::Header& header : _config.globalHeaders) {
    if (!response.headerValue(header.name)) {
      response.addHeader(header.name, header.value);
    }
  }
  const bool written = writer.write(response, closeConnection, method == http::Method::HEAD);

  ServerEvent event;
  event.kind = written ? ServerEvent::Kind::ResponseSent : ServerEvent::Kind::Error;
  event.method = method;
  event.path = path;
  event.status = response.status();
  if (!written) {
    event.detail = "response could not be written entirely";
  }
  emit(event);
  return written;
}

void HttpServer::emit(ServerEvent::Kind kind, http::Method method, std::string_view path) const {
  ServerEvent event;
  event.kind = kind;
  event.method = method;
  event.path = path;
  emit(event);
}

void HttpServer::emit(const ServerEvent& event) const {
  if (_eventSink) {
    _eventSink(event);
  }
}

}  // namespace netloom

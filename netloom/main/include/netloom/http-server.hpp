#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <unordered_set>

#include "netloom/base-fd.hpp"
#include "netloom/http-request.hpp"
#include "netloom/http-response.hpp"
#include "netloom/http-server-config.hpp"
#include "netloom/request-parser.hpp"
#include "netloom/response-writer.hpp"
#include "netloom/router.hpp"
#include "netloom/server-event.hpp"
#include "netloom/socket.hpp"

namespace netloom {

// HttpServer
//  - Binds and listens in its constructor, then serves connections from run() / runUntil() which block the
//    calling thread running the accept loop.
//  - Every accepted connection is served by one worker of an internal ThreadPool (HttpServerConfig::nbThreads)
//    on a blocking socket, sequentially from its first request to its close.
//  - The Router is frozen at construction and shared read-only by the workers.
//  - A server instance runs at most once: after stop() (or the end of runUntil) the listening socket is closed.
//
// Typical usage:
//   Router router;
//   router.addRoute(http::Method::GET, "/hello", [](Context&) { return HttpResponse().body("hello"); });
//   HttpServer server(HttpServerConfig{}.withPort(8080), std::move(router));
//   server.run();  // until server.stop() is called from another thread
class HttpServer {
 public:
  // Throws std::invalid_argument for an invalid configuration and std::system_error if the listening socket
  // cannot be set up.
  HttpServer(HttpServerConfig config, Router router);

  HttpServer(const HttpServer&) = delete;
  HttpServer(HttpServer&&) noexcept = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer& operator=(HttpServer&&) noexcept = delete;

  // The server should be stopped, and its run() call returned, before destruction.
  ~HttpServer() { stop(); }

  // Actual bound port (the ephemeral one chosen by the OS if configured port was 0).
  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  [[nodiscard]] const HttpServerConfig& config() const noexcept { return _config; }

  [[nodiscard]] const Router& router() const noexcept { return _router; }

  // Install the sink receiving the events of the request pipeline. Throws std::logic_error if running.
  void setEventSink(EventSink eventSink);

  // Blocks serving connections until stop() is called.
  // Throws std::logic_error if the server is already running or has already been stopped.
  void run() { runUntil({}); }

  // Same as run(), also returning when 'predicate' returns true (checked every pollInterval).
  void runUntil(const std::function<bool()>& predicate);

  // Request the accept loop to stop. Can be called from any thread. Idle connections are closed, connections
  // serving a request finish it (without keep-alive) within HttpServerConfig::writeTimeout, then run() returns.
  void stop() noexcept { _stopRequested.store(true, std::memory_order_release); }

  [[nodiscard]] bool isRunning() const noexcept { return _running.load(std::memory_order_acquire); }

 private:
  void serveConnection(BaseFd connection);

  // Routes and executes a parsed request, then writes its response.
  // Returns false if the response could not be written entirely.
  bool processRequest(HttpRequest& request, ResponseWriter& writer, bool closeConnection);

  bool sendResponse(ResponseWriter& writer, HttpResponse& response, http::Method method, std::string_view path,
                    bool closeConnection);

  void emit(ServerEvent::Kind kind, http::Method method, std::string_view path) const;
  void emit(const ServerEvent& event) const;

  void registerConnection(int fd);
  void unregisterConnection(int fd);
  [[nodiscard]] std::size_t nbOpenConnections() const;

  // Shuts down the read side of all open connections, or both sides if 'readAndWrite'.
  void shutdownOpenConnections(bool readAndWrite);

  HttpServerConfig _config;
  Router _router;
  RequestParser _parser;
  Socket _listenSocket;
  EventSink _eventSink;
  mutable std::mutex _connectionsMutex;
  std::unordered_set<int> _openConnections;
  std::atomic<bool> _stopRequested{false};
  std::atomic<bool> _running{false};
  uint16_t _port{0};
};

}  // namespace netloom

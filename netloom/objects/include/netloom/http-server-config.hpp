#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "netloom/http-header.hpp"

namespace netloom {

struct HttpServerConfig {
  // ============================
  // Listener / socket parameters
  // ============================
  // TCP port to bind. 0 (default) lets the OS pick an ephemeral free port, retrievable with HttpServer::port().
  uint16_t port{0};

  // If true, enables SO_REUSEPORT so that several servers may bind the same port. Disabled by default.
  bool reusePort{false};

  // Disable Nagle's algorithm on the listening socket (inherited by accepted connections). Default: false.
  bool tcpNoDelay{false};

  // Number of worker threads serving connections. A connection occupies one worker from accept to close.
  uint32_t nbThreads{4};

  // Maximum time the accept loop waits before checking for a stop request.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{100}};

  // ===========================================
  // Keep-Alive / connection lifecycle controls
  // ===========================================

  // Whether persistent connections are enabled. When false, the server closes after each response. Default: true.
  bool enableKeepAlive{true};

  // Maximum number of HTTP requests to serve over a single persistent connection before forcing close.
  uint32_t maxRequestsPerConnection{100};

  // Idle timeout for keep-alive connections (time to wait for the next request after a response is sent).
  // Once exceeded the server closes the connection. Default: 5000 ms.
  std::chrono::milliseconds keepAliveTimeout{std::chrono::milliseconds{5000}};

  // Maximum time allowed between two reads while receiving a request (also used for the first request of a
  // connection). Exceeding it answers 408 if some bytes were received, otherwise closes silently.
  std::chrono::milliseconds headerReadTimeout{std::chrono::milliseconds{10000}};

  // Maximum time a response write may stay without progress because the client does not read. Exceeding it
  // closes the connection. Also the grace period given to responses in progress when the server stops.
  // Default: 10000 ms.
  std::chrono::milliseconds writeTimeout{std::chrono::milliseconds{10000}};

  // ============================
  // Request parsing & body limits
  // ============================
  // Maximum size of the request head (request line + headers + empty line). Exceeding answers 431 (414 for the
  // request line alone). Default: 8 KiB.
  std::size_t maxHeaderBytes{8192};

  // Maximum size of a request body. Larger Content-Length answers 413. Default: 64 MiB.
  std::size_t maxBodyBytes{1UL << 26};

  // ============================
  // Response
  // ============================
  // Headers added to every response that does not already define them.
  std::vector<http::Header> globalHeaders;

  // If true, the startup banner is not logged.
  bool hideBanner{false};

  // Throws std::invalid_argument if the configuration is not consistent.
  void validate() const;

  HttpServerConfig& withPort(uint16_t port);

  HttpServerConfig& withReusePort(bool on = true);

  HttpServerConfig& withTcpNoDelay(bool on = true);

  HttpServerConfig& withNbThreads(uint32_t nbThreads);

  HttpServerConfig& withPollInterval(std::chrono::milliseconds interval);

  HttpServerConfig& withKeepAliveMode(bool on = true);

  HttpServerConfig& withMaxRequestsPerConnection(uint32_t maxRequests);

  HttpServerConfig& withKeepAliveTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withHeaderReadTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withWriteTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  HttpServerConfig& withMaxBodyBytes(std::size_t maxBodyBytes);

  // Append a global header. Validity is checked by validate().
  HttpServerConfig& withGlobalHeader(std::string_view name, std::string_view value);

  HttpServerConfig& withHideBanner(bool on = true);
};

}  // namespace netloom

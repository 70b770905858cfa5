#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

#include "netloom/http-error.hpp"
#include "netloom/http-method.hpp"
#include "netloom/http-status-code.hpp"

namespace netloom {

// Observation point of the request pipeline, pushed synchronously to the EventSink of the server from the
// worker thread serving the connection.
// String views are only valid during the sink call.
struct ServerEvent {
  enum class Kind : std::uint8_t {
    RequestReceived,  // a request has been parsed
    RouteMatched,     // the router selected a route (routePattern is set)
    ResponseSent,     // a response has been written (status is set)
    Error             // a recoverable error, described by 'error' and / or 'detail'
  };

  Kind kind{Kind::RequestReceived};
  http::Method method{http::Method::GET};
  std::string_view path;
  std::string_view routePattern;
  http::StatusCode status{0};
  std::optional<http::ErrorKind> error;
  std::string_view detail;
};

std::string_view ServerEventKindName(ServerEvent::Kind kind) noexcept;

// Called concurrently from all worker threads: implementations must be thread safe.
using EventSink = std::function<void(const ServerEvent&)>;

// Sink forwarding every event to the netloom logger (debug level, errors at warn level).
EventSink LoggingEventSink();

}  // namespace netloom

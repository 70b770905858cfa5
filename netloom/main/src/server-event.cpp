#include "netloom/server-event.hpp"

#include <string_view>

#include "netloom/http-error.hpp"
#include "netloom/http-method.hpp"
#include "netloom/log.hpp"

namespace netloom {

std::string_view ServerEventKindName(ServerEvent::Kind kind) noexcept {
  switch (kind) {
    case ServerEvent::Kind::RequestReceived:
      return "RequestReceived";
    case ServerEvent::Kind::RouteMatched:
      return "RouteMatched";
    case ServerEvent::Kind::ResponseSent:
      return "ResponseSent";
    case ServerEvent::Kind::Error:
      return "Error";
    default:
      return "Unknown";
  }
}

EventSink LoggingEventSink() {
  return [](const ServerEvent& event) {
    switch (event.kind) {
      case ServerEvent::Kind::RequestReceived:
        log::debug("{} {}", http::MethodToStr(event.method), event.path);
        break;
      case ServerEvent::Kind::RouteMatched:
        log::debug("{} {} matched route '{}'", http::MethodToStr(event.method), event.path, event.routePattern);
        break;
      case ServerEvent::Kind::ResponseSent:
        log::debug("{} {} -> {}", http::MethodToStr(event.method), event.path, event.status);
        break;
      case ServerEvent::Kind::Error:
        log::warn("{} {} failed ({}): {}", http::MethodToStr(event.method), event.path,
                  event.error ? http::ErrorKindName(*event.error) : std::string_view("unexpected"), event.detail);
        break;
      default:
        break;
    }
  };
}

}  // namespace netloom

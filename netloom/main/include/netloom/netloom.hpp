#pragma once

// netloom umbrella header
//
// Include this single header to pull in the public API needed to write a server:
//   - HttpServer and its configuration
//   - Router, Context, middleware types and the bundled middleware / handlers (compression, static files)
//   - Request / Response primitives, HTTP enums & helpers
//
// Each re-exported header line is annotated with 'IWYU pragma: export' so that include-cleaner tools accept
// direct use of their symbols. Include the individual headers instead to minimize compile times.
//
// Usage Example:
//    #include <netloom/netloom.hpp>
//    using namespace netloom;
//    int main() {
//      Router router;
//      router.addRoute(http::Method::GET, "/hello", [](Context&) { return HttpResponse().body("hello"); });
//      HttpServer server(HttpServerConfig{}.withPort(8080), std::move(router));
//      server.run();
//    }

#include "netloom/compression-config.hpp"          // IWYU pragma: export
#include "netloom/compression-middleware.hpp"      // IWYU pragma: export
#include "netloom/context.hpp"                     // IWYU pragma: export
#include "netloom/cookie.hpp"                      // IWYU pragma: export
#include "netloom/http-constants.hpp"              // IWYU pragma: export
#include "netloom/http-error.hpp"                  // IWYU pragma: export
#include "netloom/http-method.hpp"                 // IWYU pragma: export
#include "netloom/http-request.hpp"                // IWYU pragma: export
#include "netloom/http-response.hpp"               // IWYU pragma: export
#include "netloom/http-server-config.hpp"          // IWYU pragma: export
#include "netloom/http-server.hpp"                 // IWYU pragma: export
#include "netloom/http-status-code.hpp"            // IWYU pragma: export
#include "netloom/middleware.hpp"                  // IWYU pragma: export
#include "netloom/router-config.hpp"               // IWYU pragma: export
#include "netloom/router.hpp"                      // IWYU pragma: export
#include "netloom/server-event.hpp"                // IWYU pragma: export
#include "netloom/static-file-config.hpp"          // IWYU pragma: export
#include "netloom/static-file-handler.hpp"         // IWYU pragma: export

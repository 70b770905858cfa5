#include <netloom/netloom.hpp>

#include <charconv>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>

using namespace netloom;

namespace {

volatile std::sig_atomic_t gStopRequested = 0;

void OnTerminationSignal(int /*signal*/) { gStopRequested = 1; }

constexpr ContextKey<std::string> kUserKey{"user"};

}  // namespace

// Usage: hello-server [port] [static root]
int main(int argc, char** argv) {
  uint16_t port = 0;
  if (argc > 1) {
    const auto [ptr, errc] = std::from_chars(argv[1], argv[1] + std::strlen(argv[1]), port);
    if (errc != std::errc{} || ptr != argv[1] + std::strlen(argv[1])) {
      std::cerr << "Invalid port number: " << argv[1] << "\n";
      return EXIT_FAILURE;
    }
  }
  const std::filesystem::path staticRoot = argc > 2 ? argv[2] : ".";

  std::signal(SIGINT, OnTerminationSignal);
  std::signal(SIGTERM, OnTerminationSignal);

  try {
    Router router;
    router.use(CompressionMiddleware{});

    router.addRoute(http::Method::GET, "/hello", [](Context& ctx) {
      return HttpResponse().body("Hello " + std::string(ctx.queryParam("name").value_or("world")) + "!\n",
                                 http::ContentTypeTextPlain);
    });

    router.addRoute(http::Method::GET, "/users/:id", [](Context& ctx) {
      ctx.send(http::StatusCodeOK, "{\"id\":\"" + std::string(*ctx.pathParam("id")) + "\"}",
               http::ContentTypeApplicationJson);
      return std::move(ctx.response());
    });

    router.addRoute(http::Method::POST, "/login", [](Context& ctx) {
      const auto user = ctx.formValue("user");
      if (!user) {
        ctx.sendString(http::StatusCodeBadRequest, "missing user\n");
        return std::move(ctx.response());
      }
      http::Cookie session{"session", std::string(*user)};
      session.path = "/";
      session.httpOnly = true;
      ctx.setCookie(session);
      ctx.redirect(http::StatusCodeSeeOther, "/admin/whoami");
      return std::move(ctx.response());
    });

    auto admin = router.group("/admin");
    admin.use([](Context& ctx, Next& next) {
      const auto session = ctx.cookie("session");
      if (!session) {
        ctx.sendString(http::StatusCodeUnauthorized, "login first\n");
        return;
      }
      ctx.set(kUserKey, std::string(*session));
      next();
    });
    admin.addRoute(http::Method::GET, "/whoami",
                   [](Context& ctx) { return HttpResponse().body("You are " + *ctx.get(kUserKey) + "\n"); });

    router.serveStatic("/static", staticRoot);

    HttpServer server(HttpServerConfig{}.withPort(port).withGlobalHeader("Server", "netloom"), std::move(router));
    server.setEventSink(LoggingEventSink());

    std::cout << "Serving on port " << server.port() << ", static files from " << staticRoot << '\n';
    server.runUntil([] { return gStopRequested != 0; });
  } catch (const std::exception& ex) {
    std::cerr << "Server encountered error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}

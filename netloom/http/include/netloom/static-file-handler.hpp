#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

#include "netloom/context.hpp"
#include "netloom/http-error.hpp"
#include "netloom/http-response.hpp"
#include "netloom/static-file-config.hpp"

namespace netloom {

// Serves files from a fixed root directory.
// Can be used as a RequestHandler callable in Router (see Router::serveStatic).
class StaticFileHandler {
 public:
  struct Resolution {
    std::filesystem::path path;  // canonical path of the regular file to serve, when no error
    std::optional<http::ErrorKind> error;
  };

  // Throws std::invalid_argument if 'rootDirectory' is not an existing directory or the config is invalid.
  explicit StaticFileHandler(const std::filesystem::path& rootDirectory, StaticFileConfig config = {});

  // Build a response for the request of the context. Only GET and HEAD are served.
  // The file path is taken from the last path parameter (the wildcard capture of the route), or from the
  // request path if the route has no parameter.
  [[nodiscard]] HttpResponse operator()(Context& ctx) const;

  // Resolves a '/'-separated path relative to the root.
  //  - ForbiddenPath: '..' segment, NUL byte, or canonical path (symbolic links followed) outside of the root
  //  - FileNotFound : missing path, directory without index file, or not a regular file
  //  - FileUnreadable: the file status cannot be read
  [[nodiscard]] Resolution resolve(std::string_view relativePath) const;

  // Error reported for the errno of a failed open.
  static http::ErrorKind FileOpenErrorKind(int err) noexcept;

  [[nodiscard]] const std::filesystem::path& root() const noexcept { return _root; }

 private:
  [[nodiscard]] bool isWithinRoot(const std::filesystem::path& canonicalPath) const;

  std::filesystem::path _root;
  StaticFileConfig _config;
};

}  // namespace netloom

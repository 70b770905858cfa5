#pragma once

#include <optional>
#include <string_view>

#include "netloom/compression-config.hpp"
#include "netloom/context.hpp"
#include "netloom/middleware.hpp"
#include "netloom/zlib-encoder.hpp"

namespace netloom {

// Middleware compressing in-memory response bodies with gzip or deflate, according to the request
// Accept-Encoding header. Install it with Router::use() (or on a group / route).
// A response is compressed when its body is held in memory, is at least 'minBytes' long, has an allowed
// Content-Type and no Content-Encoding yet. Streamed bodies are sent as is.
class CompressionMiddleware {
 public:
  // Throws std::invalid_argument if the configuration is invalid.
  explicit CompressionMiddleware(CompressionConfig config = {});

  void operator()(Context& ctx, Next& next) const;

  // Select the coding to apply for an Accept-Encoding value (RFC 9110 §12.5.3):
  //  - q-values are honored, a coding with q=0 is refused
  //  - on equal q-values, gzip is preferred over deflate
  //  - '*' applies its q-value to the codings not listed explicitly
  // Returns std::nullopt when the body should be sent uncompressed.
  static std::optional<ZStreamRAII::Variant> NegotiateEncoding(std::string_view acceptEncoding);

 private:
  [[nodiscard]] bool isCompressibleContentType(std::string_view contentType) const noexcept;

  CompressionConfig _config;
};

}  // namespace netloom

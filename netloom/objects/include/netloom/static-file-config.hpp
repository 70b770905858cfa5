#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "netloom/http-constants.hpp"

namespace netloom {

/// Configuration knobs for StaticFileHandler (serving filesystem trees).
struct StaticFileConfig {
  /// Name of the file served when the target path resolves to a directory. Empty disables index serving.
  std::string defaultIndex{"index.html"};

  /// Content-Type used when the file extension is unknown.
  std::string defaultContentType{http::ContentTypeApplicationOctetStream};

  /// Size of the chunks read from disk while streaming a file.
  std::size_t chunkSize{1UL << 16};

  StaticFileConfig& withDefaultIndex(std::string_view indexFile) {
    defaultIndex = indexFile;
    return *this;
  }

  StaticFileConfig& withDefaultContentType(std::string_view contentType) {
    defaultContentType = contentType;
    return *this;
  }

  StaticFileConfig& withChunkSize(std::size_t bytes) {
    chunkSize = bytes;
    return *this;
  }

  // Throws std::invalid_argument if the configuration is not consistent.
  void validate() const;
};

}  // namespace netloom

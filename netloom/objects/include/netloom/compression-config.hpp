#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace netloom {

struct CompressionConfig {
  // Bodies smaller than this are sent uncompressed.
  std::size_t minBytes{256};

  // zlib compression level: -1 (zlib default) or 0..9.
  int8_t level{-1};

  // Only responses whose Content-Type starts with one of these prefixes are compressed.
  // An empty list compresses every content type.
  std::vector<std::string> contentTypeAllowlist{"text/", "application/json", "application/javascript",
                                                "application/xml", "image/svg+xml"};

  // Adds 'Vary: Accept-Encoding' to compressed and compressible responses.
  bool addVaryHeader{true};

  CompressionConfig& withMinBytes(std::size_t bytes) {
    minBytes = bytes;
    return *this;
  }

  CompressionConfig& withLevel(int8_t zlibLevel) {
    level = zlibLevel;
    return *this;
  }

  // Throws std::invalid_argument if the configuration is not consistent.
  void validate() const;
};

}  // namespace netloom

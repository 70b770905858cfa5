#pragma once

#include <zlib.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace netloom {

struct ZStreamRAII {
  enum class Variant : int8_t { gzip, deflate };

  // Initialize a z_stream for compression.
  // Throws std::runtime_error on failure.
  ZStreamRAII(Variant variant, int8_t level);

  ZStreamRAII(const ZStreamRAII&) = delete;
  ZStreamRAII(ZStreamRAII&&) noexcept = delete;
  ZStreamRAII& operator=(const ZStreamRAII&) = delete;
  ZStreamRAII& operator=(ZStreamRAII&&) noexcept = delete;

  ~ZStreamRAII();

  z_stream stream{};
};

// One-shot gzip / deflate (zlib format) compressor.
class ZlibEncoder {
 public:
  ZlibEncoder(ZStreamRAII::Variant variant, int8_t level) noexcept : _level(level), _variant(variant) {}

  // Compress 'data' entirely. Throws std::runtime_error on zlib failure.
  [[nodiscard]] std::string encodeFull(std::string_view data) const;

 private:
  int8_t _level;
  ZStreamRAII::Variant _variant;
};

}  // namespace netloom

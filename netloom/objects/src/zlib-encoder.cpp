#include "netloom/zlib-encoder.hpp"

#include <spdlog/fmt/fmt.h>
#include <zconf.h>
#include <zlib.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "netloom/log.hpp"

namespace netloom {

namespace {
constexpr int ComputeWindowBits(ZStreamRAII::Variant variant) {
  // +16 asks zlib for a gzip header and trailer instead of the zlib wrapper.
  return variant == ZStreamRAII::Variant::gzip ? MAX_WBITS + 16 : MAX_WBITS;
}
}  // namespace

ZStreamRAII::ZStreamRAII(Variant variant, int8_t level) {
  const auto ret = deflateInit2(&stream, level, Z_DEFLATED, ComputeWindowBits(variant), 8, Z_DEFAULT_STRATEGY);
  if (ret != Z_OK) {
    throw std::runtime_error(fmt::format("Error from deflateInit2 - error {}", ret));
  }
}

ZStreamRAII::~ZStreamRAII() {
  const auto ret = deflateEnd(&stream);
  if (ret != Z_OK && ret != Z_DATA_ERROR) {
    log::error("zlib: deflateEnd returned {} (ignored)", ret);
  }
}

std::string ZlibEncoder::encodeFull(std::string_view data) const {
  ZStreamRAII zs(_variant, _level);

  auto& zstream = zs.stream;

  zstream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  zstream.avail_in = static_cast<uInt>(data.size());

  std::string out;
  out.resize(static_cast<std::size_t>(deflateBound(&zstream, static_cast<uLong>(data.size()))));

  zstream.next_out = reinterpret_cast<Bytef*>(out.data());
  zstream.avail_out = static_cast<uInt>(out.size());

  const auto rc = deflate(&zstream, Z_FINISH);
  if (rc != Z_STREAM_END) {
    throw std::runtime_error(
        fmt::format("Error {} during {} compression", rc, _variant == ZStreamRAII::Variant::gzip ? "gzip" : "deflate"));
  }

  out.resize(out.size() - zstream.avail_out);
  return out;
}

}  // namespace netloom

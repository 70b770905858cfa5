#include "netloom/compression-config.hpp"

#include <stdexcept>

namespace netloom {

void CompressionConfig::validate() const {
  if (level < -1 || level > 9) {
    throw std::invalid_argument("Invalid zlib compression level, should be -1 or in [0, 9]");
  }
}

}  // namespace netloom

#include "netloom/static-file-config.hpp"

#include <stdexcept>
#include <string>

#include "netloom/http-header.hpp"

namespace netloom {

void StaticFileConfig::validate() const {
  if (defaultIndex.find('/') != std::string::npos || defaultIndex == "." || defaultIndex == "..") {
    throw std::invalid_argument("defaultIndex must be a plain file name");
  }
  if (defaultContentType.empty() || !http::IsValidHeaderValue(defaultContentType)) {
    throw std::invalid_argument("defaultContentType must be a valid non empty header value");
  }
  if (chunkSize == 0) {
    throw std::invalid_argument("chunkSize must be > 0");
  }
}

}  // namespace netloom

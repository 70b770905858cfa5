#pragma once

#include <cstdint>

namespace netloom {

struct RouterConfig {
  // How a trailing slash in the request path is treated when matching routes.
  //  - Strict   : '/a/' and '/a' are different paths
  //  - Normalize: trailing slashes are stripped before matching ('/a/' matches a route registered as '/a')
  enum class TrailingSlashPolicy : std::uint8_t { Strict, Normalize };

  TrailingSlashPolicy trailingSlashPolicy{TrailingSlashPolicy::Normalize};

  RouterConfig& withTrailingSlashPolicy(TrailingSlashPolicy policy) {
    trailingSlashPolicy = policy;
    return *this;
  }
};

}  // namespace netloom

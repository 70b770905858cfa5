#pragma once

// Logging facade. netloom always logs through spdlog (compiled library, external fmt).
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace netloom {

namespace log = spdlog;

}  // namespace netloom

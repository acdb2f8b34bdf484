#pragma once

// Logging abstraction: all library logging goes through spdlog's default logger.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace layerserve {

namespace log = spdlog;

}  // namespace layerserve

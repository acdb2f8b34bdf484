#pragma once

#include <functional>
#include <string>

namespace layerserve {

/// Per-request knobs of StaticFileHandler::handle.
struct StaticFileOptions {
  /// Prepended to the request path to build the cache key, so that several logical mount points can share
  /// the same ResponseCache.
  std::string cachePrefix;

  /// Optional transformation of the loaded file content (minification for instance).
  /// Its result fully replaces the body: it is what gets served, measured and cached.
  std::function<std::string(std::string)> transform;

  /// Forces a no-store Cache-Control for this response.
  /// Such responses bypass the response cache entirely (no lookup, no write-back).
  bool nocache{false};
};

}  // namespace layerserve

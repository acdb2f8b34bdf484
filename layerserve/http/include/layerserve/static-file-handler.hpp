#pragma once

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "layerserve/http-request.hpp"
#include "layerserve/http-response.hpp"
#include "layerserve/response-cache.hpp"
#include "layerserve/static-file-config.hpp"
#include "layerserve/static-file-options.hpp"

namespace layerserve {

// Serves files from an ordered list of root directories, with conditional GET (ETag / Last-Modified)
// and an optional in-memory response cache.
// handle() is const and may be called concurrently from several threads.
class StaticFileHandler {
 public:
  // Throws std::invalid_argument if config is invalid.
  // If 'cache' is null, the handler creates its own private cache store.
  explicit StaticFileHandler(StaticFileConfig config = {}, std::shared_ptr<ResponseCache> cache = {});

  // Serve from a single root directory, with default settings.
  explicit StaticFileHandler(std::string_view root) : StaticFileHandler(StaticFileConfig(root)) {}

  /// Build a response for the given request. Only GET and HEAD are served.
  /// Returns false, leaving 'response' untouched, if the request is not for this handler (other method, or no
  /// regular file matching the path in any root). Otherwise 'response' is fully written and true is returned.
  /// Throws std::invalid_argument on a malformed percent-encoded path, and std::system_error (or
  /// std::filesystem::filesystem_error) on filesystem errors other than a missing file.
  [[nodiscard]] bool handle(const HttpRequest& request, HttpResponse& response,
                            const StaticFileOptions& options = {}) const;

  /// Drop the cached response for 'options.cachePrefix + key'.
  void clearCache(std::string_view key, const StaticFileOptions& options = {}) const;

  /// Drop all cached responses of the underlying cache store (shared with other handlers, if any).
  void clearCache() const;

  [[nodiscard]] const StaticFileConfig& config() const noexcept { return _config; }

  [[nodiscard]] std::span<const std::string> roots() const noexcept { return _roots; }

  [[nodiscard]] const std::shared_ptr<ResponseCache>& cache() const noexcept { return _cache; }

 private:
  StaticFileConfig _config;
  std::vector<std::string> _roots;
  std::shared_ptr<ResponseCache> _cache;
};

}  // namespace layerserve

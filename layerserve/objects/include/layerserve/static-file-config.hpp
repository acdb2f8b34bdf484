#pragma once

#include <chrono>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "layerserve/mime-sniff.hpp"

namespace layerserve {

/// Configuration knobs for StaticFileHandler (serving files from an ordered list of root directories).
/// Immutable once given to the handler.
class StaticFileConfig {
 public:
  /// One year (365.25 days).
  static constexpr std::chrono::milliseconds kDefaultMaxAge{31557600000LL};

  /// Name of the file served when the request path ends with a separator.
  static constexpr std::string_view kDefaultIndex = "index.html";

  /// No root: the process working directory will be used.
  StaticFileConfig() = default;

  /// Single root directory.
  explicit StaticFileConfig(std::string_view root) { withRoot(root); }

  /// Throws std::invalid_argument if the configuration is invalid.
  void validate() const;

  /// Returns the roots in search order, made absolute and without trailing separator.
  /// The process working directory is returned when no root has been configured.
  [[nodiscard]] std::vector<std::string> normalizedRoots() const;

  [[nodiscard]] const std::vector<std::string> &roots() const noexcept { return _roots; }

  /// Browser cache lifetime advertised in Cache-Control.
  /// An explicit withMaxAge wins over the value given to withCache.
  [[nodiscard]] std::chrono::milliseconds maxAge() const noexcept {
    return _maxAge.value_or(_cacheMaxAge.value_or(kDefaultMaxAge));
  }

  [[nodiscard]] bool cacheEnabled() const noexcept { return _cacheEnabled; }

  [[nodiscard]] const MimeSniffer &mimeSniffer() const noexcept { return _mimeSniffer; }

  /// Append a root, searched after the previously added ones.
  StaticFileConfig &withRoot(std::string_view root) {
    _roots.emplace_back(root);
    return *this;
  }

  /// Replace the list of roots.
  StaticFileConfig &withRoots(std::initializer_list<std::string_view> roots) {
    _roots.assign(roots.begin(), roots.end());
    return *this;
  }

  StaticFileConfig &withRoots(std::vector<std::string> roots) {
    _roots = std::move(roots);
    return *this;
  }

  StaticFileConfig &withMaxAge(std::chrono::milliseconds maxAge) {
    _maxAge = maxAge;
    return *this;
  }

  /// Enable or disable the in-memory response cache.
  StaticFileConfig &withCache(bool enabled) {
    _cacheEnabled = enabled;
    return *this;
  }

  /// Enable the in-memory response cache, and use 'maxAge' as browser cache lifetime
  /// unless withMaxAge is (or has been) called.
  StaticFileConfig &withCache(std::chrono::milliseconds maxAge) {
    _cacheEnabled = true;
    _cacheMaxAge = maxAge;
    return *this;
  }

  /// Content sniffer consulted when the file extension does not give a MIME type.
  StaticFileConfig &withMimeSniffer(MimeSniffer sniffer) {
    _mimeSniffer = std::move(sniffer);
    return *this;
  }

 private:
  std::vector<std::string> _roots;
  std::optional<std::chrono::milliseconds> _maxAge;
  std::optional<std::chrono::milliseconds> _cacheMaxAge;
  MimeSniffer _mimeSniffer{MimeSniffer::WithDefaultSignatures()};
  bool _cacheEnabled{false};
};

}  // namespace layerserve

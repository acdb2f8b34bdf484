#include "layerserve/root-resolver.hpp"

#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "layerserve/file-stat.hpp"
#include "layerserve/log.hpp"
#include "layerserve/static-file-config.hpp"

namespace layerserve {

std::string CandidatePath(std::string_view root, std::string_view decodedPath) {
  std::string candidate;
  candidate.reserve(root.size() + 1U + decodedPath.size() + StaticFileConfig::kDefaultIndex.size());
  candidate.append(root);
  if (candidate.ends_with('/')) {
    // root is '/'
    candidate.pop_back();
  }
  if (!decodedPath.starts_with('/')) {
    candidate.push_back('/');
  }
  candidate.append(decodedPath);
  if (candidate.ends_with('/')) {
    candidate.append(StaticFileConfig::kDefaultIndex);
  }
  return candidate;
}

RootResolution ResolveInRoots(std::span<const std::string> roots, std::string_view decodedPath) {
  RootResolution resolution;
  for (const std::string& root : roots) {
    std::string candidate = CandidatePath(root, decodedPath);
    StatResult statResult = StatPath(candidate);
    switch (statResult.kind) {
      case StatResult::Kind::NotFound:
        log::trace("'{}' not found", candidate);
        continue;
      case StatResult::Kind::Error:
        resolution.kind = RootResolution::Kind::Error;
        resolution.error = statResult.error;
        resolution.file.absolutePath = std::move(candidate);
        return resolution;
      case StatResult::Kind::Found:
        resolution.kind = RootResolution::Kind::Found;
        resolution.file.absolutePath = std::move(candidate);
        resolution.file.stat = statResult.stat;
        return resolution;
    }
  }
  return resolution;
}

}  // namespace layerserve

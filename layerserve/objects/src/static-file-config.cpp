#include "layerserve/static-file-config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace layerserve {

void StaticFileConfig::validate() const {
  if (maxAge().count() < 0) {
    throw std::invalid_argument("StaticFileConfig max age cannot be negative");
  }
  for (const std::string &root : _roots) {
    if (root.empty()) {
      throw std::invalid_argument("StaticFileConfig root cannot be empty");
    }
    if (root.find('\0') != std::string::npos) {
      throw std::invalid_argument("StaticFileConfig root cannot contain NUL characters");
    }
  }
}

std::vector<std::string> StaticFileConfig::normalizedRoots() const {
  std::vector<std::string> roots;
  if (_roots.empty()) {
    roots.push_back(std::filesystem::current_path().string());
    return roots;
  }
  roots.reserve(_roots.size());
  for (const std::string &root : _roots) {
    std::string absRoot = std::filesystem::absolute(root).lexically_normal().string();
    while (absRoot.size() > 1U && absRoot.ends_with('/')) {
      absRoot.pop_back();
    }
    roots.push_back(std::move(absRoot));
  }
  return roots;
}

}  // namespace layerserve

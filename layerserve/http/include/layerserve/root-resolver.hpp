#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include "layerserve/file-stat.hpp"

namespace layerserve {

struct ResolvedFile {
  std::string absolutePath;
  FileStat stat;
};

struct RootResolution {
  enum class Kind : uint8_t { Found, NotFound, Error };

  Kind kind{Kind::NotFound};
  // When Found: the chosen file. When Error: 'absolutePath' is the candidate whose stat failed.
  ResolvedFile file;
  std::error_code error;
};

// Builds the filesystem candidate for 'decodedPath' under 'root'.
// 'decodedPath' is expected to start with '/'. When it ends with '/', the default index file name is appended.
[[nodiscard]] std::string CandidatePath(std::string_view root, std::string_view decodedPath);

// Tries each root in order and stops at the first one where the candidate exists (file or directory).
// A missing candidate moves on to the next root, any other stat error stops the search and is reported.
[[nodiscard]] RootResolution ResolveInRoots(std::span<const std::string> roots, std::string_view decodedPath);

}  // namespace layerserve

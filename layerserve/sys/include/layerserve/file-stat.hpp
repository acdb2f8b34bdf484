#pragma once

#include <cstdint>
#include <string>
#include <system_error>

#include "layerserve/timedef.hpp"

namespace layerserve {

struct FileStat {
  std::uintmax_t size{0};
  SysTimePoint lastModified;
  bool isDirectory{false};
  bool isRegularFile{false};
};

// Outcome of a stat call. NotFound covers both a missing entry and a path traversing a regular file
// ("a.txt/b"), the two situations where looking into another root makes sense.
struct StatResult {
  enum class Kind : uint8_t { Found, NotFound, Error };

  Kind kind{Kind::NotFound};
  FileStat stat;
  std::error_code error;

  [[nodiscard]] bool found() const noexcept { return kind == Kind::Found; }
};

// Stat 'path', following symlinks. Never throws for filesystem errors, which are reported in the result.
[[nodiscard]] StatResult StatPath(const std::string& path);

}  // namespace layerserve

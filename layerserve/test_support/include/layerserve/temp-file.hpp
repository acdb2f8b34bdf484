#pragma once

#include <chrono>
#include <filesystem>
#include <string_view>

#include "layerserve/timedef.hpp"

namespace layerserve::test {

// ScopedTempDir: creates a unique temporary directory under the system temp
// directory and removes it (recursively) on destruction. Useful to build
// small directory trees served by a StaticFileHandler.
class ScopedTempDir {
 public:
  // Create a uniquely-named temporary directory with optional prefix.
  explicit ScopedTempDir(std::string_view prefix = "layerserve-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

  // Write 'content' to 'relativePath' under this directory, creating intermediate directories as needed.
  // Overwrites any existing file. Returns the full path of the written file.
  std::filesystem::path writeFile(std::string_view relativePath, std::string_view content) const;

  // Create 'relativePath' (and its parents) as a directory under this directory.
  std::filesystem::path makeDir(std::string_view relativePath) const;

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

// Set the modification time of 'path', with a one second precision.
void SetLastModified(const std::filesystem::path& path, SysTimePoint tp);

// Same, for dates that a SysTimePoint cannot represent (after year 2262 for instance).
// Returns false if the file system stored a different time (some file systems clamp out of range values).
bool SetLastModified(const std::filesystem::path& path, std::chrono::sys_seconds tp);

}  // namespace layerserve::test

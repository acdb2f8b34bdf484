#pragma once

#include <cstddef>
#include <string>

namespace layerserve {

// Read-only file handle owning a POSIX file descriptor, closed on destruction.
class File {
 public:
  static constexpr int kClosedFd = -1;

  // Default-constructed File is closed / empty.
  File() noexcept = default;

  // Open a file by path for reading. Throws std::system_error on failure.
  explicit File(const std::string& path) : File(path.c_str()) {}

  // Open a file by path (must be null-terminated) for reading. Throws std::system_error on failure.
  explicit File(const char* path);

  File(const File&) = delete;
  File(File&& other) noexcept;
  File& operator=(const File&) = delete;
  File& operator=(File&& other) noexcept;

  ~File() { close(); }

  // Returns true when the File currently holds an opened descriptor.
  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Return the current file size in bytes.
  // Throws std::system_error on error.
  [[nodiscard]] std::size_t size() const;

  // Read the whole file content from its beginning.
  // Throws std::system_error on read errors.
  [[nodiscard]] std::string loadAllContent() const;

  // Idempotent. Close errors are logged, never thrown.
  void close() noexcept;

 private:
  int _fd{kClosedFd};
};

}  // namespace layerserve

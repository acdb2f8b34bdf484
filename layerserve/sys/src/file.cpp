#include "layerserve/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string>
#include <utility>

#include "layerserve/errno-throw.hpp"
#include "layerserve/log.hpp"

namespace layerserve {

File::File(const char* path) : _fd(::open(path, O_RDONLY | O_CLOEXEC)) {
  if (_fd == kClosedFd) {
    ThrowErrno("Unable to open file ", path);
  }
}

File::File(File&& other) noexcept : _fd(std::exchange(other._fd, kClosedFd)) {}

File& File::operator=(File&& other) noexcept {
  if (this != &other) {
    close();
    _fd = std::exchange(other._fd, kClosedFd);
  }
  return *this;
}

void File::close() noexcept {
  if (_fd == kClosedFd) {
    return;
  }
  // the descriptor is released by Linux even when close is interrupted, it must not be retried
  if (::close(_fd) != 0 && errno != EINTR) {
    log::error("close fd # {} failed: {}", _fd, std::strerror(errno));
  }
  _fd = kClosedFd;
}

std::size_t File::size() const {
  struct stat st{};
  if (::fstat(_fd, &st) != 0) {
    ThrowErrno("File::size failed");
  }
  return static_cast<std::size_t>(st.st_size);
}

std::string File::loadAllContent() const {
  std::string content;
  content.reserve(size());

  static constexpr std::size_t kBufSize = 8192;

  std::size_t offset = 0;
  for (;;) {
    const std::size_t oldSize = content.size();

    // We capture lastRead to inspect the result after the non-throwing lambda.
    ssize_t lastRead = 0;
    content.resize_and_overwrite(oldSize + kBufSize, [this, oldSize, offset, &lastRead](char* data, std::size_t) {
      lastRead = ::pread(_fd, data + oldSize, kBufSize, static_cast<off_t>(offset));
      return lastRead > 0 ? oldSize + static_cast<std::size_t>(lastRead) : oldSize;
    });

    if (lastRead > 0) {
      offset += static_cast<std::size_t>(lastRead);
      continue;
    }
    if (lastRead == 0) {
      break;  // EOF
    }
    if (errno == EINTR) {
      continue;
    }
    ThrowErrno("File::loadAllContent read error");
  }

  return content;
}

}  // namespace layerserve

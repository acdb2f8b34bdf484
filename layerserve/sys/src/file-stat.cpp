#include "layerserve/file-stat.hpp"

#include <sys/stat.h>
#include <time.h>

#include <cerrno>
#include <chrono>
#include <string>
#include <system_error>

namespace layerserve {

namespace {

// Modification times outside of the SysTimePoint range (before 1677 or after 2262 with a nanosecond clock)
// are clamped to the nearest representable second.
SysTimePoint ToSysTimePoint(const struct timespec& ts) {
  static constexpr auto kMaxSeconds = std::chrono::floor<std::chrono::seconds>(SysDuration::max()).count();
  static constexpr auto kMinSeconds = std::chrono::ceil<std::chrono::seconds>(SysDuration::min()).count();

  if (ts.tv_sec >= kMaxSeconds) {
    return SysTimePoint{std::chrono::seconds{kMaxSeconds}};
  }
  if (ts.tv_sec < kMinSeconds) {
    return SysTimePoint{std::chrono::seconds{kMinSeconds}};
  }
  return SysTimePoint{std::chrono::duration_cast<SysDuration>(std::chrono::seconds{ts.tv_sec}) +
                      std::chrono::duration_cast<SysDuration>(std::chrono::nanoseconds{ts.tv_nsec})};
}

}  // namespace

StatResult StatPath(const std::string& path) {
  StatResult result;

  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    const int err = errno;
    if (err == ENOENT || err == ENOTDIR) {
      result.kind = StatResult::Kind::NotFound;
    } else {
      result.kind = StatResult::Kind::Error;
      result.error = std::error_code(err, std::generic_category());
    }
    return result;
  }

  result.kind = StatResult::Kind::Found;
  result.stat.size = static_cast<std::uintmax_t>(st.st_size);
  result.stat.lastModified = ToSysTimePoint(st.st_mtim);
  result.stat.isDirectory = S_ISDIR(st.st_mode);
  result.stat.isRegularFile = S_ISREG(st.st_mode);
  return result;
}

}  // namespace layerserve

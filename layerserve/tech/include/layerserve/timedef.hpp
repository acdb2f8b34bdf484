#pragma once

#include <chrono>
#include <cstdint>

namespace layerserve {

/// File modification times and HTTP dates are both expressed with the system clock,
/// the only one convertible to Unix epoch time.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

/// Milliseconds elapsed since the Unix epoch, rounded down.
constexpr int64_t UnixMillis(SysTimePoint tp) {
  return std::chrono::floor<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

/// HTTP dates have a one second precision.
constexpr SysTimePoint TruncateToSeconds(SysTimePoint tp) { return std::chrono::floor<std::chrono::seconds>(tp); }

}  // namespace layerserve

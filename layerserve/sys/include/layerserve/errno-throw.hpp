#pragma once

#include <cerrno>
#include <string>
#include <string_view>
#include <system_error>

namespace layerserve {

// Capture errno immediately and throw std::system_error with the given context.
// Usage: ThrowErrno("open failed for ", path);
template <typename... Parts>
[[noreturn]] void ThrowErrno(const Parts&... parts) {
  const int savedErr = errno;
  std::string what;
  (what.append(std::string_view(parts)), ...);
  throw std::system_error(std::error_code(savedErr, std::generic_category()), what);
}

}  // namespace layerserve

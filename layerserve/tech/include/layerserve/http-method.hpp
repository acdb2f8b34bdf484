#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace layerserve::http {

enum class Method : uint8_t { GET, HEAD, POST, PUT, DELETE, CONNECT, OPTIONS, TRACE, PATCH };

inline constexpr std::string_view kMethodStrings[] = {"GET",     "HEAD",    "POST",  "PUT",  "DELETE",
                                                      "CONNECT", "OPTIONS", "TRACE", "PATCH"};

constexpr std::string_view MethodToStr(Method method) { return kMethodStrings[static_cast<uint8_t>(method)]; }

// Method tokens are case-sensitive (RFC 9110 §9.1).
constexpr std::optional<Method> MethodFromStr(std::string_view str) {
  for (uint8_t idx = 0; idx < static_cast<uint8_t>(std::size(kMethodStrings)); ++idx) {
    if (kMethodStrings[idx] == str) {
      return static_cast<Method>(idx);
    }
  }
  return std::nullopt;
}

}  // namespace layerserve::http

#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "layerserve/string-equal-ignore-case.hpp"

namespace layerserve::http {

struct Header {
  std::string name;
  std::string value;

  bool operator==(const Header&) const noexcept = default;
};

// Case-insensitive lookup of the first header named 'key'.
inline std::optional<std::string_view> FindHeaderValue(std::span<const Header> headers, std::string_view key) noexcept {
  for (const Header& header : headers) {
    if (CaseInsensitiveEqual(header.name, key)) {
      return std::string_view(header.value);
    }
  }
  return std::nullopt;
}

}  // namespace layerserve::http

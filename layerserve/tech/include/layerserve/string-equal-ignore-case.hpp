#pragma once

#include <algorithm>
#include <string_view>

namespace layerserve {

// Locale independent, only ASCII upper case letters are changed.
constexpr char AsciiToLower(char ch) { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch + ('a' - 'A')) : ch; }

// Header names and file extensions are compared this way.
constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  return std::ranges::equal(lhs, rhs, {}, AsciiToLower, AsciiToLower);
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && CaseInsensitiveEqual(value.substr(0, prefix.size()), prefix);
}

constexpr bool EndsWithCaseInsensitive(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() && CaseInsensitiveEqual(value.substr(value.size() - suffix.size()), suffix);
}

}  // namespace layerserve

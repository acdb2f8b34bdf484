#include "layerserve/url-decode.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

namespace layerserve::url {

namespace {

// Returns -1 for a non hexadecimal character.
constexpr int HexDigitValue(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  const char lower = static_cast<char>(ch | 0x20);
  if (lower >= 'a' && lower <= 'f') {
    return 10 + (lower - 'a');
  }
  return -1;
}

}  // namespace

char* DecodeInPlace(char* first, const char* last) {
  char* out = first;
  for (; first < last; ++first) {
    const char ch = *first;
    if (ch != '%') {
      *out++ = ch;
      continue;
    }
    if (last - first < 3) {
      return nullptr;
    }
    const int v1 = HexDigitValue(first[1]);
    const int v2 = HexDigitValue(first[2]);
    if (v1 < 0 || v2 < 0) {
      return nullptr;
    }
    *out++ = static_cast<char>((v1 << 4) | v2);
    first += 2;
  }
  return out;
}

std::string DecodePath(std::string_view encoded) {
  std::string decoded(encoded);
  const char* newEnd = DecodeInPlace(decoded.data(), decoded.data() + decoded.size());
  if (newEnd == nullptr) {
    throw std::invalid_argument("Malformed percent-encoding in path");
  }
  decoded.resize(static_cast<std::string::size_type>(newEnd - decoded.data()));
  return decoded;
}

}  // namespace layerserve::url

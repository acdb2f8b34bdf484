#pragma once

#include <string>
#include <string_view>

namespace layerserve::url {

// Decodes within the provided buffer, compacting percent-encoded sequences.
// '+' is kept as is, as it has no special meaning in paths.
// Returns nullptr on invalid encoding (truncated % or non-hex digits) leaving the buffer in an unspecified
// partially modified state (caller can decide to discard it).
// Returns a pointer to the new logical end of the decoded sequence.
char* DecodeInPlace(char* first, const char* last);

// Returns a decoded copy of 'encoded'.
// Throws std::invalid_argument if 'encoded' contains a malformed percent-encoded sequence.
std::string DecodePath(std::string_view encoded);

}  // namespace layerserve::url

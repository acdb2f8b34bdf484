#pragma once

#include <cstdint>
#include <string_view>

namespace layerserve {

struct MIMEMapping {
  std::string_view extension;
  std::string_view mimeType;
};

using MIMETypeIdx = uint8_t;

inline constexpr MIMETypeIdx kUnknownMIMEMappingIdx = static_cast<MIMETypeIdx>(~0);

// Web asset types served from static roots. Anything else goes through content sniffing.
// Sorted by extension (checked at compile time), extensions in lower case.
inline constexpr MIMEMapping kMIMEMappings[] = {
    {"avif", "image/avif"},
    {"css", "text/css"},
    {"csv", "text/csv"},
    {"exe", "application/vnd.microsoft.portable-executable"},
    {"gif", "image/gif"},
    {"gz", "application/gzip"},
    {"htm", "text/html"},
    {"html", "text/html"},
    {"ico", "image/x-icon"},
    {"jpeg", "image/jpeg"},
    {"jpg", "image/jpeg"},
    {"js", "text/javascript"},
    {"json", "application/json"},
    {"map", "application/json"},
    {"mjs", "text/javascript"},
    {"mp4", "video/mp4"},
    {"pdf", "application/pdf"},
    {"png", "image/png"},
    {"svg", "image/svg+xml"},
    {"ttf", "font/ttf"},
    {"txt", "text/plain"},
    {"wasm", "application/wasm"},
    {"webm", "video/webm"},
    {"webp", "image/webp"},
    {"woff", "font/woff"},
    {"woff2", "font/woff2"},
    {"xml", "application/xml"},
    {"zip", "application/zip"},
};

// Given a file path, determine the appropriate MIME type mapping index, if known.
// Only the last extension is considered ("archive.tar.gz" -> "gz"), case insensitively.
// Otherwise, returns kUnknownMIMEMappingIdx.
MIMETypeIdx DetermineMIMETypeIdx(std::string_view path);

// Given a file path, determine the appropriate MIME type string, if known.
// This function is non-allocating, and case insensitive for the extension.
// Otherwise, returns an empty string_view.
std::string_view DetermineMIMETypeStr(std::string_view path);

}  // namespace layerserve

#include "layerserve/mime-sniff.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace layerserve {

using namespace std::string_view_literals;

namespace {

[[nodiscard]] bool Matches(const MagicSignature& signature, std::string_view content) {
  if (content.size() < signature.offset || content.size() - signature.offset < signature.pattern.size()) {
    return false;
  }
  content.remove_prefix(signature.offset);
  if (signature.mask.empty()) {
    return content.starts_with(signature.pattern);
  }
  for (std::size_t pos = 0; pos < signature.pattern.size(); ++pos) {
    const auto masked = static_cast<unsigned char>(content[pos]) & static_cast<unsigned char>(signature.mask[pos]);
    if (masked != static_cast<unsigned char>(signature.pattern[pos])) {
      return false;
    }
  }
  return true;
}

// https://mimesniff.spec.whatwg.org/#matching-an-image-type-pattern
constexpr MagicSignature kDefaultSignatures[] = {
    {"\x89PNG\r\n\x1A\n"sv, {}, "image/png"},
    {"\xFF\xD8\xFF"sv, {}, "image/jpeg"},
    {"GIF87a"sv, {}, "image/gif"},
    {"GIF89a"sv, {}, "image/gif"},
    {"RIFF\0\0\0\0WEBPVP"sv, "\xFF\xFF\xFF\xFF\0\0\0\0\xFF\xFF\xFF\xFF\xFF\xFF"sv, "image/webp"},
    {"BM"sv, {}, "image/bmp"},
    {"\0\0\x01\0"sv, {}, "image/x-icon"},
    {"\0\0\x02\0"sv, {}, "image/x-icon"},
    {"II*\0"sv, {}, "image/tiff"},
    {"MM\0*"sv, {}, "image/tiff"},
    {"%PDF-"sv, {}, "application/pdf"},
};

}  // namespace

MimeSniffer MimeSniffer::WithDefaultSignatures() {
  MimeSniffer sniffer;
  for (const MagicSignature& signature : kDefaultSignatures) {
    sniffer.add(signature);
  }
  return sniffer;
}

MimeSniffer& MimeSniffer::add(MagicSignature signature) {
  if (!signature.mask.empty() && signature.mask.size() != signature.pattern.size()) {
    throw std::invalid_argument("MagicSignature mask must have the same size as its pattern");
  }
  if (signature.pattern.empty() || signature.mimeType.empty()) {
    throw std::invalid_argument("MagicSignature pattern and MIME type cannot be empty");
  }
  _signatures.push_back(signature);
  return *this;
}

MimeSniffer& MimeSniffer::add(Detector detector) {
  if (!detector) {
    throw std::invalid_argument("MimeSniffer detector cannot be empty");
  }
  _detectors.push_back(std::move(detector));
  return *this;
}

std::optional<std::string_view> MimeSniffer::sniff(std::string_view content) const {
  content = content.substr(0, std::min(content.size(), kMaxSniffLength));

  const auto it = std::ranges::find_if(_signatures, [content](const auto& sig) { return Matches(sig, content); });
  if (it != _signatures.end()) {
    return it->mimeType;
  }
  for (const Detector& detector : _detectors) {
    const std::string_view detected = detector(content);
    if (!detected.empty()) {
      return detected;
    }
  }
  return std::nullopt;
}

}  // namespace layerserve

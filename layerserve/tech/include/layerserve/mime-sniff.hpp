#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace layerserve {

// Byte signature located at 'offset' in the content.
// When 'mask' is not empty it must have the same size as 'pattern': each content byte is and-ed with the
// corresponding mask byte before comparison (WHATWG MIME sniffing style).
struct MagicSignature {
  std::string_view pattern;
  std::string_view mask;
  std::string_view mimeType;
  std::size_t offset{0};
};

// Best-effort content type detection based on leading bytes.
// Signatures are tried first in insertion order, then custom detectors. First match wins.
// Warning: returned MIME types must point to constant storage (string literals for instance).
class MimeSniffer {
 public:
  // Custom detector: returns the detected MIME type, or an empty string_view when it has no opinion.
  using Detector = std::function<std::string_view(std::string_view prefix)>;

  // Number of leading bytes handed to signatures and detectors.
  static constexpr std::size_t kMaxSniffLength = 512;

  // Builds an empty sniffer, which never detects anything.
  MimeSniffer() = default;

  // Returns a sniffer knowing the common image formats (PNG, JPEG, GIF, WebP, BMP, ICO, TIFF) and PDF.
  static MimeSniffer WithDefaultSignatures();

  MimeSniffer& add(MagicSignature signature);

  MimeSniffer& add(Detector detector);

  [[nodiscard]] std::optional<std::string_view> sniff(std::string_view content) const;

  [[nodiscard]] bool empty() const noexcept { return _signatures.empty() && _detectors.empty(); }

 private:
  std::vector<MagicSignature> _signatures;
  std::vector<Detector> _detectors;
};

}  // namespace layerserve

#include "layerserve/mime-mappings.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <limits>
#include <string_view>

#include "layerserve/string-equal-ignore-case.hpp"

namespace layerserve {

static_assert(std::ranges::is_sorted(kMIMEMappings, {}, &MIMEMapping::extension),
              "kMIMEMappings must be sorted by extension");

static_assert(std::size(kMIMEMappings) < std::numeric_limits<MIMETypeIdx>::max(),
              "kMIMEMappings size exceeds MIMETypeIdx capacity");

MIMETypeIdx DetermineMIMETypeIdx(std::string_view path) {
  static constexpr std::size_t kMaximumKnownExtensionSize =
      std::ranges::max_element(kMIMEMappings, [](const auto &lhs, const auto &rhs) {
        return lhs.extension.size() < rhs.extension.size();
      })->extension.size();

  // a dot in a directory name does not start an extension
  const auto slashPos = path.find_last_of("/\\");
  if (slashPos != std::string_view::npos) {
    path.remove_prefix(slashPos + 1U);
  }

  const auto dotPos = path.rfind('.');
  if (dotPos == std::string_view::npos || (path.size() - dotPos - 1U) > kMaximumKnownExtensionSize) {
    return kUnknownMIMEMappingIdx;
  }

  char extBuf[kMaximumKnownExtensionSize];
  const auto endIt =
      std::transform(path.begin() + dotPos + 1U, path.end(), extBuf, AsciiToLower);

  const std::string_view ext(extBuf, endIt);
  const auto it = std::ranges::lower_bound(kMIMEMappings, ext, {}, &MIMEMapping::extension);
  if (it != std::end(kMIMEMappings) && it->extension == ext) {
    return static_cast<MIMETypeIdx>(std::distance(std::begin(kMIMEMappings), it));
  }
  return kUnknownMIMEMappingIdx;
}

std::string_view DetermineMIMETypeStr(std::string_view path) {
  const MIMETypeIdx idx = DetermineMIMETypeIdx(path);
  if (idx != kUnknownMIMEMappingIdx) {
    return kMIMEMappings[idx].mimeType;
  }
  return {};
}

}  // namespace layerserve

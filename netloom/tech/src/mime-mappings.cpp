#include "netloom/mime-mappings.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string_view>

#include "netloom/string-equal-ignore-case.hpp"

namespace netloom {

static_assert(std::ranges::is_sorted(kMIMEMappings, {}, &MIMEMapping::extension),
              "kMIMEMappings must be sorted by extension");

std::string_view DetermineMIMETypeStr(std::string_view path) {
  static constexpr std::size_t kMaxExtensionSize =
      std::ranges::max_element(kMIMEMappings, {}, [](const MIMEMapping& mapping) {
        return mapping.extension.size();
      })->extension.size();

  const auto dotPos = path.rfind('.');
  if (dotPos == std::string_view::npos) {
    return {};
  }
  const std::string_view rawExt = path.substr(dotPos + 1U);
  if (rawExt.empty() || rawExt.size() > kMaxExtensionSize || rawExt.find('/') != std::string_view::npos) {
    return {};
  }

  char extBuf[kMaxExtensionSize];
  const auto endIt = std::ranges::transform(rawExt, extBuf, [](char ch) { return tolower(ch); }).out;
  const std::string_view ext(extBuf, endIt);

  const auto it = std::ranges::lower_bound(kMIMEMappings, ext, {}, &MIMEMapping::extension);
  if (it != std::end(kMIMEMappings) && it->extension == ext) {
    return it->mimeType;
  }
  return {};
}

}  // namespace netloom

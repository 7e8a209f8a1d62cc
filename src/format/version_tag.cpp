#include "slimenv/format/version_tag.hpp"

#include <algorithm>

#include "slimenv/common/errors.hpp"

namespace slimenv {

void EncodeVersionTag(std::string_view version, std::span<uint8_t> buffer) {
  if (version.size() >= buffer.size()) {
    throw VersionOverflowError("version tag \"" + std::string(version) + "\" does not fit " +
                               std::to_string(buffer.size()) + " bytes");
  }

  std::fill(buffer.begin(), buffer.end(), 0);
  std::copy(version.begin(), version.end(), buffer.begin());
}

std::string DecodeVersionTag(std::span<const uint8_t> buffer) {
  const auto end = std::find(buffer.begin(), buffer.end(), uint8_t{0});
  return std::string(buffer.begin(), end);
}

bool IsVersionReadable(std::string_view written, std::string_view current) {
  return written <= current;
}

}  // namespace slimenv

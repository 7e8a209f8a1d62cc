#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace slimenv {

constexpr const char* kDefaultVersion = "1.0.0";
constexpr size_t kDefaultVersionMaxLen = 16;
constexpr uint64_t kMaxMarshalledSize = uint64_t{1} << 30;

// Width of the header fields this build knows about: version tag,
// header_size and data_size.
constexpr uint64_t MinimumHeaderSize(size_t version_max_len) {
  return static_cast<uint64_t>(version_max_len) + 2 * sizeof(uint64_t);
}

struct FormatConfig {
  // Version stamped into written headers and the newest version accepted on read.
  std::string version = kDefaultVersion;
  size_t version_max_len = kDefaultVersionMaxLen;
  // Header width emitted by writers. 0 selects MinimumHeaderSize. Anything
  // larger is zero-filled after data_size.
  uint64_t header_size = 0;
  // Window of a positional read, and the largest envelope written or header accepted.
  uint64_t max_marshalled_size = kMaxMarshalledSize;
};

// Throws std::invalid_argument for an unusable configuration.
void ValidateFormatConfig(const FormatConfig& cfg);

}  // namespace slimenv

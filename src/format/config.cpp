#include "slimenv/format/config.hpp"

#include <stdexcept>

namespace slimenv {

void ValidateFormatConfig(const FormatConfig& cfg) {
  if (cfg.version_max_len == 0) {
    throw std::invalid_argument("version_max_len must be > 0");
  }
  if (cfg.version.empty()) {
    throw std::invalid_argument("version must not be empty");
  }
  if (cfg.version.size() >= cfg.version_max_len) {
    throw std::invalid_argument("version must be shorter than version_max_len");
  }
  if (cfg.header_size != 0 && cfg.header_size < MinimumHeaderSize(cfg.version_max_len)) {
    throw std::invalid_argument("header_size is smaller than the minimum header width");
  }
  const uint64_t header_size =
      cfg.header_size == 0 ? MinimumHeaderSize(cfg.version_max_len) : cfg.header_size;
  if (cfg.max_marshalled_size < header_size) {
    throw std::invalid_argument("max_marshalled_size cannot hold a header");
  }
}

}  // namespace slimenv

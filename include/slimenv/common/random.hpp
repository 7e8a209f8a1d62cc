#pragma once

#include <cstddef>
#include <cstdint>

#include "slimenv/common/bytes.hpp"

namespace slimenv {

class Csprng {
 public:
  static Bytes RandomBytes(size_t size);
  static uint64_t RandomUint64(uint64_t bound);
};

}  // namespace slimenv

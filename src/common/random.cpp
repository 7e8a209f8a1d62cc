#include "slimenv/common/random.hpp"

#include <stdexcept>

#include <openssl/rand.h>

namespace slimenv {

Bytes Csprng::RandomBytes(size_t size) {
  Bytes out(size);
  if (size == 0) {
    return out;
  }

  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return out;
}

// Uniform in [0, bound) by rejection sampling.
uint64_t Csprng::RandomUint64(uint64_t bound) {
  if (bound == 0) {
    throw std::invalid_argument("RandomUint64 bound must be > 0");
  }

  const uint64_t limit = UINT64_MAX - (UINT64_MAX % bound);
  while (true) {
    const Bytes bytes = RandomBytes(8);
    uint64_t value = 0;
    for (uint8_t b : bytes) {
      value = (value << 8) | b;
    }
    if (value < limit) {
      return value % bound;
    }
  }
}

}  // namespace slimenv

#pragma once

#include <cstdint>
#include <span>

#include "slimenv/common/bytes.hpp"

namespace slimenv {

// Serializer for the opaque payload carried by an envelope. The envelope
// layer never inspects the bytes; anything thrown here reaches the caller
// unchanged.
template <typename T>
class IPayloadCodec {
 public:
  virtual ~IPayloadCodec() = default;

  virtual Bytes Encode(const T& value) const = 0;
  virtual void Decode(std::span<const uint8_t> encoded, T* out) const = 0;
  // Exact length Encode would produce, computed without encoding.
  virtual uint64_t EncodedSize(const T& value) const = 0;
};

}  // namespace slimenv

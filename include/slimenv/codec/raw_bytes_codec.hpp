#pragma once

#include <cstdint>

#include "slimenv/codec/payload_codec.hpp"
#include "slimenv/format/config.hpp"

namespace slimenv {

// Identity codec for payloads that are already bytes.
class RawBytesCodec : public IPayloadCodec<Bytes> {
 public:
  explicit RawBytesCodec(uint64_t max_payload_len = kMaxMarshalledSize);

  Bytes Encode(const Bytes& value) const override;
  void Decode(std::span<const uint8_t> encoded, Bytes* out) const override;
  uint64_t EncodedSize(const Bytes& value) const override;

  uint64_t max_payload_len() const;

 private:
  uint64_t max_payload_len_;
};

}  // namespace slimenv

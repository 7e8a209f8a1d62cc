#include "slimenv/codec/raw_bytes_codec.hpp"

#include <stdexcept>
#include <string>

#include "slimenv/common/errors.hpp"

namespace slimenv {

RawBytesCodec::RawBytesCodec(uint64_t max_payload_len) : max_payload_len_(max_payload_len) {}

Bytes RawBytesCodec::Encode(const Bytes& value) const {
  if (value.size() > max_payload_len_) {
    throw PayloadCodecError("payload of " + std::to_string(value.size()) +
                            " bytes exceeds max_payload_len");
  }
  return value;
}

void RawBytesCodec::Decode(std::span<const uint8_t> encoded, Bytes* out) const {
  if (out == nullptr) {
    throw std::invalid_argument("RawBytesCodec::Decode requires an output");
  }
  if (encoded.size() > max_payload_len_) {
    throw PayloadCodecError("payload of " + std::to_string(encoded.size()) +
                            " bytes exceeds max_payload_len");
  }
  out->assign(encoded.begin(), encoded.end());
}

uint64_t RawBytesCodec::EncodedSize(const Bytes& value) const {
  return value.size();
}

uint64_t RawBytesCodec::max_payload_len() const {
  return max_payload_len_;
}

}  // namespace slimenv

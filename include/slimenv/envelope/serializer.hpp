#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

#include "slimenv/codec/payload_codec.hpp"
#include "slimenv/envelope/envelope.hpp"
#include "slimenv/format/header.hpp"

namespace slimenv {

// Writes and reads values of type T wrapped in versioned envelopes.
//
// Stateless apart from its configuration: one serializer may be shared by
// threads that each work on their own stream. A stream itself must not be
// used by two callers at once.
template <typename T>
class EnvelopeSerializer {
 public:
  explicit EnvelopeSerializer(std::shared_ptr<const IPayloadCodec<T>> payload_codec,
                              FormatConfig cfg = {})
      : payload_codec_(std::move(payload_codec)), header_codec_(std::move(cfg)) {
    if (!payload_codec_) {
      throw std::invalid_argument("EnvelopeSerializer requires a payload codec");
    }
  }

  const HeaderCodec& header_codec() const {
    return header_codec_;
  }

  // Nothing is written if the payload codec throws.
  uint64_t Write(ISequentialWriter* writer, const T& value) const {
    const Bytes payload = payload_codec_->Encode(value);
    return WriteEncodedEnvelope(header_codec_, writer, payload);
  }

  uint64_t WriteAt(IRandomAccessWriter* writer, uint64_t offset, const T& value) const {
    const Bytes payload = payload_codec_->Encode(value);
    return WriteEncodedEnvelopeAt(header_codec_, writer, offset, payload);
  }

  void Read(ISequentialReader* reader, T* out) const {
    const Bytes payload = ReadEncodedEnvelope(header_codec_, reader);
    payload_codec_->Decode(payload, out);
  }

  // Returns false when the reader holds no further envelope.
  bool ReadNext(ISequentialReader* reader, T* out) const {
    const std::optional<Bytes> payload = ReadNextEncodedEnvelope(header_codec_, reader);
    if (!payload.has_value()) {
      return false;
    }
    payload_codec_->Decode(*payload, out);
    return true;
  }

  // Returns the number of bytes the envelope at `offset` occupies.
  uint64_t ReadAt(IRandomAccessReader* reader, uint64_t offset, T* out) const {
    uint64_t consumed = 0;
    const Bytes payload = ReadEncodedEnvelopeAt(header_codec_, reader, offset, &consumed);
    payload_codec_->Decode(payload, out);
    return consumed;
  }

  uint64_t HeaderSize() const {
    return header_codec_.header_size();
  }

  uint64_t TotalSize(const T& value) const {
    return HeaderSize() + payload_codec_->EncodedSize(value);
  }

 private:
  std::shared_ptr<const IPayloadCodec<T>> payload_codec_;
  HeaderCodec header_codec_;
};

}  // namespace slimenv

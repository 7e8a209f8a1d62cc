#pragma once

#include <climits>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <google/protobuf/message_lite.h>

#include "slimenv/codec/payload_codec.hpp"
#include "slimenv/common/errors.hpp"

namespace slimenv {

// Payload codec for protobuf messages. EncodedSize is ByteSizeLong(), so the
// size estimator never serializes the message.
template <typename T>
class ProtobufCodec : public IPayloadCodec<T> {
  static_assert(std::is_base_of_v<google::protobuf::MessageLite, T>,
                "ProtobufCodec requires a protobuf message type");

 public:
  Bytes Encode(const T& value) const override {
    const size_t size = value.ByteSizeLong();
    if (size > static_cast<size_t>(INT_MAX)) {
      throw PayloadCodecError("protobuf message of " + std::to_string(size) +
                              " bytes exceeds the 2 GiB serialization limit");
    }

    Bytes out(size);
    if (!value.SerializeToArray(out.data(), static_cast<int>(size))) {
      throw PayloadCodecError("failed to serialize " + std::string(value.GetTypeName()));
    }
    return out;
  }

  void Decode(std::span<const uint8_t> encoded, T* out) const override {
    if (out == nullptr) {
      throw std::invalid_argument("ProtobufCodec::Decode requires an output");
    }
    if (encoded.size() > static_cast<size_t>(INT_MAX)) {
      throw PayloadCodecError("protobuf payload of " + std::to_string(encoded.size()) +
                              " bytes exceeds the 2 GiB parse limit");
    }
    if (!out->ParseFromArray(encoded.data(), static_cast<int>(encoded.size()))) {
      throw PayloadCodecError("failed to parse " + std::string(out->GetTypeName()) + " from " +
                              std::to_string(encoded.size()) + " bytes");
    }
  }

  uint64_t EncodedSize(const T& value) const override {
    return value.ByteSizeLong();
  }
};

}  // namespace slimenv

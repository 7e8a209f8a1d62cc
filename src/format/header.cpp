#include "slimenv/format/header.hpp"

#include <algorithm>
#include <array>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>

#include "slimenv/common/errors.hpp"
#include "slimenv/format/version_tag.hpp"

namespace slimenv {
namespace {

void AppendU64Le(uint64_t value, Bytes* out) {
  for (int shift = 0; shift < 64; shift += 8) {
    out->push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
  }
}

uint64_t ReadU64Le(std::span<const uint8_t> input) {
  if (input.size() < 8) {
    throw std::invalid_argument("Not enough bytes to read u64");
  }

  uint64_t value = 0;
  for (int i = 7; i >= 0; --i) {
    value = (value << 8) | input[static_cast<size_t>(i)];
  }
  return value;
}

void SkipExactly(ISequentialReader* reader, uint64_t count) {
  std::array<uint8_t, 4096> scratch{};
  while (count > 0) {
    const size_t step = static_cast<size_t>(std::min<uint64_t>(count, scratch.size()));
    ReadExactly(reader, std::span<uint8_t>(scratch).first(step), "trailing header fields");
    count -= step;
  }
}

}  // namespace

HeaderCodec::HeaderCodec(FormatConfig cfg) : cfg_(std::move(cfg)) {
  ValidateFormatConfig(cfg_);
  header_size_ = cfg_.header_size == 0 ? minimum_header_size() : cfg_.header_size;
}

const FormatConfig& HeaderCodec::config() const {
  return cfg_;
}

uint64_t HeaderCodec::header_size() const {
  return header_size_;
}

uint64_t HeaderCodec::minimum_header_size() const {
  return MinimumHeaderSize(cfg_.version_max_len);
}

Header HeaderCodec::MakeHeader(uint64_t data_size) const {
  Header header;
  header.version = cfg_.version;
  header.header_size = header_size_;
  header.data_size = data_size;
  return header;
}

Bytes HeaderCodec::Encode(const Header& header) const {
  if (header.header_size < minimum_header_size()) {
    throw std::invalid_argument("header_size " + std::to_string(header.header_size) +
                                " is smaller than the minimum header width " +
                                std::to_string(minimum_header_size()));
  }
  if (header.header_size > cfg_.max_marshalled_size) {
    throw std::invalid_argument("header_size exceeds max_marshalled_size");
  }

  Bytes out(cfg_.version_max_len, 0);
  out.reserve(static_cast<size_t>(header.header_size));
  EncodeVersionTag(header.version, out);

  AppendU64Le(header.header_size, &out);
  AppendU64Le(header.data_size, &out);
  out.resize(static_cast<size_t>(header.header_size), 0);
  return out;
}

Header HeaderCodec::Decode(ISequentialReader* reader) const {
  if (reader == nullptr) {
    throw std::invalid_argument("HeaderCodec::Decode requires a reader");
  }

  Bytes version_buf(cfg_.version_max_len);
  const size_t n = ReadFull(reader, version_buf);
  if (n == 0) {
    throw EndOfStreamError("end of stream before envelope header");
  }
  if (n < version_buf.size()) {
    throw UnexpectedEofError("unexpected end of stream in version tag: got " +
                             std::to_string(n) + " of " +
                             std::to_string(version_buf.size()) + " bytes");
  }

  Header header;
  header.version = DecodeVersionTag(version_buf);
  // Decided on the tag alone: the size fields of a newer layout are not trusted.
  if (!IsVersionReadable(header.version, cfg_.version)) {
    throw ForwardCompatibilityError("envelope version \"" + header.version +
                                    "\" is newer than supported version \"" +
                                    cfg_.version + "\"");
  }

  std::array<uint8_t, 8> size_buf{};
  ReadExactly(reader, size_buf, "header_size");
  header.header_size = ReadU64Le(size_buf);

  if (header.header_size < minimum_header_size()) {
    throw MalformedHeaderError("header_size " + std::to_string(header.header_size) +
                               " is smaller than the minimum header width " +
                               std::to_string(minimum_header_size()));
  }
  if (header.header_size > cfg_.max_marshalled_size) {
    throw MalformedHeaderError("header_size " + std::to_string(header.header_size) +
                               " exceeds max_marshalled_size");
  }

  std::array<uint8_t, 8> data_size_buf{};
  ReadExactly(reader, data_size_buf, "data_size");
  header.data_size = ReadU64Le(data_size_buf);

  // Fields appended by newer writers are read and dropped uninterpreted.
  SkipExactly(reader, header.header_size - minimum_header_size());
  return header;
}

}  // namespace slimenv

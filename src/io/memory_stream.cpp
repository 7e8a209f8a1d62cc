#include "slimenv/io/memory_stream.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

#include "slimenv/common/errors.hpp"

namespace slimenv {

MemoryStream::MemoryStream(Bytes data) : data_(std::move(data)) {}

size_t MemoryStream::Read(std::span<uint8_t> out) {
  const size_t n = std::min(out.size(), data_.size() - read_pos_);
  std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(read_pos_), n, out.begin());
  read_pos_ += n;
  return n;
}

void MemoryStream::Write(std::span<const uint8_t> data) {
  data_.insert(data_.end(), data.begin(), data.end());
}

size_t MemoryStream::ReadAt(std::span<uint8_t> out, uint64_t offset) {
  if (offset >= data_.size()) {
    return 0;
  }

  const size_t start = static_cast<size_t>(offset);
  const size_t n = std::min(out.size(), data_.size() - start);
  std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(start), n, out.begin());
  return n;
}

void MemoryStream::WriteAt(std::span<const uint8_t> data, uint64_t offset) {
  if (offset > data_.max_size() || data.size() > data_.max_size() - offset) {
    throw IoError("MemoryStream write offset out of range");
  }

  const size_t start = static_cast<size_t>(offset);
  if (start + data.size() > data_.size()) {
    data_.resize(start + data.size(), 0);
  }
  std::copy(data.begin(), data.end(), data_.begin() + static_cast<std::ptrdiff_t>(start));
}

const Bytes& MemoryStream::data() const {
  return data_;
}

size_t MemoryStream::read_position() const {
  return read_pos_;
}

size_t MemoryStream::remaining() const {
  return data_.size() - read_pos_;
}

void MemoryStream::Rewind() {
  read_pos_ = 0;
}

}  // namespace slimenv

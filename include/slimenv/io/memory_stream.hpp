#pragma once

#include <cstddef>

#include "slimenv/common/bytes.hpp"
#include "slimenv/io/stream.hpp"

namespace slimenv {

// Growable in-memory byte store usable as any of the four stream kinds.
// Sequential writes append; sequential reads consume from an independent
// read cursor. Positional writes past the end zero-fill the gap.
class MemoryStream : public ISequentialReader,
                     public ISequentialWriter,
                     public IRandomAccessReader,
                     public IRandomAccessWriter {
 public:
  MemoryStream() = default;
  explicit MemoryStream(Bytes data);

  size_t Read(std::span<uint8_t> out) override;
  void Write(std::span<const uint8_t> data) override;
  size_t ReadAt(std::span<uint8_t> out, uint64_t offset) override;
  void WriteAt(std::span<const uint8_t> data, uint64_t offset) override;

  const Bytes& data() const;
  size_t read_position() const;
  size_t remaining() const;
  void Rewind();

 private:
  Bytes data_;
  size_t read_pos_ = 0;
};

}  // namespace slimenv

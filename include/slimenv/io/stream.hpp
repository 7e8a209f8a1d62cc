#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace slimenv {

// Sequential byte source. Read returns the number of bytes stored into `out`,
// which may be fewer than requested; 0 means the stream is exhausted.
// Failures are reported by throwing IoError.
class ISequentialReader {
 public:
  virtual ~ISequentialReader() = default;

  virtual size_t Read(std::span<uint8_t> out) = 0;
};

// Sequential byte sink. Write either stores every byte or throws IoError.
class ISequentialWriter {
 public:
  virtual ~ISequentialWriter() = default;

  virtual void Write(std::span<const uint8_t> data) = 0;
};

// Positional byte source. A result shorter than `out` only happens at the end
// of the underlying data.
class IRandomAccessReader {
 public:
  virtual ~IRandomAccessReader() = default;

  virtual size_t ReadAt(std::span<uint8_t> out, uint64_t offset) = 0;
};

class IRandomAccessWriter {
 public:
  virtual ~IRandomAccessWriter() = default;

  virtual void WriteAt(std::span<const uint8_t> data, uint64_t offset) = 0;
};

// Calls reader->Read until `out` is full or the stream is exhausted.
// Returns the number of bytes read.
size_t ReadFull(ISequentialReader* reader, std::span<uint8_t> out);

// Reads exactly out.size() bytes or throws UnexpectedEofError.
// `what` names the field in error messages.
void ReadExactly(ISequentialReader* reader, std::span<uint8_t> out, const char* what);

}  // namespace slimenv

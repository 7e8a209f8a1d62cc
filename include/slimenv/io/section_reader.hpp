#pragma once

#include <cstdint>

#include "slimenv/io/stream.hpp"

namespace slimenv {

// Sequential view over [base, base + limit) of a random-access source.
// The limit is a ceiling on how far the view may advance, not the size of
// the underlying data: reads stop early at the source's end.
class SectionReader : public ISequentialReader {
 public:
  SectionReader(IRandomAccessReader* source, uint64_t base, uint64_t limit);

  size_t Read(std::span<uint8_t> out) override;

  uint64_t base() const;
  uint64_t limit() const;
  // Bytes consumed so far, relative to base.
  uint64_t position() const;

 private:
  IRandomAccessReader* source_;
  uint64_t base_;
  uint64_t limit_;
  uint64_t position_ = 0;
};

}  // namespace slimenv

#include "slimenv/io/section_reader.hpp"

#include <algorithm>
#include <stdexcept>

#include "slimenv/common/errors.hpp"

namespace slimenv {

SectionReader::SectionReader(IRandomAccessReader* source, uint64_t base, uint64_t limit)
    : source_(source), base_(base), limit_(limit) {
  if (source_ == nullptr) {
    throw std::invalid_argument("SectionReader requires a source");
  }
  // Clamp so that base + limit never wraps.
  if (limit_ > UINT64_MAX - base_) {
    limit_ = UINT64_MAX - base_;
  }
}

size_t SectionReader::Read(std::span<uint8_t> out) {
  if (position_ >= limit_) {
    return 0;
  }

  const uint64_t left = limit_ - position_;
  const size_t want = static_cast<size_t>(std::min<uint64_t>(out.size(), left));
  const size_t got = source_->ReadAt(out.first(want), base_ + position_);
  if (got > want) {
    throw InternalError("SectionReader source returned more bytes than requested");
  }
  position_ += got;
  return got;
}

uint64_t SectionReader::base() const {
  return base_;
}

uint64_t SectionReader::limit() const {
  return limit_;
}

uint64_t SectionReader::position() const {
  return position_;
}

}  // namespace slimenv

#include "slimenv/io/stream.hpp"

#include <stdexcept>
#include <string>

#include "slimenv/common/errors.hpp"

namespace slimenv {

size_t ReadFull(ISequentialReader* reader, std::span<uint8_t> out) {
  if (reader == nullptr) {
    throw std::invalid_argument("ReadFull requires a reader");
  }

  size_t filled = 0;
  while (filled < out.size()) {
    const size_t n = reader->Read(out.subspan(filled));
    if (n == 0) {
      break;
    }
    filled += n;
  }
  return filled;
}

void ReadExactly(ISequentialReader* reader, std::span<uint8_t> out, const char* what) {
  const size_t n = ReadFull(reader, out);
  if (n == out.size()) {
    return;
  }
  throw UnexpectedEofError(std::string("unexpected end of stream in ") + what + ": got " +
                           std::to_string(n) + " of " + std::to_string(out.size()) +
                           " bytes");
}

}  // namespace slimenv

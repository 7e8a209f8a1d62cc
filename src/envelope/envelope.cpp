#include "slimenv/envelope/envelope.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "slimenv/common/errors.hpp"
#include "slimenv/io/section_reader.hpp"

namespace slimenv {
namespace {

constexpr size_t kPayloadReadChunk = size_t{1} << 16;

// Grows the buffer as bytes arrive so a corrupted data_size on a short
// stream fails on the missing bytes rather than on one huge allocation.
Bytes ReadPayload(ISequentialReader* reader, uint64_t data_size) {
  Bytes out;
  while (out.size() < data_size) {
    const size_t step =
        static_cast<size_t>(std::min<uint64_t>(kPayloadReadChunk, data_size - out.size()));
    const size_t old_size = out.size();
    out.resize(old_size + step);
    const size_t got = ReadFull(reader, std::span<uint8_t>(out).subspan(old_size));
    if (got < step) {
      throw UnexpectedEofError("unexpected end of stream in payload: got " +
                               std::to_string(old_size + got) + " of " +
                               std::to_string(data_size) + " bytes");
    }
  }
  return out;
}

Bytes EncodeHeaderFor(const HeaderCodec& codec, std::span<const uint8_t> payload) {
  const Header header = codec.MakeHeader(payload.size());
  const uint64_t limit = codec.config().max_marshalled_size;
  if (header.data_size > limit - header.header_size) {
    throw PayloadTooLargeError("envelope of " + std::to_string(header.header_size) + " + " +
                               std::to_string(header.data_size) +
                               " bytes exceeds max_marshalled_size " + std::to_string(limit));
  }
  return codec.Encode(header);
}

}  // namespace

uint64_t WriteEncodedEnvelope(const HeaderCodec& codec,
                              ISequentialWriter* writer,
                              std::span<const uint8_t> payload) {
  if (writer == nullptr) {
    throw std::invalid_argument("WriteEncodedEnvelope requires a writer");
  }

  const Bytes header = EncodeHeaderFor(codec, payload);
  writer->Write(header);
  writer->Write(payload);
  return header.size() + payload.size();
}

uint64_t WriteEncodedEnvelopeAt(const HeaderCodec& codec,
                                IRandomAccessWriter* writer,
                                uint64_t offset,
                                std::span<const uint8_t> payload) {
  if (writer == nullptr) {
    throw std::invalid_argument("WriteEncodedEnvelopeAt requires a writer");
  }

  const Bytes header = EncodeHeaderFor(codec, payload);
  writer->WriteAt(header, offset);
  writer->WriteAt(payload, offset + header.size());
  return header.size() + payload.size();
}

Bytes ReadEncodedEnvelope(const HeaderCodec& codec, ISequentialReader* reader, Header* header) {
  const Header decoded = codec.Decode(reader);
  Bytes payload = ReadPayload(reader, decoded.data_size);
  if (header != nullptr) {
    *header = decoded;
  }
  return payload;
}

std::optional<Bytes> ReadNextEncodedEnvelope(const HeaderCodec& codec,
                                             ISequentialReader* reader,
                                             Header* header) {
  try {
    return ReadEncodedEnvelope(codec, reader, header);
  } catch (const EndOfStreamError&) {
    return std::nullopt;
  }
}

Bytes ReadEncodedEnvelopeAt(const HeaderCodec& codec,
                            IRandomAccessReader* reader,
                            uint64_t offset,
                            uint64_t* consumed,
                            Header* header) {
  if (consumed == nullptr) {
    throw std::invalid_argument("ReadEncodedEnvelopeAt requires a consumed output");
  }

  // The window is a ceiling on how far the read may go, not a size check on
  // the envelope itself.
  SectionReader section(reader, offset, codec.config().max_marshalled_size);

  Header decoded;
  Bytes payload = ReadEncodedEnvelope(codec, &section, &decoded);

  const uint64_t position = section.position();
  if (position != decoded.header_size + decoded.data_size) {
    throw InternalError("positional read consumed " + std::to_string(position) +
                        " bytes for an envelope of " +
                        std::to_string(decoded.header_size + decoded.data_size));
  }

  *consumed = position;
  if (header != nullptr) {
    *header = decoded;
  }
  return payload;
}

}  // namespace slimenv

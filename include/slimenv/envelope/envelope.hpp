#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include "slimenv/common/bytes.hpp"
#include "slimenv/format/header.hpp"
#include "slimenv/io/stream.hpp"

namespace slimenv {

// Byte-level envelope I/O. The payload is already encoded; see
// EnvelopeSerializer for the typed front end.

// Writes header then payload and returns the number of bytes written. The
// header is fully encoded before the first byte reaches the writer. If the
// payload write fails after the header went out, the sink is left holding a
// truncated envelope and the error propagates.
uint64_t WriteEncodedEnvelope(const HeaderCodec& codec,
                              ISequentialWriter* writer,
                              std::span<const uint8_t> payload);

uint64_t WriteEncodedEnvelopeAt(const HeaderCodec& codec,
                                IRandomAccessWriter* writer,
                                uint64_t offset,
                                std::span<const uint8_t> payload);

// Reads one envelope and returns its payload bytes. `header` is optional.
Bytes ReadEncodedEnvelope(const HeaderCodec& codec,
                          ISequentialReader* reader,
                          Header* header = nullptr);

// Like ReadEncodedEnvelope, but returns nullopt when the reader is exhausted
// exactly at an envelope boundary.
std::optional<Bytes> ReadNextEncodedEnvelope(const HeaderCodec& codec,
                                             ISequentialReader* reader,
                                             Header* header = nullptr);

// Reads the envelope starting at `offset`. `consumed` receives the envelope's
// total length, i.e. the distance to the next back-to-back envelope.
Bytes ReadEncodedEnvelopeAt(const HeaderCodec& codec,
                            IRandomAccessReader* reader,
                            uint64_t offset,
                            uint64_t* consumed,
                            Header* header = nullptr);

}  // namespace slimenv

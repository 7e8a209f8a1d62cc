#pragma once

#include <cstdint>
#include <string>

#include "slimenv/common/bytes.hpp"
#include "slimenv/format/config.hpp"
#include "slimenv/io/stream.hpp"

namespace slimenv {

/*
  Envelope header, little-endian throughout:

    [0, MAXLEN)              version tag, zero-padded
    [MAXLEN, MAXLEN + 8)     header_size
    [MAXLEN + 8, MAXLEN + 16) data_size
    [MAXLEN + 16, header_size) fields appended by newer writers

  Existing fields never change type, size or position. New fields may only
  be appended after data_size, and readers skip what they do not know.
*/
struct Header {
  std::string version;
  uint64_t header_size = 0;
  uint64_t data_size = 0;

  bool operator==(const Header& other) const = default;
};

class HeaderCodec {
 public:
  explicit HeaderCodec(FormatConfig cfg = {});

  const FormatConfig& config() const;
  // Width of the headers this codec writes.
  uint64_t header_size() const;
  uint64_t minimum_header_size() const;

  // Header stamped with the configured version and width.
  Header MakeHeader(uint64_t data_size) const;

  // Emits exactly header.header_size bytes. Bytes past data_size are zero.
  Bytes Encode(const Header& header) const;

  // Reads one header. Throws EndOfStreamError if the reader is already
  // exhausted, UnexpectedEofError on truncation, MalformedHeaderError on an
  // impossible header_size and ForwardCompatibilityError when the header was
  // written by a newer version than the configured one.
  Header Decode(ISequentialReader* reader) const;

 private:
  FormatConfig cfg_;
  uint64_t header_size_;
};

}  // namespace slimenv

#pragma once

#include <stdexcept>

namespace slimenv {

class EnvelopeError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Any failed or short read/write against the underlying stream.
class IoError : public EnvelopeError {
 public:
  using EnvelopeError::EnvelopeError;
};

// The stream was exhausted before the first byte of a header.
// Callers iterating concatenated envelopes treat this as "no more envelopes".
class EndOfStreamError : public IoError {
 public:
  using IoError::IoError;
};

// The stream ended inside a header field or a payload.
class UnexpectedEofError : public IoError {
 public:
  using IoError::IoError;
};

class VersionOverflowError : public EnvelopeError {
 public:
  using EnvelopeError::EnvelopeError;
};

class ForwardCompatibilityError : public EnvelopeError {
 public:
  using EnvelopeError::EnvelopeError;
};

class MalformedHeaderError : public EnvelopeError {
 public:
  using EnvelopeError::EnvelopeError;
};

class PayloadTooLargeError : public EnvelopeError {
 public:
  using EnvelopeError::EnvelopeError;
};

class PayloadCodecError : public EnvelopeError {
 public:
  using EnvelopeError::EnvelopeError;
};

// Bookkeeping inconsistency inside this library. Indicates a bug, not bad input.
class InternalError : public EnvelopeError {
 public:
  using EnvelopeError::EnvelopeError;
};

}  // namespace slimenv

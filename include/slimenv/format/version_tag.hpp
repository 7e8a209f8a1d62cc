#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace slimenv {

// Zero-fills `buffer` and copies `version` into it. The tag must leave room
// for at least one terminating zero byte, otherwise VersionOverflowError.
void EncodeVersionTag(std::string_view version, std::span<uint8_t> buffer);

// Returns the bytes before the first zero, or the whole buffer if none.
std::string DecodeVersionTag(std::span<const uint8_t> buffer);

// A reader running `current` only accepts data stamped with a version that
// does not sort after its own.
bool IsVersionReadable(std::string_view written, std::string_view current);

}  // namespace slimenv

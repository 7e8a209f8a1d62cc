#pragma once

#include <cstdint>
#include <vector>

namespace slimenv {

using Bytes = std::vector<uint8_t>;

}  // namespace slimenv

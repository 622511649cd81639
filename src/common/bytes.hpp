#pragma once

#include <cstdint>
#include <vector>

namespace tsblob {

// Opaque payload bytes, as supplied by the caller or as stored.
using Bytes = std::vector<std::uint8_t>;

} // namespace tsblob

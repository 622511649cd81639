#pragma once

#include "common/bytes.hpp"
#include "common/error.hpp"

#include <cstdint>
#include <optional>
#include <span>

namespace tsblob::codec {

// ── zlib codec ────────────────────────────────────────────────────────────────
//
// Whole-buffer deflate/inflate in the zlib container format (RFC 1950),
// driven through Boost.Iostreams filter chains.
//
// Thread-safe: pure functions, no shared state.

// Compresses `data`.  `level` is a zlib level in [0, 9]; std::nullopt selects
// zlib's default level.  An out-of-range level is a GeneralError; a codec
// failure is an InternalError with origin "zlib".
[[nodiscard]] Result<Bytes> deflate(std::span<const std::uint8_t> data,
                                    std::optional<int> level = std::nullopt);

// Decompresses a complete zlib stream.  Corrupt or truncated input yields an
// InternalError; partial output is never returned.
[[nodiscard]] Result<Bytes> inflate(std::span<const std::uint8_t> data);

} // namespace tsblob::codec

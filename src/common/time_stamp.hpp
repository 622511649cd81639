#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tsblob {

// ── TimeStamp ─────────────────────────────────────────────────────────────────
//
// Calendar-naive point in time supplied by the caller.  No time zone is
// stored alongside it: the store keys rows on whole unix seconds, and callers
// are responsible for consistent zone handling upstream.

using TimeStamp = std::chrono::sys_time<std::chrono::system_clock::duration>;

// Whole seconds since the unix epoch.  Sub-second precision is floored away,
// so two time stamps inside the same second address the same row.
[[nodiscard]] std::int64_t to_unix_seconds(TimeStamp ts) noexcept;

[[nodiscard]] TimeStamp from_unix_seconds(std::int64_t seconds) noexcept;

// False for second counts outside what TimeStamp can hold (roughly the years
// 1677 to 2262).  from_unix_seconds() requires a representable value.
[[nodiscard]] bool is_representable(std::int64_t seconds) noexcept;

// Convenience for literals in tests and tools.
[[nodiscard]] TimeStamp make_time_stamp(int year, unsigned month, unsigned day,
                                        unsigned hour = 0, unsigned minute = 0,
                                        unsigned second = 0);

// "YYYY-MM-DD HH:MM:SS" (sub-second part dropped).
[[nodiscard]] std::string format_time_stamp(TimeStamp ts);

// Accepted forms:
//   YYYY-MM-DDTHH:MM:SS
//   YYYY-MM-DD HH:MM:SS
//   YYYY-MM-DD            (midnight)
//   @<unix seconds>       (may be negative)
// Returns std::nullopt on malformed input or out-of-range fields.
[[nodiscard]] std::optional<TimeStamp> parse_time_stamp(std::string_view text);

} // namespace tsblob

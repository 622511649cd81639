#include "common/time_stamp.hpp"

#include <charconv>

#include <fmt/format.h>

namespace tsblob {

namespace chr = std::chrono;

namespace {

// Parse an unsigned decimal field of exactly `width` digits.
template <typename T>
[[nodiscard]] std::optional<T> parse_fixed(std::string_view sv, std::size_t width) {
    if (sv.size() != width) {
        return std::nullopt;
    }
    T value{};
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] std::optional<chr::year_month_day> parse_date(std::string_view sv) {
    // YYYY-MM-DD
    if (sv.size() != 10 || sv[4] != '-' || sv[7] != '-') {
        return std::nullopt;
    }
    auto y = parse_fixed<int>(sv.substr(0, 4), 4);
    auto m = parse_fixed<unsigned>(sv.substr(5, 2), 2);
    auto d = parse_fixed<unsigned>(sv.substr(8, 2), 2);
    if (!y || !m || !d) {
        return std::nullopt;
    }
    chr::year_month_day ymd{chr::year{*y}, chr::month{*m}, chr::day{*d}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return ymd;
}

[[nodiscard]] std::optional<chr::seconds> parse_clock(std::string_view sv) {
    // HH:MM:SS
    if (sv.size() != 8 || sv[2] != ':' || sv[5] != ':') {
        return std::nullopt;
    }
    auto h = parse_fixed<unsigned>(sv.substr(0, 2), 2);
    auto m = parse_fixed<unsigned>(sv.substr(3, 2), 2);
    auto s = parse_fixed<unsigned>(sv.substr(6, 2), 2);
    if (!h || !m || !s || *h > 23 || *m > 59 || *s > 59) {
        return std::nullopt;
    }
    return chr::hours{*h} + chr::minutes{*m} + chr::seconds{*s};
}

} // anonymous namespace

std::int64_t to_unix_seconds(TimeStamp ts) noexcept {
    return chr::floor<chr::seconds>(ts).time_since_epoch().count();
}

TimeStamp from_unix_seconds(std::int64_t seconds) noexcept {
    return TimeStamp{chr::seconds{seconds}};
}

bool is_representable(std::int64_t seconds) noexcept {
    constexpr auto kMax = chr::duration_cast<chr::seconds>(TimeStamp::duration::max()).count();
    constexpr auto kMin = chr::duration_cast<chr::seconds>(TimeStamp::duration::min()).count();
    return seconds >= kMin && seconds <= kMax;
}

TimeStamp make_time_stamp(int year, unsigned month, unsigned day,
                          unsigned hour, unsigned minute, unsigned second) {
    const chr::sys_days date{chr::year{year} / chr::month{month} / chr::day{day}};
    return TimeStamp{date + chr::hours{hour} + chr::minutes{minute} + chr::seconds{second}};
}

std::string format_time_stamp(TimeStamp ts) {
    const auto secs = chr::floor<chr::seconds>(ts);
    const auto days = chr::floor<chr::days>(secs);
    const chr::year_month_day ymd{days};
    const chr::hh_mm_ss<chr::seconds> tod{secs - days};

    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()),
                       tod.hours().count(),
                       tod.minutes().count(),
                       tod.seconds().count());
}

std::optional<TimeStamp> parse_time_stamp(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }

    if (text.front() == '@') {
        text.remove_prefix(1);
        std::int64_t seconds = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), seconds);
        if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() ||
            !is_representable(seconds)) {
            return std::nullopt;
        }
        return from_unix_seconds(seconds);
    }

    auto date = parse_date(text.substr(0, 10));
    if (!date) {
        return std::nullopt;
    }
    const chr::sys_days day_point{*date};
    const auto day_start = chr::sys_seconds{day_point}.time_since_epoch().count();
    if (!is_representable(day_start) || !is_representable(day_start + 86399)) {
        return std::nullopt;
    }

    if (text.size() == 10) {
        return TimeStamp{day_point};
    }
    if (text.size() != 19 || (text[10] != 'T' && text[10] != ' ')) {
        return std::nullopt;
    }

    auto clock = parse_clock(text.substr(11));
    if (!clock) {
        return std::nullopt;
    }
    return TimeStamp{day_point + *clock};
}

} // namespace tsblob

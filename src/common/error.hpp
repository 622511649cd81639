#pragma once

#include "common/time_stamp.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace tsblob {

// ── Error kinds ───────────────────────────────────────────────────────────────
//
// Every failure the library reports is one of these four plain structs, held
// in the closed Error variant below.  Callers std::visit over it or test a
// single kind with holds_error<T>().

// Failure reported by a collaborator (SQLite, zlib, the filesystem).  The
// foreign error is carried as an opaque payload: which library produced it,
// its native code and its message.
struct InternalError {
    std::string origin;   // "sqlite", "zlib" or "io"
    int         code = 0; // SQLite extended result code, zlib code, errno
    std::string message;
};

// The key has no row under any time stamp.
struct NoMatch {
    std::string key;
};

// The exact (key, time stamp) pair has no row.
struct TimeStampNotAvailable {
    std::string key;
    TimeStamp   time_stamp;
};

// Precondition violation detected by this library.
struct GeneralError {
    std::string message;
};

using Error = std::variant<InternalError, NoMatch, TimeStampNotAvailable, GeneralError>;

// ── Result types ──────────────────────────────────────────────────────────────

// Either the value produced by an operation or the reason it failed.
template <typename T>
using Result = std::variant<T, Error>;

// Outcome of an operation that produces no value: empty on success.
using Status = std::optional<Error>;

template <typename T>
[[nodiscard]] bool is_ok(const Result<T>& result) noexcept {
    return std::holds_alternative<T>(result);
}

// True when `error` holds the kind E.
template <typename E>
[[nodiscard]] bool holds_error(const Error& error) noexcept {
    return std::holds_alternative<E>(error);
}

template <typename E>
[[nodiscard]] bool holds_error(const Status& status) noexcept {
    return status.has_value() && std::holds_alternative<E>(*status);
}

template <typename E, typename T>
[[nodiscard]] bool holds_error(const Result<T>& result) noexcept {
    const auto* error = std::get_if<Error>(&result);
    return error != nullptr && std::holds_alternative<E>(*error);
}

[[nodiscard]] Error make_general_error(std::string message);

[[nodiscard]] Error make_internal_error(std::string origin, int code, std::string message);

// Human-readable description, suitable for logs and CLI output.
[[nodiscard]] std::string to_string(const Error& error);

} // namespace tsblob

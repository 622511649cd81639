#pragma once

#include "common/bytes.hpp"
#include "common/error.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace tsblob::sqlite {

// ── Deleters ──────────────────────────────────────────────────────────────────

struct ConnectionDeleter {
    void operator()(sqlite3* db) const noexcept;
};

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const noexcept;
};

// Storage class of a column value in the current row.
enum class ColumnType : std::uint8_t {
    Integer,
    Float,
    Text,
    Blob,
    Null,
};

enum class StepResult : std::uint8_t {
    Row,  // a result row is available through the column accessors
    Done, // the statement ran to completion
};

// ── Statement ─────────────────────────────────────────────────────────────────
//
// A prepared statement.  Bind indices are 1-based, column indices 0-based,
// both as in the SQLite C API.  Column accessors are only meaningful after
// step() returned StepResult::Row.

class Statement {
public:
    Statement(sqlite3* db, sqlite3_stmt* stmt);

    [[nodiscard]] Status bind_text(int index, std::string_view value);
    [[nodiscard]] Status bind_int64(int index, std::int64_t value);
    [[nodiscard]] Status bind_blob(int index, std::span<const std::uint8_t> value);
    [[nodiscard]] Status bind_null(int index);

    [[nodiscard]] Result<StepResult> step();

    [[nodiscard]] ColumnType column_type(int index) const;
    [[nodiscard]] std::int64_t column_int64(int index) const;
    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] Bytes column_blob(int index) const;

private:
    [[nodiscard]] Status check_bind(int rc) const;

    sqlite3* db_; // owned by the Connection that prepared this statement
    std::unique_ptr<sqlite3_stmt, StatementDeleter> stmt_;
};

// ── Connection ────────────────────────────────────────────────────────────────
//
// Exclusive owner of one sqlite3 handle.  Movable; a moved-from Connection
// is closed.  Not thread-safe: callers serialise access.

class Connection {
public:
    Connection() = default;

    // Opens `path` read-write, creating the file if it does not exist.
    [[nodiscard]] static Result<Connection> open(const std::filesystem::path& path);

    // Runs one or more ';'-separated statements without parameters.
    [[nodiscard]] Status exec(const std::string& sql);

    [[nodiscard]] Result<Statement> prepare(std::string_view sql);

    // Rows modified by the most recent INSERT, UPDATE or DELETE.
    [[nodiscard]] std::int64_t changes() const;

    [[nodiscard]] bool is_open() const noexcept { return db_ != nullptr; }

    void close() noexcept { db_.reset(); }

private:
    explicit Connection(sqlite3* db) : db_(db) {}

    std::unique_ptr<sqlite3, ConnectionDeleter> db_;
};

// Wraps the most recent failure on `db` (or, without a handle, the generic
// text for `rc`) as an InternalError with origin "sqlite".
[[nodiscard]] Error make_error(sqlite3* db, int rc);

// InternalError with origin "sqlite" and code SQLITE_MISMATCH, for values whose
// storage class does not match the schema.
[[nodiscard]] Error make_mismatch_error(std::string message);

} // namespace tsblob::sqlite

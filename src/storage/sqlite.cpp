#include "storage/sqlite.hpp"

#include <sqlite3.h>

#include <limits>
#include <utility>

namespace tsblob::sqlite {

namespace {

// Non-null pointer for empty text and blobs: SQLite binds NULL when handed a
// null pointer, which would turn an empty key into a NOT NULL violation.
constexpr char kEmpty[] = "";

} // anonymous namespace

void ConnectionDeleter::operator()(sqlite3* db) const noexcept {
    sqlite3_close_v2(db);
}

void StatementDeleter::operator()(sqlite3_stmt* stmt) const noexcept {
    sqlite3_finalize(stmt);
}

Error make_error(sqlite3* db, int rc) {
    if (db == nullptr) {
        return make_internal_error("sqlite", rc, sqlite3_errstr(rc));
    }
    return make_internal_error("sqlite", sqlite3_extended_errcode(db), sqlite3_errmsg(db));
}

Error make_mismatch_error(std::string message) {
    return make_internal_error("sqlite", SQLITE_MISMATCH, std::move(message));
}

// ── Statement ─────────────────────────────────────────────────────────────────

Statement::Statement(sqlite3* db, sqlite3_stmt* stmt)
    : db_(db), stmt_(stmt) {}

Status Statement::check_bind(int rc) const {
    if (rc != SQLITE_OK) {
        return make_error(db_, rc);
    }
    return std::nullopt;
}

Status Statement::bind_text(int index, std::string_view value) {
    const char* data = value.data() != nullptr ? value.data() : kEmpty;
    return check_bind(sqlite3_bind_text64(stmt_.get(), index, data, value.size(),
                                          SQLITE_TRANSIENT, SQLITE_UTF8));
}

Status Statement::bind_int64(int index, std::int64_t value) {
    return check_bind(sqlite3_bind_int64(stmt_.get(), index, value));
}

Status Statement::bind_blob(int index, std::span<const std::uint8_t> value) {
    if (value.empty()) {
        return check_bind(sqlite3_bind_zeroblob(stmt_.get(), index, 0));
    }
    return check_bind(sqlite3_bind_blob64(stmt_.get(), index, value.data(), value.size(),
                                          SQLITE_TRANSIENT));
}

Status Statement::bind_null(int index) {
    return check_bind(sqlite3_bind_null(stmt_.get(), index));
}

Result<StepResult> Statement::step() {
    const int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return StepResult::Row;
    }
    if (rc == SQLITE_DONE) {
        return StepResult::Done;
    }
    return make_error(db_, rc);
}

ColumnType Statement::column_type(int index) const {
    switch (sqlite3_column_type(stmt_.get(), index)) {
        case SQLITE_INTEGER: return ColumnType::Integer;
        case SQLITE_FLOAT:   return ColumnType::Float;
        case SQLITE_TEXT:    return ColumnType::Text;
        case SQLITE_BLOB:    return ColumnType::Blob;
        default:             return ColumnType::Null;
    }
}

std::int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

std::string Statement::column_text(int index) const {
    // column_text() before column_bytes() so the length refers to UTF-8 text.
    const auto* text = sqlite3_column_text(stmt_.get(), index);
    const int   size = sqlite3_column_bytes(stmt_.get(), index);
    if (text == nullptr || size <= 0) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(size));
}

Bytes Statement::column_blob(int index) const {
    const auto* blob = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt_.get(), index));
    const int   size = sqlite3_column_bytes(stmt_.get(), index);
    if (blob == nullptr || size <= 0) {
        return {};
    }
    return Bytes(blob, blob + size);
}

// ── Connection ────────────────────────────────────────────────────────────────

Result<Connection> Connection::open(const std::filesystem::path& path) {
    sqlite3* raw_db = nullptr;
    const int rc = sqlite3_open_v2(path.string().c_str(), &raw_db,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    // SQLite hands back a handle even on most failures; it must still be closed.
    Connection conn{raw_db};
    if (rc != SQLITE_OK) {
        return make_error(raw_db, rc);
    }
    sqlite3_extended_result_codes(raw_db, 1);
    return conn;
}

Status Connection::exec(const std::string& sql) {
    char* err = nullptr;
    const int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err != nullptr ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        return make_internal_error("sqlite", sqlite3_extended_errcode(db_.get()), std::move(msg));
    }
    return std::nullopt;
}

Result<Statement> Connection::prepare(std::string_view sql) {
    if (sql.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return make_general_error("SQL text too long");
    }
    sqlite3_stmt* raw_stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_.get(), sql.data(), static_cast<int>(sql.size()),
                                      &raw_stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(raw_stmt);
        return make_error(db_.get(), rc);
    }
    return Statement{db_.get(), raw_stmt};
}

std::int64_t Connection::changes() const {
    return sqlite3_changes64(db_.get());
}

} // namespace tsblob::sqlite

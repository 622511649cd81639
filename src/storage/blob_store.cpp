#include "storage/blob_store.hpp"

#include "codec/zlib_codec.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <string>
#include <utility>

namespace tsblob {

namespace {

// ── SQL ───────────────────────────────────────────────────────────────────────

constexpr const char* kInitQuery = R"SQL(
    CREATE TABLE IF NOT EXISTS files (
        key        TEXT    NOT NULL,
        time_stamp INTEGER NOT NULL,
        data       BLOB,
        PRIMARY KEY (key, time_stamp)
    )
)SQL";

constexpr std::string_view kInsertQuery =
    "INSERT INTO files (key, time_stamp, data) VALUES (?1, ?2, ?3)";

constexpr std::string_view kRetrieveQuery =
    "SELECT data FROM files WHERE key = ?1 AND time_stamp = ?2";

constexpr std::string_view kLatestQuery =
    "SELECT time_stamp, data FROM files WHERE key = ?1 "
    "ORDER BY time_stamp DESC LIMIT 1";

constexpr std::string_view kListQuery = "SELECT key, time_stamp FROM files";

constexpr std::string_view kRemoveQuery =
    "DELETE FROM files WHERE key = ?1 AND time_stamp = ?2";

constexpr std::string_view kPurgeQuery = "DELETE FROM files WHERE time_stamp < ?1";

// Decodes the data column of the current row: NULL stays NULL, anything else
// is treated as a zlib stream.
[[nodiscard]] Result<std::optional<Bytes>> read_data(const sqlite::Statement& stmt, int column) {
    if (stmt.column_type(column) == sqlite::ColumnType::Null) {
        return std::optional<Bytes>{};
    }
    auto inflated = codec::inflate(stmt.column_blob(column));
    if (auto* err = std::get_if<Error>(&inflated)) {
        return std::move(*err);
    }
    return std::optional<Bytes>{std::move(std::get<Bytes>(inflated))};
}

// Reads an INTEGER time stamp column; std::nullopt if the stored value has
// another storage class or does not fit a TimeStamp.
[[nodiscard]] std::optional<TimeStamp> read_time_stamp(const sqlite::Statement& stmt, int column) {
    if (stmt.column_type(column) != sqlite::ColumnType::Integer) {
        return std::nullopt;
    }
    const auto seconds = stmt.column_int64(column);
    if (!is_representable(seconds)) {
        return std::nullopt;
    }
    return from_unix_seconds(seconds);
}

// Prepares `sql` and binds (key, seconds) to parameters 1 and 2.
[[nodiscard]] Result<sqlite::Statement> prepare_pair(sqlite::Connection& conn, std::string_view sql,
                                                     std::string_view key, std::int64_t seconds) {
    auto prepared = conn.prepare(sql);
    if (auto* err = std::get_if<Error>(&prepared)) {
        return std::move(*err);
    }
    auto& stmt = std::get<sqlite::Statement>(prepared);
    if (auto err = stmt.bind_text(1, key)) {
        return std::move(*err);
    }
    if (auto err = stmt.bind_int64(2, seconds)) {
        return std::move(*err);
    }
    return prepared;
}

} // anonymous namespace

// ── Lifetime ──────────────────────────────────────────────────────────────────

Result<BlobStore> BlobStore::connect(const std::filesystem::path& path) {
    auto opened = sqlite::Connection::open(path);
    if (auto* err = std::get_if<Error>(&opened)) {
        spdlog::error("Failed to open blob store at {}: {}", path.string(), to_string(*err));
        return std::move(*err);
    }

    auto& conn = std::get<sqlite::Connection>(opened);
    if (auto err = conn.exec(kInitQuery)) {
        spdlog::error("Failed to initialise schema in {}: {}", path.string(), to_string(*err));
        return std::move(*err);
    }

    spdlog::info("Blob store opened at {}", path.string());
    return BlobStore{std::move(conn), path};
}

BlobStore::BlobStore(sqlite::Connection conn, std::filesystem::path path)
    : conn_(std::move(conn)), path_(std::move(path)) {}

BlobStore::~BlobStore() {
    release();
}

BlobStore& BlobStore::operator=(BlobStore&& other) noexcept {
    if (this != &other) {
        release();
        conn_ = std::move(other.conn_);
        path_ = std::move(other.path_);
    }
    return *this;
}

void BlobStore::release() noexcept {
    if (!conn_.is_open()) {
        return;
    }

    try {
        const TimeStamp cutoff{std::chrono::system_clock::now() - kRetentionHorizon};
        auto purged = purge_older_than(cutoff);
        if (auto* err = std::get_if<Error>(&purged)) {
            spdlog::debug("Retention sweep on {} failed: {}", path_.string(), to_string(*err));
        } else if (const auto count = std::get<std::size_t>(purged); count > 0) {
            spdlog::info("Retention sweep removed {} expired blob(s) from {}", count, path_.string());
        }
        spdlog::info("Closing blob store at {}", path_.string());
    } catch (const std::exception& e) {
        // The connection is still closed below; nothing can be reported from here.
        spdlog::debug("Retention sweep on {} aborted: {}", path_.string(), e.what());
    }

    conn_.close();
}

Status BlobStore::ensure_open() const {
    if (!conn_.is_open()) {
        return make_general_error("blob store is not open");
    }
    return std::nullopt;
}

// ── add_file ──────────────────────────────────────────────────────────────────

Status BlobStore::add_file(std::string_view key, TimeStamp time_stamp,
                           std::span<const std::uint8_t> data) {
    if (auto err = ensure_open()) {
        return err;
    }

    const auto seconds = to_unix_seconds(time_stamp);
    if (!is_representable(seconds)) {
        return make_general_error("time stamp " + std::to_string(seconds) +
                                  " is outside the storable range");
    }

    auto compressed = codec::deflate(data);
    if (auto* err = std::get_if<Error>(&compressed)) {
        return std::move(*err);
    }
    const auto& payload = std::get<Bytes>(compressed);

    auto prepared = prepare_pair(conn_, kInsertQuery, key, seconds);
    if (auto* err = std::get_if<Error>(&prepared)) {
        return std::move(*err);
    }
    auto& stmt = std::get<sqlite::Statement>(prepared);
    if (auto err = stmt.bind_blob(3, payload)) {
        return err;
    }

    auto stepped = stmt.step();
    if (auto* err = std::get_if<Error>(&stepped)) {
        spdlog::debug("add_file key={} time_stamp={} failed: {}", key, seconds, to_string(*err));
        return std::move(*err);
    }

    spdlog::debug("add_file key={} time_stamp={} bytes={} stored={}",
                  key, seconds, data.size(), payload.size());
    return std::nullopt;
}

// ── retrieve_file ─────────────────────────────────────────────────────────────

Result<std::optional<Bytes>> BlobStore::retrieve_file(std::string_view key, TimeStamp time_stamp) {
    if (auto err = ensure_open()) {
        return std::move(*err);
    }

    const auto seconds = to_unix_seconds(time_stamp);
    auto prepared = prepare_pair(conn_, kRetrieveQuery, key, seconds);
    if (auto* err = std::get_if<Error>(&prepared)) {
        return std::move(*err);
    }
    auto& stmt = std::get<sqlite::Statement>(prepared);

    auto stepped = stmt.step();
    if (auto* err = std::get_if<Error>(&stepped)) {
        return std::move(*err);
    }
    if (std::get<sqlite::StepResult>(stepped) == sqlite::StepResult::Done) {
        spdlog::debug("retrieve_file key={} time_stamp={}: no row", key, seconds);
        return TimeStampNotAvailable{std::string(key), time_stamp};
    }

    spdlog::debug("retrieve_file key={} time_stamp={}", key, seconds);
    return read_data(stmt, 0);
}

// ── retrieve_latest ───────────────────────────────────────────────────────────

Result<LatestBlob> BlobStore::retrieve_latest(std::string_view key) {
    if (auto err = ensure_open()) {
        return std::move(*err);
    }

    auto prepared = conn_.prepare(kLatestQuery);
    if (auto* err = std::get_if<Error>(&prepared)) {
        return std::move(*err);
    }
    auto& stmt = std::get<sqlite::Statement>(prepared);
    if (auto err = stmt.bind_text(1, key)) {
        return std::move(*err);
    }

    auto stepped = stmt.step();
    if (auto* err = std::get_if<Error>(&stepped)) {
        return std::move(*err);
    }
    if (std::get<sqlite::StepResult>(stepped) == sqlite::StepResult::Done) {
        return NoMatch{std::string(key)};
    }

    auto time_stamp = read_time_stamp(stmt, 0);
    if (!time_stamp) {
        return sqlite::make_mismatch_error("undecodable time stamp in newest row for key " +
                                           std::string(key));
    }

    auto data = read_data(stmt, 1);
    if (auto* err = std::get_if<Error>(&data)) {
        return std::move(*err);
    }
    return LatestBlob{*time_stamp, std::move(std::get<std::optional<Bytes>>(data))};
}

// ── list_all ──────────────────────────────────────────────────────────────────

Result<Listing> BlobStore::list_all(ListMode mode) {
    if (auto err = ensure_open()) {
        return std::move(*err);
    }

    auto prepared = conn_.prepare(kListQuery);
    if (auto* err = std::get_if<Error>(&prepared)) {
        return std::move(*err);
    }
    auto& stmt = std::get<sqlite::Statement>(prepared);

    Listing listing;
    std::size_t row = 0;
    while (true) {
        auto stepped = stmt.step();
        if (auto* err = std::get_if<Error>(&stepped)) {
            return std::move(*err);
        }
        if (std::get<sqlite::StepResult>(stepped) == sqlite::StepResult::Done) {
            break;
        }
        ++row;

        auto time_stamp = read_time_stamp(stmt, 1);
        if (stmt.column_type(0) != sqlite::ColumnType::Text || !time_stamp) {
            if (mode == ListMode::Strict) {
                return sqlite::make_mismatch_error("undecodable key or time stamp in row " +
                                                   std::to_string(row));
            }
            ++listing.skipped;
            continue;
        }
        listing.entries.push_back(BlobId{stmt.column_text(0), *time_stamp});
    }

    if (listing.skipped > 0) {
        spdlog::warn("list_all skipped {} undecodable row(s) in {}", listing.skipped, path_.string());
    }
    return listing;
}

// ── remove_file ───────────────────────────────────────────────────────────────

Status BlobStore::remove_file(std::string_view key, TimeStamp time_stamp) {
    if (auto err = ensure_open()) {
        return err;
    }

    const auto seconds = to_unix_seconds(time_stamp);
    auto prepared = prepare_pair(conn_, kRemoveQuery, key, seconds);
    if (auto* err = std::get_if<Error>(&prepared)) {
        return std::move(*err);
    }

    auto stepped = std::get<sqlite::Statement>(prepared).step();
    if (auto* err = std::get_if<Error>(&stepped)) {
        return std::move(*err);
    }
    if (conn_.changes() == 0) {
        return TimeStampNotAvailable{std::string(key), time_stamp};
    }

    spdlog::debug("remove_file key={} time_stamp={}", key, seconds);
    return std::nullopt;
}

// ── purge_older_than ──────────────────────────────────────────────────────────

Result<std::size_t> BlobStore::purge_older_than(TimeStamp cutoff) {
    if (auto err = ensure_open()) {
        return std::move(*err);
    }

    auto prepared = conn_.prepare(kPurgeQuery);
    if (auto* err = std::get_if<Error>(&prepared)) {
        return std::move(*err);
    }
    auto& stmt = std::get<sqlite::Statement>(prepared);
    if (auto err = stmt.bind_int64(1, to_unix_seconds(cutoff))) {
        return std::move(*err);
    }

    auto stepped = stmt.step();
    if (auto* err = std::get_if<Error>(&stepped)) {
        return std::move(*err);
    }

    const auto removed = static_cast<std::size_t>(conn_.changes());
    spdlog::debug("purge_older_than {} removed {} row(s)", format_time_stamp(cutoff), removed);
    return removed;
}

} // namespace tsblob

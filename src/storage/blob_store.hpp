#pragma once

#include "common/bytes.hpp"
#include "common/error.hpp"
#include "common/time_stamp.hpp"
#include "storage/sqlite.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tsblob {

// Rows older than this, measured from the moment a store is released, are
// purged by the release-time sweep.  Not configurable.
inline constexpr std::chrono::days kRetentionHorizon{365};

// ── Value types ───────────────────────────────────────────────────────────────

// Address of one stored blob.  The time stamp is always whole seconds.
struct BlobId {
    std::string key;
    TimeStamp   time_stamp;

    bool operator==(const BlobId&) const = default;
};

// How list_all() treats rows whose key or time stamp cannot be decoded.
enum class ListMode : std::uint8_t {
    BestEffort, // skip them and count them in Listing::skipped
    Strict,     // fail the listing on the first one
};

struct Listing {
    std::vector<BlobId> entries;
    std::size_t         skipped = 0;
};

struct LatestBlob {
    TimeStamp            time_stamp;
    std::optional<Bytes> data; // std::nullopt for a row stored with NULL data
};

// ── BlobStore ─────────────────────────────────────────────────────────────────
//
// Key/time-stamp addressed blob store on top of a single SQLite file.
//
// Schema: files(key TEXT, time_stamp INTEGER, data BLOB) with the primary key
// (key, time_stamp).  Payloads are stored zlib-compressed; time stamps are
// stored as unix seconds, so sub-second precision never reaches the database.
//
// Rows are never updated in place.  add_file() rejects an existing
// (key, time_stamp) pair with the engine's constraint error and leaves the
// stored blob untouched.
//
// Lifetime: the store exclusively owns its connection.  Destroying (or
// move-assigning over) an open store runs the retention sweep exactly once,
// deleting rows older than kRetentionHorizon; sweep failures are logged and
// dropped.  A moved-from store is closed and every operation on it fails
// with a GeneralError.
//
// Thread safety: none.  One thread at a time.

class BlobStore {
public:
    // Opens (or creates) the database at `path` and ensures the schema exists.
    [[nodiscard]] static Result<BlobStore> connect(const std::filesystem::path& path);

    ~BlobStore();

    BlobStore(const BlobStore&)            = delete;
    BlobStore& operator=(const BlobStore&) = delete;

    BlobStore(BlobStore&&) noexcept = default;
    BlobStore& operator=(BlobStore&& other) noexcept;

    // Compresses `data` and stores it under (key, whole seconds of time_stamp).
    // Time stamps whose whole seconds fall outside TimeStamp's range (roughly
    // 1677-2262) are rejected with a GeneralError.
    [[nodiscard]] Status add_file(std::string_view key, TimeStamp time_stamp,
                                  std::span<const std::uint8_t> data);

    // The blob stored under the exact pair.  Returns std::nullopt for a row
    // whose data is NULL and TimeStampNotAvailable when there is no row.
    [[nodiscard]] Result<std::optional<Bytes>> retrieve_file(std::string_view key,
                                                             TimeStamp time_stamp);

    // The newest blob stored under `key`, or NoMatch if the key is unknown.
    [[nodiscard]] Result<LatestBlob> retrieve_latest(std::string_view key);

    // Every stored (key, time_stamp), in no particular order.
    [[nodiscard]] Result<Listing> list_all(ListMode mode = ListMode::BestEffort);

    // Deletes the exact pair; TimeStampNotAvailable if it was not stored.
    [[nodiscard]] Status remove_file(std::string_view key, TimeStamp time_stamp);

    // Deletes every row strictly older than `cutoff` (whole seconds) and
    // returns how many were removed.
    [[nodiscard]] Result<std::size_t> purge_older_than(TimeStamp cutoff);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    [[nodiscard]] bool is_open() const noexcept { return conn_.is_open(); }

private:
    BlobStore(sqlite::Connection conn, std::filesystem::path path);

    [[nodiscard]] Status ensure_open() const;

    // Retention sweep followed by closing the connection.  No-op when closed.
    void release() noexcept;

    sqlite::Connection    conn_;
    std::filesystem::path path_;
};

} // namespace tsblob

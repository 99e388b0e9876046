#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace rlevel {

// ── OpenOptions ───────────────────────────────────────────────────────────────

struct OpenOptions {
    bool create_if_missing = true;   // create the directory and database
    bool error_if_exists   = false;  // fail if a database already exists
    bool read_only         = false;  // open without write access

    int      max_open_files    = -1;               // -1 = engine default (unbounded)
    uint64_t write_buffer_size = 4 * 1024 * 1024;  // memtable size in bytes

    // WAL retention; a live update feed can only replay what is retained.
    uint64_t wal_ttl_seconds   = 0;
    uint64_t wal_size_limit_mb = 0;

    std::string info_log_level = "warn";  // engine's own LOG file verbosity
};

// ── ReadOptions / WriteOptions ────────────────────────────────────────────────

struct ReadOptions {
    bool fill_cache = true;
};

struct WriteOptions {
    bool sync = false;  // fsync the WAL before reporting success
};

struct FlushWalOptions {
    bool sync = false;
};

// ── RangeOptions ──────────────────────────────────────────────────────────────
//
// Key bounds of a scan.  `gte` takes precedence over `gt` and `lte` over `lt`
// when both are given.  Keys compare bytewise.

struct RangeOptions {
    std::optional<std::string> gt;
    std::optional<std::string> gte;
    std::optional<std::string> lt;
    std::optional<std::string> lte;

    bool    reverse = false;
    int64_t limit   = -1;  // -1 = unlimited
};

struct IteratorOptions : RangeOptions {
    bool keys       = true;  // entries carry keys
    bool values     = true;  // entries carry values
    bool fill_cache = true;

    // Sequence the scan must read at.  Engines only read at the current
    // sequence, so a pin that no longer matches it is rejected.
    std::optional<uint64_t> sequence;
};

inline constexpr int64_t kDefaultQueryLimit = 1000;

// `limit` is the page size of one query() call.
struct QueryOptions : IteratorOptions {
    QueryOptions() { limit = kDefaultQueryLimit; }
};

// ── UpdatesOptions ────────────────────────────────────────────────────────────

struct UpdatesOptions {
    // First sequence to deliver.  Unset = latest sequence + 1 (future writes only).
    std::optional<uint64_t> since;

    bool keys   = true;   // rows carry keys
    bool values = true;   // rows carry values
    bool data   = false;  // batches carry the raw engine write-batch bytes

    // Upper bound on how long next() sleeps before re-polling the engine when
    // no write through this database has been observed.
    std::chrono::milliseconds poll_interval{100};
};

} // namespace rlevel

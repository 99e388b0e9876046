#pragma once

#include "engine/options.hpp"
#include "engine/types.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rlevel {

// ── EngineCursor ──────────────────────────────────────────────────────────────
//
// Engine-side half of a range scan.  Reads from an implicit snapshot taken at
// creation time; the snapshot is released when the cursor is destroyed.
//
// NOT thread-safe.  The owning façade object serialises calls.

class EngineCursor {
public:
    virtual ~EngineCursor() = default;

    // Appends up to `max` entries to `out`.
    // Returns true once no further entry remains in range (or the limit is hit).
    virtual bool nextv(std::size_t max, std::vector<Entry>& out) = 0;

    // Repositions to the first entry at or after `target` in scan direction.
    // A target outside the range leaves the cursor exhausted.
    virtual void seek(std::string_view target) = 0;

    // Sequence number of the snapshot this cursor reads.
    [[nodiscard]] virtual Sequence sequence() const noexcept = 0;
};

// ── EngineUpdates ─────────────────────────────────────────────────────────────
//
// Engine-side subscription to the write stream.  Each poll returns the write
// batches committed since the previous poll, oldest first, and never blocks
// waiting for new writes.

class EngineUpdates {
public:
    virtual ~EngineUpdates() = default;

    // Returns at most `max_batches` batches; empty when nothing new was written.
    virtual std::vector<UpdateBatch> poll(std::size_t max_batches) = 0;
};

struct UpdatesSpec {
    Sequence since  = 0;
    bool     keys   = true;
    bool     values = true;
    bool     data   = false;
};

// ── Engine ────────────────────────────────────────────────────────────────────
//
// Abstract interface of the wrapped storage engine.
//
// Implementations must be safe for concurrent reads and writes from multiple
// threads once open (the façade runs blocking reads on a worker pool).
// open() and close() are never called concurrently with anything else.
//
// All failures are reported by throwing rlevel::Error with
// Errc::engine_failure and the engine's own message.

class Engine {
public:
    virtual ~Engine() = default;

    // Opens the database at `location`.  Returns the column family names.
    virtual std::vector<std::string> open(const std::filesystem::path& location,
                                          const OpenOptions& options) = 0;

    // Releases the engine context.  All cursors and subscriptions must have
    // been destroyed first.
    virtual void close() = 0;

    [[nodiscard]] virtual std::optional<std::string>
    get(std::string_view key, const ReadOptions& options) = 0;

    // Results are in input order, std::nullopt for missing keys.
    [[nodiscard]] virtual std::vector<std::optional<std::string>>
    get_many(const std::vector<std::string>& keys, const ReadOptions& options) = 0;

    virtual void put(std::string_view key, std::string_view value,
                     const WriteOptions& options) = 0;

    virtual void del(std::string_view key, const WriteOptions& options) = 0;

    // Applies all operations atomically, in order.
    virtual void apply(const std::vector<Operation>& ops,
                       const WriteOptions& options) = 0;

    // Deletes every key in the range atomically.
    virtual void clear(const RangeOptions& range, const WriteOptions& options) = 0;

    [[nodiscard]] virtual std::unique_ptr<EngineCursor>
    new_cursor(const IteratorOptions& options) = 0;

    [[nodiscard]] virtual std::unique_ptr<EngineUpdates>
    subscribe(const UpdatesSpec& spec) = 0;

    // Sequence of the most recent write (0 for an empty database).
    [[nodiscard]] virtual Sequence latest_sequence() const = 0;

    // std::nullopt for properties the engine does not know.
    [[nodiscard]] virtual std::optional<std::string>
    get_property(std::string_view name) const = 0;

    [[nodiscard]] virtual WalFile current_wal_file() = 0;
    [[nodiscard]] virtual std::vector<WalFile> sorted_wal_files() = 0;
    virtual void flush_wal(bool sync) = 0;
};

// Creates an engine by name: "rocksdb" or "memory".
// Throws rlevel::Error(invalid_argument) for any other name.
[[nodiscard]] std::unique_ptr<Engine> make_engine(std::string_view name);

} // namespace rlevel

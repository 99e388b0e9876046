#pragma once

#include "engine/engine.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace rlevel {

// ── MemoryEngine ──────────────────────────────────────────────────────────────
//
// In-process engine backed by an ordered std::map.
//
// Databases live in a process-wide registry keyed by location, so a database
// survives close/re-open within one process and only one engine may hold a
// location at a time (the equivalent of RocksDB's LOCK file).
//
// Concurrency model (per database):
//   - get() / get_many() / new_cursor() / poll() acquire a shared lock.
//   - Writes acquire an exclusive lock and append to an in-memory write log,
//     which backs the change feed.
// Cursors copy the map on creation; that copy is their snapshot.
//
// There is no WAL: current_wal_file() / sorted_wal_files() fail with
// engine_failure, flush_wal() is a no-op, and update batches never carry raw
// write-batch bytes.

class MemoryEngine final : public Engine {
public:
    using Map = std::map<std::string, std::string, std::less<>>;

    MemoryEngine() = default;
    ~MemoryEngine() override;

    MemoryEngine(const MemoryEngine&)            = delete;
    MemoryEngine& operator=(const MemoryEngine&) = delete;

    std::vector<std::string> open(const std::filesystem::path& location,
                                  const OpenOptions& options) override;
    void close() override;

    [[nodiscard]] std::optional<std::string>
    get(std::string_view key, const ReadOptions& options) override;
    [[nodiscard]] std::vector<std::optional<std::string>>
    get_many(const std::vector<std::string>& keys, const ReadOptions& options) override;

    void put(std::string_view key, std::string_view value,
             const WriteOptions& options) override;
    void del(std::string_view key, const WriteOptions& options) override;
    void apply(const std::vector<Operation>& ops, const WriteOptions& options) override;
    void clear(const RangeOptions& range, const WriteOptions& options) override;

    [[nodiscard]] std::unique_ptr<EngineCursor>
    new_cursor(const IteratorOptions& options) override;
    [[nodiscard]] std::unique_ptr<EngineUpdates>
    subscribe(const UpdatesSpec& spec) override;

    [[nodiscard]] Sequence latest_sequence() const override;
    [[nodiscard]] std::optional<std::string>
    get_property(std::string_view name) const override;

    [[nodiscard]] WalFile current_wal_file() override;
    [[nodiscard]] std::vector<WalFile> sorted_wal_files() override;
    void flush_wal(bool sync) override;

    // Drops the database registered at `location`.  Fails if it is open.
    static void destroy(const std::filesystem::path& location);

    struct Store;

private:
    // Throws engine_failure unless open.
    Store& store() const;

    // Applies `ops` as one logged batch.  Caller holds the exclusive lock.
    void write_locked(Store& s, const std::vector<Operation>& ops);

    std::shared_ptr<Store> store_;
    std::string location_;
    bool read_only_ = false;
};

} // namespace rlevel

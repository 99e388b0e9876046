#pragma once

#include "engine/engine.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace rocksdb {
class ColumnFamilyHandle;
class DB;
} // namespace rocksdb

namespace rlevel {

// ── RocksDBEngine ─────────────────────────────────────────────────────────────
//
// Engine backed by RocksDB.
//
// Thread safety is delegated to RocksDB itself: reads, writes, iterator
// creation and WAL introspection are safe for concurrent use.  Every column
// family present on disk is opened; reads and writes go to the default one.
//
// The change feed reads the WAL through DB::GetUpdatesSince(), so it can only
// replay what the WAL still retains (see OpenOptions::wal_ttl_seconds).

class RocksDBEngine final : public Engine {
public:
    RocksDBEngine();
    ~RocksDBEngine() override;

    // Not copyable or movable – RocksDB owns internal state.
    RocksDBEngine(const RocksDBEngine&)            = delete;
    RocksDBEngine& operator=(const RocksDBEngine&) = delete;
    RocksDBEngine(RocksDBEngine&&)                 = delete;
    RocksDBEngine& operator=(RocksDBEngine&&)      = delete;

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

private:
    // Throws engine_failure unless open.
    rocksdb::DB& db() const;

    std::unique_ptr<rocksdb::DB> db_;
    std::vector<rocksdb::ColumnFamilyHandle*> handles_;
};

} // namespace rlevel

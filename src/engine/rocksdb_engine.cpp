#include "engine/rocksdb_engine.hpp"

#include "common/errors.hpp"
#include "engine/range_scanner.hpp"

#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/snapshot.h>
#include <rocksdb/transaction_log.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>

namespace rlevel {

namespace {

void check(const rocksdb::Status& status) {
    if (!status.ok()) {
        throw engine_error(status.ToString());
    }
}

rocksdb::Slice to_slice(std::string_view sv) {
    return rocksdb::Slice{sv.data(), sv.size()};
}

std::string_view to_view(const rocksdb::Slice& s) {
    return std::string_view{s.data(), s.size()};
}

rocksdb::InfoLogLevel to_info_log_level(const std::string& s) {
    if (s == "debug") return rocksdb::InfoLogLevel::DEBUG_LEVEL;
    if (s == "info")  return rocksdb::InfoLogLevel::INFO_LEVEL;
    if (s == "error") return rocksdb::InfoLogLevel::ERROR_LEVEL;
    if (s == "fatal") return rocksdb::InfoLogLevel::FATAL_LEVEL;
    return rocksdb::InfoLogLevel::WARN_LEVEL;
}

rocksdb::WriteOptions to_write_options(const WriteOptions& options) {
    rocksdb::WriteOptions wo;
    wo.sync = options.sync;
    return wo;
}

WalFile to_wal_file(const rocksdb::LogFile& log) {
    WalFile file;
    file.path           = log.PathName();
    file.log_number     = log.LogNumber();
    file.type           = log.Type() == rocksdb::kAliveLogFile
                              ? WalFileType::Alive : WalFileType::Archived;
    file.start_sequence = log.StartSequence();
    file.size_bytes     = log.SizeFileBytes();
    return file;
}

// ── RocksIterator ─────────────────────────────────────────────────────────────
// RangeScanner-compatible adapter over rocksdb::Iterator.

class RocksIterator {
public:
    explicit RocksIterator(rocksdb::Iterator* it) : it_(it) {}

    bool valid() const { return it_->Valid(); }
    void seek_to_first() { it_->SeekToFirst(); }
    void seek_to_last() { it_->SeekToLast(); }
    void seek(std::string_view target) { it_->Seek(to_slice(target)); }
    void next() { it_->Next(); }
    void prev() { it_->Prev(); }
    std::string_view key() const { return to_view(it_->key()); }
    std::string_view value() const { return to_view(it_->value()); }
    void check() const { rlevel::check(it_->status()); }

private:
    std::unique_ptr<rocksdb::Iterator> it_;
};

// ── RocksCursor ───────────────────────────────────────────────────────────────
// Owns an implicit snapshot for the lifetime of the scan.

class RocksCursor final : public EngineCursor {
public:
    RocksCursor(rocksdb::DB& db, const IteratorOptions& options)
        : snapshot_(&db)
        , keys_(options.keys)
        , values_(options.values)
    {
        rocksdb::ReadOptions ro;
        ro.fill_cache = options.fill_cache;
        ro.snapshot   = snapshot_.snapshot();
        scanner_ = std::make_unique<RangeScanner<RocksIterator>>(
            RocksIterator{db.NewIterator(ro)}, options);
    }

    // The iterator must go before the snapshot it reads from.
    ~RocksCursor() override { scanner_.reset(); }

    bool nextv(std::size_t max, std::vector<Entry>& out) override {
        return scanner_->read(max, out, keys_, values_);
    }

    void seek(std::string_view target) override { scanner_->seek(target); }

    Sequence sequence() const noexcept override {
        return snapshot_.snapshot()->GetSequenceNumber();
    }

private:
    rocksdb::ManagedSnapshot snapshot_;
    std::unique_ptr<RangeScanner<RocksIterator>> scanner_;
    bool keys_;
    bool values_;
};

// ── RowCollector ──────────────────────────────────────────────────────────────
// Decodes one WAL write batch into update rows.

class RowCollector final : public rocksdb::WriteBatch::Handler {
public:
    RowCollector(const UpdatesSpec& spec, std::vector<UpdateRow>& rows)
        : spec_(spec), rows_(rows) {}

    rocksdb::Status PutCF(uint32_t, const rocksdb::Slice& key,
                          const rocksdb::Slice& value) override {
        add(OpType::Put, key, value);
        return rocksdb::Status::OK();
    }

    rocksdb::Status DeleteCF(uint32_t, const rocksdb::Slice& key) override {
        add(OpType::Del, key, {});
        return rocksdb::Status::OK();
    }

    rocksdb::Status SingleDeleteCF(uint32_t, const rocksdb::Slice& key) override {
        add(OpType::Del, key, {});
        return rocksdb::Status::OK();
    }

    void LogData(const rocksdb::Slice&) override {}

private:
    void add(OpType type, const rocksdb::Slice& key, const rocksdb::Slice& value) {
        UpdateRow row;
        row.type = type;
        if (spec_.keys)   row.key   = key.ToString();
        if (spec_.values) row.value = value.ToString();
        rows_.push_back(std::move(row));
    }

    const UpdatesSpec& spec_;
    std::vector<UpdateRow>& rows_;
};

// ── RocksUpdates ──────────────────────────────────────────────────────────────

class RocksUpdates final : public EngineUpdates {
public:
    RocksUpdates(rocksdb::DB& db, const UpdatesSpec& spec)
        : db_(db), spec_(spec), next_(spec.since) {}

    std::vector<UpdateBatch> poll(std::size_t max_batches) override {
        std::vector<UpdateBatch> result;

        // GetUpdatesSince() refuses sequences that have not been written yet.
        if (next_ > db_.GetLatestSequenceNumber()) {
            return result;
        }

        if (!iter_ || !iter_->Valid()) {
            iter_.reset();
            check(db_.GetUpdatesSince(next_, &iter_));
        }

        while (iter_->Valid() && result.size() < max_batches) {
            rocksdb::BatchResult br = iter_->GetBatch();
            const Sequence seq   = br.sequence;
            const uint64_t count = br.writeBatchPtr->Count();

            // The iterator starts at the batch containing next_; anything
            // wholly before it was delivered by an earlier poll.
            if (seq + count > next_) {
                UpdateBatch batch;
                batch.sequence = seq;
                batch.count    = count;
                RowCollector collector(spec_, batch.rows);
                check(br.writeBatchPtr->Iterate(&collector));
                if (spec_.data) {
                    batch.data = br.writeBatchPtr->Data();
                }
                next_ = seq + count;
                result.push_back(std::move(batch));
            }
            iter_->Next();
        }

        if (!iter_->Valid()) {
            // TryAgain only means the tail moved on; re-create next time.
            auto status = iter_->status();
            if (!status.ok() && !status.IsTryAgain()) {
                throw engine_error(status.ToString());
            }
            iter_.reset();
        }
        return result;
    }

private:
    rocksdb::DB& db_;
    UpdatesSpec spec_;
    Sequence next_;
    std::unique_ptr<rocksdb::TransactionLogIterator> iter_;
};

} // anonymous namespace

// ── Lifecycle ─────────────────────────────────────────────────────────────────

RocksDBEngine::RocksDBEngine() = default;

RocksDBEngine::~RocksDBEngine() {
    if (db_) {
        spdlog::warn("RocksDB destroyed while open, closing");
        try {
            close();
        } catch (const Error& e) {
            spdlog::error("RocksDB close failed: {}", e.what());
        }
    }
}

std::vector<std::string> RocksDBEngine::open(const std::filesystem::path& location,
                                             const OpenOptions& options) {
    rocksdb::Options opts;
    opts.create_if_missing = options.create_if_missing;
    opts.error_if_exists   = options.error_if_exists;
    opts.max_open_files    = options.max_open_files;
    opts.write_buffer_size = options.write_buffer_size;
    opts.WAL_ttl_seconds   = options.wal_ttl_seconds;
    opts.WAL_size_limit_MB = options.wal_size_limit_mb;
    opts.info_log_level    = to_info_log_level(options.info_log_level);

    opts.IncreaseParallelism();
    opts.OptimizeLevelStyleCompaction();

    // A fresh database has no column family list yet; open just the default.
    std::vector<std::string> names;
    if (!rocksdb::DB::ListColumnFamilies(opts, location.string(), &names).ok()) {
        names = {rocksdb::kDefaultColumnFamilyName};
    }

    std::vector<rocksdb::ColumnFamilyDescriptor> descriptors;
    descriptors.reserve(names.size());
    for (const auto& name : names) {
        descriptors.emplace_back(name, rocksdb::ColumnFamilyOptions(opts));
    }

    rocksdb::DB* raw_db = nullptr;
    std::vector<rocksdb::ColumnFamilyHandle*> handles;
    auto status = options.read_only
        ? rocksdb::DB::OpenForReadOnly(opts, location.string(), descriptors, &handles, &raw_db)
        : rocksdb::DB::Open(opts, location.string(), descriptors, &handles, &raw_db);
    check(status);

    db_.reset(raw_db);
    handles_ = std::move(handles);
    spdlog::debug("RocksDB opened at {} with {} column families",
                  location.string(), names.size());
    return names;
}

void RocksDBEngine::close() {
    if (!db_) {
        return;
    }

    for (auto* handle : handles_) {
        auto status = db_->DestroyColumnFamilyHandle(handle);
        if (!status.ok()) {
            spdlog::warn("RocksDB DestroyColumnFamilyHandle failed: {}", status.ToString());
        }
    }
    handles_.clear();

    auto status = db_->Close();
    db_.reset();
    check(status);
}

rocksdb::DB& RocksDBEngine::db() const {
    if (!db_) {
        throw engine_error("Not open");
    }
    return *db_;
}

// ── Reads ─────────────────────────────────────────────────────────────────────

std::optional<std::string> RocksDBEngine::get(std::string_view key, const ReadOptions& options) {
    rocksdb::ReadOptions ro;
    ro.fill_cache = options.fill_cache;

    std::string value;
    auto status = db().Get(ro, to_slice(key), &value);
    if (status.IsNotFound()) {
        return std::nullopt;
    }
    check(status);
    return value;
}

std::vector<std::optional<std::string>>
RocksDBEngine::get_many(const std::vector<std::string>& keys, const ReadOptions& options) {
    rocksdb::ReadOptions ro;
    ro.fill_cache = options.fill_cache;

    std::vector<rocksdb::Slice> slices;
    slices.reserve(keys.size());
    for (const auto& key : keys) {
        slices.emplace_back(key);
    }

    std::vector<std::string> values;
    auto statuses = db().MultiGet(ro, slices, &values);

    std::vector<std::optional<std::string>> result;
    result.reserve(keys.size());
    for (std::size_t i = 0; i < keys.size(); ++i) {
        if (statuses[i].IsNotFound()) {
            result.emplace_back(std::nullopt);
        } else {
            check(statuses[i]);
            result.emplace_back(std::move(values[i]));
        }
    }
    return result;
}

// ── Writes ────────────────────────────────────────────────────────────────────

void RocksDBEngine::put(std::string_view key, std::string_view value, const WriteOptions& options) {
    check(db().Put(to_write_options(options), to_slice(key), to_slice(value)));
}

void RocksDBEngine::del(std::string_view key, const WriteOptions& options) {
    check(db().Delete(to_write_options(options), to_slice(key)));
}

void RocksDBEngine::apply(const std::vector<Operation>& ops, const WriteOptions& options) {
    rocksdb::WriteBatch batch;
    for (const auto& op : ops) {
        if (op.type == OpType::Put) {
            check(batch.Put(op.key, op.value));
        } else {
            check(batch.Delete(op.key));
        }
    }
    check(db().Write(to_write_options(options), &batch));
}

void RocksDBEngine::clear(const RangeOptions& range, const WriteOptions& options) {
    auto& d = db();
    rocksdb::WriteBatch batch;
    {
        rocksdb::ManagedSnapshot snapshot(&d);
        rocksdb::ReadOptions ro;
        ro.fill_cache = false;
        ro.snapshot   = snapshot.snapshot();
        RangeScanner<RocksIterator> scanner(RocksIterator{d.NewIterator(ro)}, range);

        // Collect in chunks to bound the memory held in `keys`.
        std::vector<Entry> keys;
        bool done = false;
        while (!done) {
            keys.clear();
            done = scanner.read(1024, keys, /*keys=*/true, /*values=*/false);
            for (const auto& entry : keys) {
                check(batch.Delete(entry.key));
            }
        }
    }

    if (batch.Count() > 0) {
        check(d.Write(to_write_options(options), &batch));
    }
}

// ── Cursors / subscriptions ───────────────────────────────────────────────────

std::unique_ptr<EngineCursor> RocksDBEngine::new_cursor(const IteratorOptions& options) {
    return std::make_unique<RocksCursor>(db(), options);
}

std::unique_ptr<EngineUpdates> RocksDBEngine::subscribe(const UpdatesSpec& spec) {
    return std::make_unique<RocksUpdates>(db(), spec);
}

// ── Introspection ─────────────────────────────────────────────────────────────

Sequence RocksDBEngine::latest_sequence() const {
    return db().GetLatestSequenceNumber();
}

std::optional<std::string> RocksDBEngine::get_property(std::string_view name) const {
    std::string value;
    if (!db().GetProperty(to_slice(name), &value)) {
        return std::nullopt;
    }
    return value;
}

WalFile RocksDBEngine::current_wal_file() {
    std::unique_ptr<rocksdb::LogFile> log;
    check(db().GetCurrentWalFile(&log));
    return to_wal_file(*log);
}

std::vector<WalFile> RocksDBEngine::sorted_wal_files() {
    rocksdb::VectorLogPtr logs;
    check(db().GetSortedWalFiles(logs));

    std::vector<WalFile> result;
    result.reserve(logs.size());
    for (const auto& log : logs) {
        result.push_back(to_wal_file(*log));
    }
    return result;
}

void RocksDBEngine::flush_wal(bool sync) {
    check(db().FlushWAL(sync));
}

} // namespace rlevel

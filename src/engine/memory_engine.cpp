#include "engine/memory_engine.hpp"

#include "common/errors.hpp"
#include "engine/range_scanner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>
#include <iterator>
#include <mutex>
#include <shared_mutex>

namespace rlevel {

struct MemoryEngine::Store {
    mutable std::shared_mutex mutex;
    Map                       map;
    Sequence                  sequence = 0;
    std::vector<UpdateBatch>  log;     // every write batch, oldest first
    bool                      locked = false;
};

namespace {

// ── Registry ──────────────────────────────────────────────────────────────────
// Only access `stores` while holding `registry_mutex`.

std::mutex registry_mutex;
std::map<std::string, std::shared_ptr<MemoryEngine::Store>> stores;

// ── MapIterator ───────────────────────────────────────────────────────────────
// RangeScanner-compatible iterator over a map the iterator keeps alive.

class MapIterator {
public:
    explicit MapIterator(std::shared_ptr<const MemoryEngine::Map> map)
        : map_(std::move(map))
        , it_(map_->end())
    {}

    bool valid() const { return it_ != map_->end(); }

    void seek_to_first() { it_ = map_->begin(); }

    void seek_to_last() {
        it_ = map_->empty() ? map_->end() : std::prev(map_->end());
    }

    void seek(std::string_view target) { it_ = map_->lower_bound(target); }

    void next() { ++it_; }

    void prev() {
        if (it_ == map_->begin()) {
            it_ = map_->end();
        } else {
            --it_;
        }
    }

    std::string_view key() const   { return it_->first; }
    std::string_view value() const { return it_->second; }

    void check() const {}

private:
    std::shared_ptr<const MemoryEngine::Map> map_;
    MemoryEngine::Map::const_iterator it_;
};

// ── MemoryCursor ──────────────────────────────────────────────────────────────

class MemoryCursor final : public EngineCursor {
public:
    MemoryCursor(std::shared_ptr<const MemoryEngine::Map> snapshot,
                 Sequence sequence,
                 const IteratorOptions& options)
        : scanner_(MapIterator{std::move(snapshot)}, options)
        , sequence_(sequence)
        , keys_(options.keys)
        , values_(options.values)
    {}

    bool nextv(std::size_t max, std::vector<Entry>& out) override {
        return scanner_.read(max, out, keys_, values_);
    }

    void seek(std::string_view target) override { scanner_.seek(target); }

    Sequence sequence() const noexcept override { return sequence_; }

private:
    RangeScanner<MapIterator> scanner_;
    Sequence sequence_;
    bool keys_;
    bool values_;
};

// ── MemoryUpdates ─────────────────────────────────────────────────────────────

class MemoryUpdates final : public EngineUpdates {
public:
    MemoryUpdates(std::shared_ptr<MemoryEngine::Store> store, const UpdatesSpec& spec)
        : store_(std::move(store))
        , spec_(spec)
        , next_(spec.since)
    {}

    std::vector<UpdateBatch> poll(std::size_t max_batches) override {
        std::shared_lock lock(store_->mutex);
        const auto& log = store_->log;

        // First batch that still has sequences at or beyond next_.
        auto it = std::partition_point(log.begin(), log.end(),
            [this](const UpdateBatch& b) { return *b.sequence + b.count <= next_; });

        std::vector<UpdateBatch> result;
        for (; it != log.end() && result.size() < max_batches; ++it) {
            UpdateBatch batch;
            batch.sequence = it->sequence;
            batch.count    = it->count;
            batch.rows.reserve(it->rows.size());
            for (const auto& row : it->rows) {
                UpdateRow out;
                out.type = row.type;
                if (spec_.keys)   out.key   = row.key;
                if (spec_.values) out.value = row.value;
                batch.rows.push_back(std::move(out));
            }
            next_ = *it->sequence + it->count;
            result.push_back(std::move(batch));
        }
        return result;
    }

private:
    std::shared_ptr<MemoryEngine::Store> store_;
    UpdatesSpec spec_;
    Sequence next_;
};

} // anonymous namespace

// ── Lifecycle ─────────────────────────────────────────────────────────────────

MemoryEngine::~MemoryEngine() {
    if (store_) {
        spdlog::warn("MemoryEngine at {} destroyed while open", location_);
        close();
    }
}

std::vector<std::string> MemoryEngine::open(const std::filesystem::path& location,
                                            const OpenOptions& options) {
    const std::string key = location.lexically_normal().string();

    std::lock_guard lock(registry_mutex);
    auto it = stores.find(key);
    if (it != stores.end()) {
        if (options.error_if_exists) {
            throw engine_error(std::format(
                "Invalid argument: {}: exists (error_if_exists is true)", key));
        }
        if (it->second->locked) {
            throw engine_error(std::format(
                "IO error: lock {}/LOCK: already held by process", key));
        }
    } else {
        if (!options.create_if_missing) {
            throw engine_error(std::format(
                "Invalid argument: {}: does not exist (create_if_missing is false)", key));
        }
        if (options.read_only) {
            throw engine_error(std::format(
                "IO error: {}: No such database (read only)", key));
        }
        it = stores.emplace(key, std::make_shared<Store>()).first;
    }

    it->second->locked = true;
    store_     = it->second;
    location_  = key;
    read_only_ = options.read_only;
    return {"default"};
}

void MemoryEngine::close() {
    if (!store_) {
        return;
    }
    std::lock_guard lock(registry_mutex);
    store_->locked = false;
    store_.reset();
}

void MemoryEngine::destroy(const std::filesystem::path& location) {
    const std::string key = location.lexically_normal().string();

    std::lock_guard lock(registry_mutex);
    auto it = stores.find(key);
    if (it == stores.end()) {
        return;
    }
    if (it->second->locked) {
        throw engine_error(std::format(
            "IO error: lock {}/LOCK: already held by process", key));
    }
    stores.erase(it);
}

MemoryEngine::Store& MemoryEngine::store() const {
    if (!store_) {
        throw engine_error("Not open");
    }
    return *store_;
}

// ── Reads ─────────────────────────────────────────────────────────────────────

std::optional<std::string> MemoryEngine::get(std::string_view key, const ReadOptions&) {
    auto& s = store();
    std::shared_lock lock(s.mutex);
    auto it = s.map.find(key);
    if (it == s.map.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::optional<std::string>>
MemoryEngine::get_many(const std::vector<std::string>& keys, const ReadOptions&) {
    auto& s = store();
    std::shared_lock lock(s.mutex);
    std::vector<std::optional<std::string>> result;
    result.reserve(keys.size());
    for (const auto& key : keys) {
        auto it = s.map.find(key);
        if (it == s.map.end()) {
            result.emplace_back(std::nullopt);
        } else {
            result.emplace_back(it->second);
        }
    }
    return result;
}

// ── Writes ────────────────────────────────────────────────────────────────────

void MemoryEngine::write_locked(Store& s, const std::vector<Operation>& ops) {
    if (ops.empty()) {
        return;
    }

    UpdateBatch batch;
    batch.sequence = s.sequence + 1;
    batch.count    = ops.size();
    batch.rows.reserve(ops.size());

    for (const auto& op : ops) {
        if (op.type == OpType::Put) {
            s.map.insert_or_assign(op.key, op.value);
        } else {
            if (auto it = s.map.find(op.key); it != s.map.end()) {
                s.map.erase(it);
            }
        }
        batch.rows.push_back(UpdateRow{op.type, op.key, op.value});
    }

    s.sequence += ops.size();
    s.log.push_back(std::move(batch));
}

void MemoryEngine::put(std::string_view key, std::string_view value, const WriteOptions& options) {
    apply({Operation::put(std::string(key), std::string(value))}, options);
}

void MemoryEngine::del(std::string_view key, const WriteOptions& options) {
    apply({Operation::del(std::string(key))}, options);
}

void MemoryEngine::apply(const std::vector<Operation>& ops, const WriteOptions&) {
    auto& s = store();
    if (read_only_) {
        throw engine_error("Not implemented: Not supported operation in read only mode.");
    }
    std::unique_lock lock(s.mutex);
    write_locked(s, ops);
}

void MemoryEngine::clear(const RangeOptions& range, const WriteOptions&) {
    auto& s = store();
    if (read_only_) {
        throw engine_error("Not implemented: Not supported operation in read only mode.");
    }
    std::unique_lock lock(s.mutex);

    // Non-owning view of the live map; only used while the lock is held.
    std::shared_ptr<const Map> view(std::shared_ptr<void>{}, &s.map);
    RangeScanner<MapIterator> scanner(MapIterator{view}, range);

    std::vector<Entry> doomed;
    scanner.read(s.map.size(), doomed, /*keys=*/true, /*values=*/false);

    std::vector<Operation> ops;
    ops.reserve(doomed.size());
    for (auto& entry : doomed) {
        ops.push_back(Operation::del(std::move(entry.key)));
    }
    write_locked(s, ops);
}

// ── Cursors / subscriptions ───────────────────────────────────────────────────

std::unique_ptr<EngineCursor> MemoryEngine::new_cursor(const IteratorOptions& options) {
    auto& s = store();
    std::shared_lock lock(s.mutex);
    auto snapshot = std::make_shared<const Map>(s.map);
    return std::make_unique<MemoryCursor>(std::move(snapshot), s.sequence, options);
}

std::unique_ptr<EngineUpdates> MemoryEngine::subscribe(const UpdatesSpec& spec) {
    store();
    return std::make_unique<MemoryUpdates>(store_, spec);
}

// ── Introspection ─────────────────────────────────────────────────────────────

Sequence MemoryEngine::latest_sequence() const {
    auto& s = store();
    std::shared_lock lock(s.mutex);
    return s.sequence;
}

std::optional<std::string> MemoryEngine::get_property(std::string_view name) const {
    auto& s = store();
    std::shared_lock lock(s.mutex);
    if (name == "memory.num-entries") {
        return std::to_string(s.map.size());
    }
    if (name == "memory.sequence") {
        return std::to_string(s.sequence);
    }
    if (name == "memory.num-batches") {
        return std::to_string(s.log.size());
    }
    return std::nullopt;
}

WalFile MemoryEngine::current_wal_file() {
    store();
    throw engine_error("Not implemented: memory engine has no WAL");
}

std::vector<WalFile> MemoryEngine::sorted_wal_files() {
    store();
    throw engine_error("Not implemented: memory engine has no WAL");
}

void MemoryEngine::flush_wal(bool) {
    store();
}

} // namespace rlevel

#include "engine/rocksdb_engine.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "test_support.hpp"

namespace rlevel {

namespace fs = std::filesystem;

// ── Fixture ─────────────────────────────────────────────────────────────────
// Creates a temporary directory for each test, opens a RocksDBEngine in it,
// and cleans up afterwards.

class RocksDBEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        fs::create_directories(dir_.path());
        engine_ = std::make_unique<RocksDBEngine>();
        columns_ = engine_->open(dir_.path(), OpenOptions{});
    }

    void TearDown() override {
        engine_->close(); // close DB before removing files
        engine_.reset();
    }

    // Re-open the DB at the same path (for persistence tests).
    void reopen(const OpenOptions& options = {}) {
        engine_->close();
        columns_ = engine_->open(dir_.path(), options);
    }

    std::vector<Entry> scan(const IteratorOptions& options = {}) {
        auto cursor = engine_->new_cursor(options);
        std::vector<Entry> out;
        while (!cursor->nextv(2, out)) {}
        return out;
    }

    test::TempDir dir_{"rlevel_rocksdb_test"};
    std::unique_ptr<RocksDBEngine> engine_;
    std::vector<std::string> columns_;
};

// ── open() / close() ──────────────────────────────────────────────────────────

TEST_F(RocksDBEngineTest, OpenReportsDefaultColumnFamily) {
    ASSERT_FALSE(columns_.empty());
    EXPECT_EQ(columns_.front(), "default");
}

TEST_F(RocksDBEngineTest, SecondOpenFailsOnLock) {
    RocksDBEngine other;
    try {
        other.open(dir_.path(), OpenOptions{});
        FAIL() << "expected lock error";
    } catch (const Error& e) {
        EXPECT_TRUE(e.is(Errc::engine_failure));
        EXPECT_NE(std::string(e.what()).find("lock"), std::string::npos);
    }
}

TEST_F(RocksDBEngineTest, ErrorIfExists) {
    engine_->close();
    OpenOptions options;
    options.error_if_exists = true;
    EXPECT_THROW(engine_->open(dir_.path(), options), Error);
    engine_->open(dir_.path(), OpenOptions{});
}

TEST_F(RocksDBEngineTest, CloseIsIdempotent) {
    engine_->close();
    EXPECT_NO_THROW(engine_->close());
    engine_->open(dir_.path(), OpenOptions{});
}

TEST_F(RocksDBEngineTest, ReadOnlyRejectsWrites) {
    engine_->put("k", "v", {});
    OpenOptions options;
    options.read_only = true;
    reopen(options);
    EXPECT_EQ(engine_->get("k", {}), "v");
    EXPECT_THROW(engine_->put("k", "w", {}), Error);
}

// ── get() / put() / del() ─────────────────────────────────────────────────────

TEST_F(RocksDBEngineTest, GetReturnsNulloptForMissingKey) {
    EXPECT_FALSE(engine_->get("nonexistent", {}).has_value());
}

TEST_F(RocksDBEngineTest, PutOverwritesExistingKey) {
    engine_->put("key", "first", {});
    engine_->put("key", "second", {});
    EXPECT_EQ(engine_->get("key", {}), "second");
}

TEST_F(RocksDBEngineTest, KeysAndValuesAreBinarySafe) {
    const std::string key("k\0ey", 4);
    const std::string value("v\0a\xffl", 5);
    engine_->put(key, value, {});
    EXPECT_EQ(engine_->get(key, {}), value);
}

TEST_F(RocksDBEngineTest, PutHandlesLargeValues) {
    const std::string big(1 << 20, 'x');
    engine_->put("big", big, {});
    EXPECT_EQ(engine_->get("big", {}), big);
}

TEST_F(RocksDBEngineTest, DelMakesKeyUnavailable) {
    engine_->put("k", "v", {});
    engine_->del("k", {});
    EXPECT_FALSE(engine_->get("k", {}).has_value());
}

TEST_F(RocksDBEngineTest, GetManyKeepsInputOrder) {
    engine_->put("a", "1", {});
    engine_->put("c", "3", {});
    const auto values = engine_->get_many({"c", "b", "a"}, {});
    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(values[0], "3");
    EXPECT_FALSE(values[1].has_value());
    EXPECT_EQ(values[2], "1");
}

// ── apply() / clear() ─────────────────────────────────────────────────────────

TEST_F(RocksDBEngineTest, BatchIsAppliedInOrder) {
    const auto before = engine_->latest_sequence();
    engine_->apply({Operation::put("a", "1"), Operation::del("a"), Operation::put("a", "2")}, {});
    EXPECT_EQ(engine_->get("a", {}), "2");
    EXPECT_EQ(engine_->latest_sequence(), before + 3);
}

TEST_F(RocksDBEngineTest, ClearDeletesOnlyTheRange) {
    for (const auto* k : {"a", "b", "c", "d"}) engine_->put(k, "x", {});
    RangeOptions range;
    range.gt  = "a";
    range.lte = "c";
    engine_->clear(range, {});

    const auto rows = scan();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].key, "a");
    EXPECT_EQ(rows[1].key, "d");
}

TEST_F(RocksDBEngineTest, ClearWithoutRangeEmptiesTheDatabase) {
    for (int i = 0; i < 3000; ++i) {
        engine_->put("key" + std::to_string(i), "v", {});
    }
    engine_->clear({}, {});
    EXPECT_TRUE(scan().empty());
}

// ── Cursors ───────────────────────────────────────────────────────────────────

TEST_F(RocksDBEngineTest, CursorIsPinnedToItsSnapshot) {
    engine_->put("a", "1", {});
    auto cursor = engine_->new_cursor({});
    EXPECT_EQ(cursor->sequence(), engine_->latest_sequence());

    engine_->put("b", "2", {});
    engine_->del("a", {});

    std::vector<Entry> out;
    EXPECT_TRUE(cursor->nextv(10, out));
    EXPECT_EQ(out, (std::vector<Entry>{{"a", "1"}}));
}

TEST_F(RocksDBEngineTest, ReverseRangeScan) {
    for (const auto* k : {"a", "b", "c", "d"}) engine_->put(k, k, {});
    IteratorOptions options;
    options.reverse = true;
    options.lt      = "d";
    options.limit   = 2;

    const auto rows = scan(options);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].key, "c");
    EXPECT_EQ(rows[1].key, "b");
}

// ── Change feed ───────────────────────────────────────────────────────────────

TEST_F(RocksDBEngineTest, SubscribeDeliversContiguousBatches) {
    const auto start = engine_->latest_sequence() + 1;
    engine_->put("a", "1", {});
    engine_->apply({Operation::put("b", "2"), Operation::del("a")}, {});

    UpdatesSpec spec;
    spec.since = start;
    auto updates = engine_->subscribe(spec);
    auto batches = updates->poll(10);

    ASSERT_EQ(batches.size(), 2u);
    EXPECT_EQ(batches[0].sequence, start);
    EXPECT_EQ(batches[0].count, 1u);
    EXPECT_EQ(batches[1].sequence, start + 1);
    EXPECT_EQ(batches[1].count, 2u);
    ASSERT_EQ(batches[1].rows.size(), 2u);
    EXPECT_EQ(batches[1].rows[0], (UpdateRow{OpType::Put, "b", "2"}));
    EXPECT_EQ(batches[1].rows[1], (UpdateRow{OpType::Del, "a", ""}));

    EXPECT_TRUE(updates->poll(10).empty());

    engine_->put("c", "3", {});
    batches = updates->poll(10);
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0].sequence, start + 3);
}

TEST_F(RocksDBEngineTest, SubscribeCanCarryRawBatchData) {
    const auto start = engine_->latest_sequence() + 1;
    engine_->put("a", "1", {});

    UpdatesSpec spec;
    spec.since = start;
    spec.data  = true;
    auto batches = engine_->subscribe(spec)->poll(10);
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_FALSE(batches[0].data.empty());
}

// ── Introspection ─────────────────────────────────────────────────────────────

TEST_F(RocksDBEngineTest, KnownAndUnknownProperties) {
    engine_->put("a", "1", {});
    EXPECT_TRUE(engine_->get_property("rocksdb.estimate-num-keys").has_value());
    EXPECT_FALSE(engine_->get_property("rocksdb.no-such-property").has_value());
}

TEST_F(RocksDBEngineTest, WalIntrospection) {
    engine_->put("a", "1", {});
    engine_->flush_wal(true);

    const auto current = engine_->current_wal_file();
    EXPECT_FALSE(current.path.empty());
    EXPECT_EQ(current.type, WalFileType::Alive);

    const auto files = engine_->sorted_wal_files();
    ASSERT_FALSE(files.empty());
    EXPECT_TRUE(std::any_of(files.begin(), files.end(), [&](const WalFile& f) {
        return f.log_number == current.log_number;
    }));
}

// ── Persistence ───────────────────────────────────────────────────────────────

TEST_F(RocksDBEngineTest, DataSurvivesReopen) {
    engine_->put("persist", "yes", {});
    const auto seq = engine_->latest_sequence();
    reopen();
    EXPECT_EQ(engine_->get("persist", {}), "yes");
    EXPECT_GE(engine_->latest_sequence(), seq);
}

// ── Concurrent access ─────────────────────────────────────────────────────────

TEST_F(RocksDBEngineTest, ConcurrentWritersNoDataLoss) {
    constexpr int kThreads   = 4;
    constexpr int kPerThread = 250;

    std::vector<std::thread> writers;
    writers.reserve(kThreads);

    for (int t = 0; t < kThreads; ++t) {
        writers.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                const std::string key   = "t" + std::to_string(t) + "_k" + std::to_string(i);
                const std::string value = std::to_string(t * kPerThread + i);
                engine_->put(key, value, {});
            }
        });
    }
    for (auto& w : writers) w.join();

    EXPECT_EQ(scan().size(), static_cast<std::size_t>(kThreads * kPerThread));
}

} // namespace rlevel

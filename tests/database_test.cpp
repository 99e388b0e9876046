#include "db/database.hpp"
#include "db/chained_batch.hpp"
#include "common/errors.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "db_fixture.hpp"

namespace asio = boost::asio;

namespace rlevel {

using test::run_coro;
using test::yield;

class DatabaseTest : public test::DatabaseFixture {};

// ── Construction ──────────────────────────────────────────────────────────────

TEST(DatabaseConstructionTest, RejectsEmptyLocation) {
    test::IocFixture env;
    try {
        Database db{env.ioc, "", "memory"};
        FAIL() << "expected invalid_argument";
    } catch (const Error& e) {
        EXPECT_TRUE(e.is(Errc::invalid_argument));
    }
}

TEST(DatabaseConstructionTest, RejectsUnknownEngine) {
    test::IocFixture env;
    try {
        Database db{env.ioc, "/tmp/rlevel_unused", "leveldb"};
        FAIL() << "expected invalid_argument";
    } catch (const Error& e) {
        EXPECT_TRUE(e.is(Errc::invalid_argument));
    }
}

TEST(DatabaseConstructionTest, RejectsNullEngine) {
    test::IocFixture env;
    EXPECT_THROW((Database{env.ioc, "/tmp/rlevel_unused", std::unique_ptr<Engine>{}}), Error);
}

TEST(DatabaseConstructionTest, StartsNew) {
    test::IocFixture env;
    Database db{env.ioc, "/tmp/rlevel_unused", "memory"};
    EXPECT_EQ(db.status(), Database::Status::New);
    EXPECT_EQ(db.location(), "/tmp/rlevel_unused");
}

// ── Lifecycle ─────────────────────────────────────────────────────────────────

TEST_P(DatabaseTest, OpenReportsColumnsAndOptions) {
    EXPECT_EQ(db_->status(), Database::Status::Open);
    ASSERT_FALSE(db_->columns().empty());
    EXPECT_EQ(db_->columns().front(), "default");
    EXPECT_TRUE(db_->options().create_if_missing);
}

TEST_P(DatabaseTest, OpenTwiceIsNoOp) {
    open();
    EXPECT_EQ(db_->status(), Database::Status::Open);
}

TEST_P(DatabaseTest, CloseIsIdempotent) {
    close();
    EXPECT_EQ(db_->status(), Database::Status::Closed);
    close();
    EXPECT_EQ(db_->status(), Database::Status::Closed);
}

TEST_P(DatabaseTest, ConcurrentClosesAllComplete) {
    run_coro(ioc_, [&]() -> asio::awaitable<void> {
        int done = 0;
        for (int i = 0; i < 2; ++i) {
            asio::co_spawn(ioc_, [&]() -> asio::awaitable<void> {
                co_await db_->close();
                ++done;
            }, asio::detached);
        }
        co_await db_->close();
        EXPECT_EQ(db_->status(), Database::Status::Closed);
        co_await yield(5);
        EXPECT_EQ(done, 2);
    });
}

TEST_P(DatabaseTest, ConcurrentOpensShareOneAttempt) {
    close();
    run_coro(ioc_, [&]() -> asio::awaitable<void> {
        bool second_done = false;
        asio::co_spawn(ioc_, [&]() -> asio::awaitable<void> {
            co_await db_->open();
            second_done = true;
        }, asio::detached);
        co_await db_->open();
        co_await yield(5);
        EXPECT_TRUE(second_done);
        EXPECT_EQ(db_->status(), Database::Status::Open);
    });
}

TEST_P(DatabaseTest, DataSurvivesReopen) {
    put("k", "v");
    close();
    open();
    run_coro(ioc_, [&]() -> asio::awaitable<void> {
        EXPECT_EQ(co_await db_->get("k"), "v");
    });
}

TEST_P(DatabaseTest, SecondHandleOnSameLocationFailsToOpen) {
    Database other{ioc_, dir_.str(), GetParam()};
    run_coro(ioc_, [&]() -> asio::awaitable<void> {
        try {
            co_await other.open();
            ADD_FAILURE() << "expected engine_failure";
        } catch (const Error& e) {
            EXPECT_TRUE(e.is(Errc::engine_failure));
        }
        EXPECT_EQ(other.status(), Database::Status::Closed);
        co_await other.close();
    });
}

TEST_P(DatabaseTest, ErrorIfExistsFailsOnExistingDatabase) {
    close();
    OpenOptions options;
    options.error_if_exists = true;
    EXPECT_THROW(open(options), Error);
    EXPECT_EQ(db_->status(), Database::Status::Closed);
}

// ── State errors ──────────────────────────────────────────────────────────────

TEST_P(DatabaseTest, OperationsOnClosedDatabaseFail) {
    close();

    run_coro(ioc_, [&]() -> asio::awaitable<void> {
        // The calls themselves succeed; the failure arrives at co_await.
        auto pending_put = db_->put("k", "v");
        try {
            co_await std::move(pending_put);
            ADD_FAILURE() << "expected invalid_state";
        } catch (const Error& e) {
            EXPECT_TRUE(e.is(Errc::invalid_state));
            EXPECT_STREQ(e.what(), "Database is not open");
        }

        auto pending_get = db_->get("k");
        EXPECT_THROW(co_await std::move(pending_get), Error);
    });

    EXPECT_THROW((void)db_->get_property("rocksdb.stats"), Error);
    EXPECT_THROW((void)db_->iterator(), Error);
    EXPECT_THROW((void)db_->chained_batch(), Error);
    EXPECT_THROW((void)db_->updates(), Error);
    EXPECT_THROW((void)db_->sequence(), Error);
}

// ── Point operations ──────────────────────────────────────────────────────────

TEST_P(DatabaseTest, PutGetDel) {
    run_coro(ioc_, [&]() -> asio::awaitable<void> {
        EXPECT_FALSE((co_await db_->get("k")).has_value());
        co_await db_->put("k", "v");
        EXPECT_EQ(co_await db_->get("k"), "v");
        co_await db_->del("k");
        EXPECT_FALSE((co_await db_->get("k")).has_value());
    });
}

TEST_P(DatabaseTest, MutationHitsEngineBeforeAwait) {
    run_coro(ioc_, [&]() -> asio::awaitable<void> {
        auto pending = db_->put("k", "v");
        // Visible to a fresh read even though the put was not awaited yet.
        EXPECT_EQ(co_await db_->get("k"), "v");
        co_await std::move(pending);
    });
}

TEST_P(DatabaseTest, GetManyKeepsInputOrder) {
    put("a", "1");
    put("c", "3");
    run_coro(ioc_, [&]() -> asio::awaitable<void> {
        const auto values = co_await db_->get_many({"c", "b", "a"});
        EXPECT_EQ(values.size(), 3u);
        if (values.size() != 3) co_return;
        EXPECT_EQ(values[0], "3");
        EXPECT_FALSE(values[1].has_value());
        EXPECT_EQ(values[2], "1");

        EXPECT_TRUE((co_await db_->get_many({})).empty());
    });
}

TEST_P(DatabaseTest, BatchIsAppliedAtomicallyInOrder) {
    run_coro(ioc_, [&]() -> asio::awaitable<void> {
        const auto before = db_->sequence();
        co_await db_->batch({Operation::put("a", "1"), Operation::del("a"), Operation::put("a", "2")});
        EXPECT_EQ(co_await db_->get("a"), "2");
        EXPECT_EQ(db_->sequence(), before + 3);
    });
}

TEST_P(DatabaseTest, EmptyBatchSucceeds) {
    run_coro(ioc_, [&]() -> asio::awaitable<void> {
        const auto before = db_->sequence();
        co_await db_->batch({});
        EXPECT_EQ(db_->sequence(), before);
    });
}

TEST_P(DatabaseTest, ClearRange) {
    for (const auto* k : {"a", "b", "c", "d"}) put(k, "x");
    run_coro(ioc_, [&]() -> asio::awaitable<void> {
        RangeOptions range;
        range.gte = "b";
        range.lte = "c";
        co_await db_->clear(range);

        const auto values = co_await db_->get_many({"a", "b", "c", "d"});
        EXPECT_TRUE(values[0].has_value());
        EXPECT_FALSE(values[1].has_value());
        EXPECT_FALSE(values[2].has_value());
        EXPECT_TRUE(values[3].has_value());
    });
}

TEST_P(DatabaseTest, SequenceAdvancesWithWrites) {
    const auto before = db_->sequence();
    put("a", "1");
    put("b", "2");
    EXPECT_EQ(db_->sequence(), before + 2);
}

// ── Introspection ─────────────────────────────────────────────────────────────

TEST_P(DatabaseTest, GetProperty) {
    put("a", "1");
    const std::string known = is_memory() ? "memory.num-entries" : "rocksdb.estimate-num-keys";
    EXPECT_TRUE(db_->get_property(known).has_value());
    EXPECT_FALSE(db_->get_property("no.such.property").has_value());

    try {
        (void)db_->get_property("");
        FAIL() << "expected invalid_argument";
    } catch (const Error& e) {
        EXPECT_TRUE(e.is(Errc::invalid_argument));
    }
}

TEST_P(DatabaseTest, WalIntrospection) {
    put("a", "1");
    run_coro(ioc_, [&]() -> asio::awaitable<void> {
        FlushWalOptions flush;
        flush.sync = true;
        co_await db_->flush_wal(flush);

        if (is_memory()) {
            EXPECT_THROW(co_await db_->current_wal_file(), Error);
            co_return;
        }
        const auto current = co_await db_->current_wal_file();
        EXPECT_FALSE(current.path.empty());
        const auto files = co_await db_->sorted_wal_files();
        EXPECT_FALSE(files.empty());
    });
}

// ── Scenario ──────────────────────────────────────────────────────────────────

TEST_P(DatabaseTest, BatchThenQueryScenario) {
    run_coro(ioc_, [&]() -> asio::awaitable<void> {
        co_await db_->put("a", "1");
        co_await db_->put("b", "2");

        auto batch = db_->chained_batch();
        batch->del("a").put("c", "3");
        co_await batch->write();

        const auto result = co_await db_->query();
        EXPECT_EQ(result.rows, (std::vector<Entry>{{"b", "2"}, {"c", "3"}}));
        EXPECT_TRUE(result.finished);
        EXPECT_EQ(result.sequence, db_->sequence());
    });
}

// ── Teardown ──────────────────────────────────────────────────────────────────

TEST_P(DatabaseTest, CloseClosesEveryResource) {
    put("a", "1");
    auto cursor = db_->iterator();
    auto batch  = db_->chained_batch();
    auto feed   = db_->updates();
    EXPECT_EQ(db_->resource_count(), 3u);

    close();

    EXPECT_EQ(db_->resource_count(), 0u);
    EXPECT_TRUE(cursor->is_closed());
    EXPECT_TRUE(batch->is_closed());
    EXPECT_TRUE(feed->is_closed());
}

TEST_P(DatabaseTest, ResourcesCanBeCreatedAgainAfterReopen) {
    close();
    open();
    auto cursor = db_->iterator();
    EXPECT_EQ(db_->resource_count(), 1u);
}

TEST_P(DatabaseTest, DestroyingAnOpenDatabaseReleasesTheLocation) {
    put("k", "v");
    db_.reset();

    db_ = std::make_unique<Database>(ioc_, dir_.str(), GetParam());
    open();
    run_coro(ioc_, [&]() -> asio::awaitable<void> {
        EXPECT_EQ(co_await db_->get("k"), "v");
    });
}

TEST_P(DatabaseTest, DestroyingAnOpenDatabaseReleasesItsResources) {
    put("k", "v");
    auto cursor = db_->iterator();
    auto feed   = db_->updates();
    db_.reset();

    // Released synchronously by the destructor.
    EXPECT_TRUE(cursor->is_closed());
    EXPECT_TRUE(feed->is_closed());

    db_ = std::make_unique<Database>(ioc_, dir_.str(), GetParam());
    open();
}

INSTANTIATE_TEST_SUITE_P(Engines, DatabaseTest, test::kEngines);

} // namespace rlevel

#pragma once

#include "db/database.hpp"
#include "engine/memory_engine.hpp"

#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "test_support.hpp"

namespace rlevel::test {

// ── DatabaseFixture ───────────────────────────────────────────────────────────
// One Database per test on a fresh location, parameterised by engine name.
// The database is opened in SetUp() and closed in TearDown().

class DatabaseFixture : public ::testing::TestWithParam<std::string> {
protected:
    void SetUp() override {
        db_ = std::make_unique<Database>(ioc_, dir_.str(), GetParam());
        open();
    }

    void TearDown() override {
        if (db_) {
            run_coro(ioc_, [&]() -> asio::awaitable<void> { co_await db_->close(); });
            db_.reset();
        }
        if (GetParam() == "memory") {
            MemoryEngine::destroy(dir_.path());
        }
    }

    void open(OpenOptions options = {}) {
        run_coro(ioc_, [&]() -> asio::awaitable<void> { co_await db_->open(options); });
    }

    void close() {
        run_coro(ioc_, [&]() -> asio::awaitable<void> { co_await db_->close(); });
    }

    // Synchronous write helper for test setup.
    void put(const std::string& key, const std::string& value) {
        run_coro(ioc_, [&]() -> asio::awaitable<void> { co_await db_->put(key, value); });
    }

    [[nodiscard]] bool is_memory() const { return GetParam() == "memory"; }

    IocFixture env_;
    asio::io_context& ioc_{env_.ioc};
    TempDir dir_{"rlevel_db_test"};
    std::unique_ptr<Database> db_;
};

// Engine names for INSTANTIATE_TEST_SUITE_P.
inline const auto kEngines = ::testing::Values(std::string{"memory"}, std::string{"rocksdb"});

} // namespace rlevel::test

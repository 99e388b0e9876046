#include "db/resource.hpp"
#include "common/async_event.hpp"
#include "common/errors.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "test_support.hpp"

namespace asio = boost::asio;

namespace rlevel {

using test::run_coro;
using test::yield;

namespace {

std::shared_ptr<spdlog::logger> null_logger() {
    auto l = spdlog::get("null_tracker_test");
    if (!l) {
        l = std::make_shared<spdlog::logger>("null_tracker_test");
        l->set_level(spdlog::level::off);
    }
    return l;
}

// Resource whose close() waits until the test releases it.
class FakeResource final : public Resource {
public:
    FakeResource(asio::io_context& ioc, std::vector<std::string>& journal, std::string name)
        : gate_(ioc), journal_(journal), name_(std::move(name))
    {
        gate_.set();
    }

    asio::awaitable<void> close() override {
        journal_.push_back("closing " + name_);
        co_await gate_.wait();
        closed_ = true;
        detach();
        journal_.push_back("closed " + name_);
        if (fail_) {
            throw std::runtime_error("close failed");
        }
    }

    void release() noexcept override {
        closed_ = true;
        journal_.push_back("released " + name_);
    }

    bool is_closed() const noexcept override { return closed_; }
    std::string_view kind() const noexcept override { return "fake"; }

    void hold() { gate_.reset(); }
    void open_gate() { gate_.set(); }
    void fail_on_close() { fail_ = true; }

    void drop() { detach(); }

private:
    AsyncEvent gate_;
    std::vector<std::string>& journal_;
    std::string name_;
    bool closed_ = false;
    bool fail_ = false;
};

} // anonymous namespace

class ResourceTrackerTest : public ::testing::Test {
protected:
    test::IocFixture env_;
    asio::io_context& ioc_{env_.ioc};
    std::vector<std::string> journal_;
    ResourceTracker tracker_{null_logger()};

    std::shared_ptr<FakeResource> make(const std::string& name) {
        auto r = std::make_shared<FakeResource>(ioc_, journal_, name);
        tracker_.attach(r);
        return r;
    }
};

// ── attach() / detach() ───────────────────────────────────────────────────────

TEST_F(ResourceTrackerTest, AttachAndDetach) {
    auto a = make("a");
    auto b = make("b");
    EXPECT_EQ(tracker_.size(), 2u);
    EXPECT_TRUE(a->attached());

    a->drop();
    EXPECT_FALSE(a->attached());
    EXPECT_EQ(tracker_.size(), 1u);

    // Detaching twice is harmless.
    a->drop();
    EXPECT_EQ(tracker_.size(), 1u);
}

TEST_F(ResourceTrackerTest, DestroyedResourceDetachesItself) {
    {
        auto a = make("a");
        EXPECT_EQ(tracker_.size(), 1u);
    }
    EXPECT_EQ(tracker_.size(), 0u);
}

// ── close_all() ───────────────────────────────────────────────────────────────

TEST_F(ResourceTrackerTest, CloseAllClosesEveryResourceInCreationOrder) {
    auto a = make("a");
    auto b = make("b");

    run_coro(ioc_, [&]() -> asio::awaitable<void> {
        co_await tracker_.close_all();
    });

    EXPECT_TRUE(a->is_closed());
    EXPECT_TRUE(b->is_closed());
    EXPECT_EQ(tracker_.size(), 0u);
    EXPECT_EQ(journal_, (std::vector<std::string>{"closing a", "closed a", "closing b", "closed b"}));
}

TEST_F(ResourceTrackerTest, CloseAllWaitsForSlowClose) {
    auto a = make("a");
    a->hold();

    run_coro(ioc_, [&]() -> asio::awaitable<void> {
        bool done = false;
        asio::co_spawn(ioc_, [&]() -> asio::awaitable<void> {
            co_await tracker_.close_all();
            done = true;
        }, asio::detached);

        co_await yield(5);
        EXPECT_FALSE(done);
        EXPECT_TRUE(tracker_.closing());

        a->open_gate();
        co_await yield(5);
        EXPECT_TRUE(done);
    });
}

TEST_F(ResourceTrackerTest, FailingCloseDoesNotStopTheSweep) {
    auto a = make("a");
    auto b = make("b");
    a->fail_on_close();

    run_coro(ioc_, [&]() -> asio::awaitable<void> {
        co_await tracker_.close_all();
    });

    EXPECT_TRUE(b->is_closed());
    EXPECT_EQ(tracker_.size(), 0u);
}

TEST_F(ResourceTrackerTest, AttachRejectedDuringSweepUntilReset) {
    run_coro(ioc_, [&]() -> asio::awaitable<void> {
        co_await tracker_.close_all();
    });

    auto late = std::make_shared<FakeResource>(ioc_, journal_, "late");
    try {
        tracker_.attach(late);
        FAIL() << "expected invalid_state";
    } catch (const Error& e) {
        EXPECT_TRUE(e.is(Errc::invalid_state));
    }

    tracker_.reset();
    EXPECT_NO_THROW(tracker_.attach(late));
    EXPECT_EQ(tracker_.size(), 1u);
    late->drop();
}

TEST_F(ResourceTrackerTest, ExpiredEntriesAreSkipped) {
    auto a = make("a");
    {
        auto gone = make("gone");
    }

    run_coro(ioc_, [&]() -> asio::awaitable<void> {
        co_await tracker_.close_all();
    });

    EXPECT_EQ(journal_, (std::vector<std::string>{"closing a", "closed a"}));
}

// ── release_all() ─────────────────────────────────────────────────────────────

TEST_F(ResourceTrackerTest, ReleaseAllIsSynchronous) {
    auto a = make("a");
    auto b = make("b");
    tracker_.release_all();

    EXPECT_TRUE(a->is_closed());
    EXPECT_TRUE(b->is_closed());
    EXPECT_FALSE(a->attached());
    EXPECT_EQ(tracker_.size(), 0u);
    EXPECT_TRUE(tracker_.closing());
}

} // namespace rlevel

#pragma once

#include "common/async_event.hpp"
#include "db/resource.hpp"
#include "engine/engine.hpp"

#include <cstddef>
#include <deque>
#include <memory>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

namespace rlevel {

class Database;

// ── UpdateFeed ───────────────────────────────────────────────────────────────
//
// Live subscription to the engine's write stream, starting at `since`.
//
// next() suspends until at least one write batch at or past the feed position
// exists, then returns it.  Batches arrive in write order and must be
// contiguous: a batch starting past the expected sequence is a protocol
// violation that closes the feed and is thrown from next() as
// Error(protocol_violation).
//
// A closed feed returns an empty UpdateBatch.  close() first waits for an
// in-flight next() to settle (that next() reports its own outcome to its own
// caller), then releases the engine subscription.

class UpdateFeed final : public Resource {
public:
    // Write batches fetched per engine poll.
    static constexpr std::size_t kMaxBatchesPerPoll = 64;

    UpdateFeed(Database& db, std::unique_ptr<EngineUpdates> updates,
               UpdatesOptions options, Sequence since);

    [[nodiscard]] boost::asio::awaitable<UpdateBatch> next();

    [[nodiscard]] boost::asio::awaitable<void> close() override;
    void release() noexcept override;

    [[nodiscard]] bool is_closed() const noexcept override { return closed_; }
    [[nodiscard]] std::string_view kind() const noexcept override { return "updates"; }

    [[nodiscard]] Sequence since() const noexcept { return since_; }

    // Sequence the next delivered batch must start at.
    [[nodiscard]] Sequence position() const noexcept { return expected_; }

    [[nodiscard]] const UpdatesOptions& options() const noexcept { return options_; }

private:
    // Releases the engine subscription and detaches.  Feed must be idle.
    void teardown() noexcept;

    Database& db_;
    std::unique_ptr<EngineUpdates> updates_;
    UpdatesOptions options_;
    Sequence since_;
    Sequence expected_;

    std::deque<UpdateBatch> pending_;
    boost::asio::steady_timer timer_;

    bool closed_ = false;
    bool busy_ = false;
    AsyncEvent idle_;
};

} // namespace rlevel

#include "db/update_feed.hpp"

#include "common/errors.hpp"
#include "common/offload.hpp"
#include "db/database.hpp"

#include <algorithm>
#include <format>

namespace rlevel {

using boost::asio::awaitable;

UpdateFeed::UpdateFeed(Database& db, std::unique_ptr<EngineUpdates> updates,
                       UpdatesOptions options, Sequence since)
    : db_(db)
    , updates_(std::move(updates))
    , options_(std::move(options))
    , since_(since)
    , expected_(std::max<Sequence>(since, 1))
    , timer_(db.context())
    , idle_(db.context())
{
    idle_.set();
}

awaitable<UpdateBatch> UpdateFeed::next() {
    auto self = shared_from_this();

    if (closed_) {
        co_return UpdateBatch{};
    }
    if (busy_) {
        throw Error{Errc::invalid_state, "Updates feed is busy"};
    }

    busy_ = true;
    idle_.reset();
    struct Settle {
        UpdateFeed& feed;
        ~Settle() {
            feed.busy_ = false;
            feed.idle_.set();
        }
    } settle{*this};

    while (pending_.empty()) {
        const auto seen = db_.notifier().generation();

        auto& updates = *updates_;
        std::vector<UpdateBatch> batches;
        try {
            batches = co_await offload(db_.pool(), [&] {
                return updates.poll(kMaxBatchesPerPoll);
            });
        } catch (const std::exception& e) {
            if (closed_) {
                db_.logger().warn("Updates feed read failed while closing: {}", e.what());
            }
            throw;
        }
        if (closed_) {
            co_return UpdateBatch{};
        }

        for (auto& batch : batches) {
            pending_.push_back(std::move(batch));
        }
        if (pending_.empty()) {
            co_await db_.notifier().wait(timer_, seen, options_.poll_interval);
            if (closed_) {
                co_return UpdateBatch{};
            }
        }
    }

    auto batch = std::move(pending_.front());
    pending_.pop_front();

    const auto first = batch.sequence.value_or(expected_);
    if (first > expected_) {
        db_.logger().error("Updates feed gap: expected sequence {} but got {}", expected_, first);
        const auto expected = expected_;
        teardown();
        throw Error{Errc::protocol_violation,
                    std::format("Updates feed gap: expected sequence {} but got {}", expected, first)};
    }
    expected_ = std::max(expected_, first + batch.count);

    co_return batch;
}

awaitable<void> UpdateFeed::close() {
    auto self = shared_from_this();

    closed_ = true;
    timer_.cancel();
    if (busy_) {
        db_.logger().debug("Waiting for in-flight next() before closing updates feed");
        co_await idle_.wait();
    }
    teardown();
}

void UpdateFeed::release() noexcept {
    closed_ = true;
    boost::system::error_code ec;
    timer_.cancel(ec);
    teardown();
}

void UpdateFeed::teardown() noexcept {
    closed_ = true;
    updates_.reset();
    pending_.clear();
    detach();
}

} // namespace rlevel

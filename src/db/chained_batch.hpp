#pragma once

#include "db/resource.hpp"
#include "engine/options.hpp"
#include "engine/types.hpp"

#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>

namespace rlevel {

class Database;

// ── ChainedBatch ─────────────────────────────────────────────────────────────
//
// Builder for an atomic write.  Operations keep insertion order, so a later
// operation on a key overrides an earlier one.  write() or close() disposes
// the batch; any further use throws Error(invalid_state).
//
//   co_await db.chained_batch()->del("a").put("c", "3").write();

class ChainedBatch final : public Resource {
public:
    explicit ChainedBatch(Database& db);

    ChainedBatch& put(std::string key, std::string value);
    ChainedBatch& del(std::string key);

    // Drops the queued operations; the batch stays usable.
    ChainedBatch& clear();

    // Applies the queued operations atomically, then disposes the batch.
    // The engine write happens before this returns; the awaitable reports it.
    [[nodiscard]] boost::asio::awaitable<void> write(WriteOptions options = {});

    [[nodiscard]] boost::asio::awaitable<void> close() override;
    void release() noexcept override;

    [[nodiscard]] bool is_closed() const noexcept override { return closed_; }
    [[nodiscard]] std::string_view kind() const noexcept override { return "batch"; }

    [[nodiscard]] std::size_t length() const noexcept { return ops_.size(); }
    [[nodiscard]] const std::vector<Operation>& operations() const noexcept { return ops_; }

private:
    void require_open() const;
    void dispose() noexcept;

    Database& db_;
    std::vector<Operation> ops_;
    bool closed_ = false;
};

} // namespace rlevel

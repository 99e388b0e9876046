#pragma once

#include "common/async_event.hpp"
#include "db/resource.hpp"
#include "engine/engine.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>

namespace rlevel {

class Database;

// ── Cursor ───────────────────────────────────────────────────────────────────
//
// Lazy range scan over a snapshot taken when the cursor was created.
//
//   active ──(range drained)──▶ exhausted ──(end marker read)──▶ closed
//      └──────────────────────────close()──────────────────────────▶┘
//
// The read that hands out the end marker (std::nullopt / an empty vector)
// releases the engine cursor and closes the cursor.  After that, and after
// close(), every read or seek throws Error(invalid_state).  Only one read may
// be in flight at a time.

class Cursor final : public Resource {
public:
    // Entries fetched per engine round trip by next().
    static constexpr std::size_t kReadAhead = 64;

    Cursor(Database& db, std::unique_ptr<EngineCursor> cursor, IteratorOptions options);

    // Next entry, or std::nullopt once the range is exhausted (the cursor is
    // closed by then).
    [[nodiscard]] boost::asio::awaitable<std::optional<Entry>> next();

    // Up to `size` entries; empty once exhausted, which closes the cursor.  Throws
    // Error(invalid_argument) from the call for size == 0.
    [[nodiscard]] boost::asio::awaitable<std::vector<Entry>> nextv(std::size_t size);

    // Every remaining entry; the cursor is closed afterwards.
    [[nodiscard]] boost::asio::awaitable<std::vector<Entry>> all();

    // Repositions to `target` (first entry at or after it in scan direction)
    // and drops the read-ahead buffer.  Throws Error(invalid_state) when
    // closed, busy or exhausted.
    void seek(std::string_view target);

    [[nodiscard]] boost::asio::awaitable<void> close() override;
    void release() noexcept override;

    [[nodiscard]] bool is_closed() const noexcept override { return closed_; }
    [[nodiscard]] std::string_view kind() const noexcept override { return "iterator"; }

    // True once the engine reported the end and the read-ahead is drained.
    [[nodiscard]] bool exhausted() const noexcept { return exhausted_ && buffer_pos_ == buffer_.size(); }
    [[nodiscard]] Sequence sequence() const noexcept { return sequence_; }
    [[nodiscard]] const IteratorOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] boost::asio::awaitable<std::vector<Entry>> read(std::size_t size);

    // Pulls up to `size` entries from the engine into buffer_.
    [[nodiscard]] boost::asio::awaitable<void> fill(std::size_t size);

    void require_readable() const;

    Database& db_;
    std::unique_ptr<EngineCursor> cursor_;
    IteratorOptions options_;
    Sequence sequence_;

    std::vector<Entry> buffer_;
    std::size_t buffer_pos_ = 0;

    bool exhausted_ = false;
    bool closed_ = false;
    bool busy_ = false;
    AsyncEvent idle_;
};

} // namespace rlevel

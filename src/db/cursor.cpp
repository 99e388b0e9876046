#include "db/cursor.hpp"

#include "common/errors.hpp"
#include "common/offload.hpp"
#include "db/database.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <limits>

namespace rlevel {

using boost::asio::awaitable;

namespace {

// Upper bound on entries pulled from the engine in one round trip.
constexpr std::size_t kMaxFill = 1024;

} // anonymous namespace

Cursor::Cursor(Database& db, std::unique_ptr<EngineCursor> cursor, IteratorOptions options)
    : db_(db)
    , cursor_(std::move(cursor))
    , options_(std::move(options))
    , sequence_(cursor_->sequence())
    , idle_(db.context())
{
    idle_.set();
}

void Cursor::require_readable() const {
    if (closed_) {
        throw Error{Errc::invalid_state, "Iterator is not open"};
    }
    if (busy_) {
        throw Error{Errc::invalid_state, "Iterator is busy"};
    }
}

// ── Reads ────────────────────────────────────────────────────────────────────

awaitable<void> Cursor::fill(std::size_t size) {
    busy_ = true;
    idle_.reset();
    struct Settle {
        Cursor& cursor;
        ~Settle() {
            cursor.busy_ = false;
            cursor.idle_.set();
        }
    } settle{*this};

    auto& engine = *cursor_;
    std::vector<Entry> fetched;
    const bool done = co_await offload(db_.pool(), [&] {
        return engine.nextv(size, fetched);
    });

    if (buffer_pos_ == buffer_.size()) {
        buffer_ = std::move(fetched);
        buffer_pos_ = 0;
    } else {
        std::move(fetched.begin(), fetched.end(), std::back_inserter(buffer_));
    }

    exhausted_ = done;
}

awaitable<std::optional<Entry>> Cursor::next() {
    auto self = shared_from_this();
    require_readable();

    if (buffer_pos_ == buffer_.size() && !exhausted_) {
        co_await fill(kReadAhead);
    }
    if (buffer_pos_ < buffer_.size()) {
        co_return std::move(buffer_[buffer_pos_++]);
    }

    // Drained: the cursor closes itself on handing out the end marker.
    release();
    co_return std::nullopt;
}

awaitable<std::vector<Entry>> Cursor::nextv(std::size_t size) {
    if (size == 0) {
        throw Error{Errc::invalid_argument, "The first argument 'size' must be greater than 0"};
    }
    return read(size);
}

awaitable<std::vector<Entry>> Cursor::read(std::size_t size) {
    auto self = shared_from_this();
    require_readable();

    std::vector<Entry> out;
    while (out.size() < size) {
        if (buffer_pos_ < buffer_.size()) {
            const auto take = std::min(size - out.size(), buffer_.size() - buffer_pos_);
            const auto first = buffer_.begin() + static_cast<std::ptrdiff_t>(buffer_pos_);
            std::move(first, first + static_cast<std::ptrdiff_t>(take), std::back_inserter(out));
            buffer_pos_ += take;
            continue;
        }
        // A close() requested while the last fill was in flight ends the read.
        if (exhausted_ || closed_) {
            break;
        }
        co_await fill(std::min(size - out.size(), kMaxFill));
    }

    if (out.empty()) {
        release();
    } else if (buffer_pos_ == buffer_.size()) {
        buffer_.clear();
        buffer_pos_ = 0;
    }
    co_return out;
}

awaitable<std::vector<Entry>> Cursor::all() {
    auto self = shared_from_this();

    std::vector<Entry> rows;
    std::exception_ptr error;
    try {
        rows = co_await read(std::numeric_limits<std::size_t>::max());
    } catch (const std::exception&) {
        error = std::current_exception();
    }

    co_await close();
    if (error) {
        std::rethrow_exception(error);
    }
    co_return rows;
}

void Cursor::seek(std::string_view target) {
    require_readable();
    if (exhausted()) {
        throw Error{Errc::invalid_state, "Iterator is exhausted"};
    }
    buffer_.clear();
    buffer_pos_ = 0;
    cursor_->seek(target);
    exhausted_ = false;
}

// ── Teardown ─────────────────────────────────────────────────────────────────

awaitable<void> Cursor::close() {
    auto self = shared_from_this();
    closed_ = true;
    if (busy_) {
        co_await idle_.wait();
    }
    buffer_.clear();
    buffer_pos_ = 0;
    cursor_.reset();
    detach();
}

void Cursor::release() noexcept {
    closed_ = true;
    buffer_.clear();
    buffer_pos_ = 0;
    cursor_.reset();
    detach();
}

} // namespace rlevel

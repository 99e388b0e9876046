#include "db/database.hpp"

#include "common/logger.hpp"
#include "common/offload.hpp"
#include "db/chained_batch.hpp"
#include "db/cursor.hpp"
#include "db/update_feed.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <format>
#include <limits>
#include <system_error>

namespace rlevel {

using boost::asio::awaitable;
using boost::asio::use_awaitable;

namespace {

// Rows fetched per engine round trip by query(); a concurrent close() can
// abort the query between two chunks.
constexpr std::size_t kQueryChunk = 256;

std::string validate_location(std::string location) {
    if (location.empty()) {
        throw Error{Errc::invalid_argument,
                    "The first argument 'location' must be a non-empty string"};
    }
    return location;
}

std::unique_ptr<Engine> validate_engine(std::unique_ptr<Engine> engine) {
    if (!engine) {
        throw Error{Errc::invalid_argument, "An engine is required"};
    }
    return engine;
}

void check_pinned_sequence(const IteratorOptions& options, const EngineCursor& cursor) {
    if (options.sequence && *options.sequence != cursor.sequence()) {
        throw Error{Errc::invalid_argument, std::format(
            "Cannot read at sequence {}: the database is at sequence {}",
            *options.sequence, cursor.sequence())};
    }
}

} // anonymous namespace

// ── QueryScope ───────────────────────────────────────────────────────────────
//
// Transient resource covering one query() call, so that a database close
// arriving mid-query can abort it and wait for the engine cursor to go.

class QueryScope final : public Resource {
public:
    QueryScope(Database& db, std::unique_ptr<EngineCursor> cursor)
        : cursor_(std::move(cursor))
        , done_(db.context())
    {}

    EngineCursor& cursor() noexcept { return *cursor_; }

    [[nodiscard]] bool cancelled() const noexcept { return cancelled_; }

    awaitable<void> close() override {
        cancelled_ = true;
        co_await done_.wait();
    }

    void release() noexcept override {
        cancelled_ = true;
        finish();
    }

    bool is_closed() const noexcept override { return !cursor_; }
    std::string_view kind() const noexcept override { return "query"; }

    // Releases the engine cursor.  Runs on every exit path of query().
    void finish() noexcept {
        cursor_.reset();
        detach();
        done_.set();
    }

private:
    std::unique_ptr<EngineCursor> cursor_;
    AsyncEvent done_;
    bool cancelled_ = false;
};

// ── PendingRead ──────────────────────────────────────────────────────────────

Database::PendingRead::PendingRead(Database& db) : db_(db) {
    ++db_.pending_reads_;
    db_.idle_.reset();
}

Database::PendingRead::~PendingRead() {
    if (--db_.pending_reads_ == 0) {
        db_.idle_.set();
    }
}

// ── Construction ─────────────────────────────────────────────────────────────

Database::Database(boost::asio::io_context& ioc,
                   std::string location,
                   std::unique_ptr<Engine> engine,
                   std::size_t worker_threads)
    : ioc_(ioc)
    , location_(validate_location(std::move(location)))
    , engine_(validate_engine(std::move(engine)))
    , logger_(make_db_logger(location_))
    , pool_(std::max<std::size_t>(1, worker_threads))
    , tracker_(logger_)
    , opened_(ioc)
    , closed_(ioc)
    , idle_(ioc)
{
    idle_.set();
}

Database::Database(boost::asio::io_context& ioc,
                   std::string location,
                   std::string_view engine)
    : Database(ioc, std::move(location), make_engine(engine))
{}

Database::~Database() {
    if (status_ == Status::New || status_ == Status::Closed) {
        return;
    }

    logger_->warn("Database {} destroyed before close() completed", location_);

    // In-flight engine calls finish before anything is torn down.
    pool_.join();
    tracker_.release_all();
    try {
        engine_->close();
    } catch (const std::exception& e) {
        logger_->error("Engine close failed for {}: {}", location_, e.what());
    }
}

// ── Lifecycle ────────────────────────────────────────────────────────────────

awaitable<void> Database::open(OpenOptions options) {
    if (status_ == Status::Open) {
        co_return;
    }
    if (status_ == Status::Opening) {
        co_await opened_.wait();
        if (status_ != Status::Open) {
            throw Error{Errc::invalid_state, "Database failed to open"};
        }
        co_return;
    }
    if (status_ == Status::Closing) {
        throw Error{Errc::invalid_state, "Database is closing"};
    }

    status_ = Status::Opening;
    opened_.reset();
    logger_->debug("Opening {}", location_);

    try {
        columns_ = co_await offload(pool_, [&] {
            if (options.create_if_missing) {
                std::error_code ec;
                std::filesystem::create_directories(location_, ec);
                if (ec) {
                    throw engine_error(std::format("IO error: {}: {}", location_, ec.message()));
                }
            }
            return engine_->open(location_, options);
        });
    } catch (const std::exception& e) {
        logger_->error("Failed to open {}: {}", location_, e.what());
        status_ = Status::Closed;
        opened_.set();
        throw;
    }

    options_ = std::move(options);
    tracker_.reset();
    closed_.reset();
    status_ = Status::Open;
    opened_.set();
    logger_->info("Opened {} ({} column families)", location_, columns_.size());
}

awaitable<void> Database::close() {
    if (status_ == Status::Opening) {
        co_await opened_.wait();
    }
    if (status_ == Status::Closing) {
        co_await closed_.wait();
        co_return;
    }
    if (status_ != Status::Open) {
        co_return;
    }

    status_ = Status::Closing;
    closed_.reset();
    logger_->debug("Closing {} ({} tracked resources, {} pending reads)",
                   location_, tracker_.size(), pending_reads_);

    co_await tracker_.close_all();
    co_await idle_.wait();

    std::exception_ptr error;
    try {
        co_await offload(pool_, [this] { engine_->close(); });
    } catch (const std::exception& e) {
        logger_->error("Engine close failed for {}: {}", location_, e.what());
        error = std::current_exception();
    }

    status_ = Status::Closed;
    closed_.set();
    if (error) {
        std::rethrow_exception(error);
    }
    logger_->info("Closed {}", location_);
}

void Database::require_open() const {
    if (status_ != Status::Open) {
        throw not_open_error();
    }
}

awaitable<void> Database::settle(std::exception_ptr error) {
    co_await boost::asio::post(ioc_, use_awaitable);
    if (error) {
        std::rethrow_exception(error);
    }
}

// ── Point operations ─────────────────────────────────────────────────────────

awaitable<std::optional<std::string>> Database::get(std::string key, ReadOptions options) {
    require_open();
    PendingRead pending(*this);
    co_return co_await offload(pool_, [&] { return engine_->get(key, options); });
}

awaitable<std::vector<std::optional<std::string>>>
Database::get_many(std::vector<std::string> keys, ReadOptions options) {
    require_open();
    if (keys.empty()) {
        co_return std::vector<std::optional<std::string>>{};
    }
    PendingRead pending(*this);
    co_return co_await offload(pool_, [&] { return engine_->get_many(keys, options); });
}

awaitable<void> Database::put(std::string_view key, std::string_view value, WriteOptions options) {
    return settle(write([&] { engine_->put(key, value, options); }));
}

awaitable<void> Database::del(std::string_view key, WriteOptions options) {
    return settle(write([&] { engine_->del(key, options); }));
}

awaitable<void> Database::clear(RangeOptions range, WriteOptions options) {
    return settle(write([&] { engine_->clear(range, options); }));
}

awaitable<void> Database::batch(const std::vector<Operation>& operations, WriteOptions options) {
    return settle(write([&] {
        if (!operations.empty()) {
            engine_->apply(operations, options);
        }
    }));
}

// ── Resources ────────────────────────────────────────────────────────────────

std::shared_ptr<ChainedBatch> Database::chained_batch() {
    require_open();
    auto batch = std::make_shared<ChainedBatch>(*this);
    tracker_.attach(batch);
    return batch;
}

std::shared_ptr<Cursor> Database::iterator(IteratorOptions options) {
    require_open();
    auto engine_cursor = engine_->new_cursor(options);
    check_pinned_sequence(options, *engine_cursor);
    auto cursor = std::make_shared<Cursor>(*this, std::move(engine_cursor), options);
    tracker_.attach(cursor);
    return cursor;
}

awaitable<QueryResult> Database::query(QueryOptions options) {
    require_open();

    const std::size_t page = options.limit < 0
        ? std::numeric_limits<std::size_t>::max()
        : static_cast<std::size_t>(options.limit);

    // The page size is not a bound on the scan itself.
    IteratorOptions scan = options;
    scan.limit = -1;

    auto engine_cursor = engine_->new_cursor(scan);
    check_pinned_sequence(scan, *engine_cursor);
    auto scope = std::make_shared<QueryScope>(*this, std::move(engine_cursor));
    tracker_.attach(scope);

    struct Finish {
        QueryScope& scope;
        ~Finish() { scope.finish(); }
    } finish{*scope};

    QueryResult result;
    result.sequence = scope->cursor().sequence();

    bool exhausted = false;
    do {
        const auto chunk = std::min(page - result.rows.size(), kQueryChunk);
        exhausted = co_await offload(pool_, [&] {
            return scope->cursor().nextv(chunk, result.rows);
        });
        if (scope->cancelled()) {
            throw Error{Errc::invalid_state, "Query aborted: database is closing"};
        }
    } while (!exhausted && result.rows.size() < page);

    result.finished = exhausted;
    co_return result;
}

std::shared_ptr<UpdateFeed> Database::updates(UpdatesOptions options) {
    require_open();

    UpdatesSpec spec;
    spec.since  = options.since.value_or(engine_->latest_sequence() + 1);
    spec.keys   = options.keys;
    spec.values = options.values;
    spec.data   = options.data;

    auto feed = std::make_shared<UpdateFeed>(*this, engine_->subscribe(spec),
                                             std::move(options), spec.since);
    tracker_.attach(feed);
    return feed;
}

// ── Introspection ────────────────────────────────────────────────────────────

std::optional<std::string> Database::get_property(std::string_view name) const {
    if (name.empty()) {
        throw Error{Errc::invalid_argument, "The first argument 'property' must be a non-empty string"};
    }
    // Synchronous, so it is never deferred behind an open in progress.
    require_open();
    return engine_->get_property(name);
}

awaitable<WalFile> Database::current_wal_file() {
    require_open();
    PendingRead pending(*this);
    co_return co_await offload(pool_, [this] { return engine_->current_wal_file(); });
}

awaitable<std::vector<WalFile>> Database::sorted_wal_files() {
    require_open();
    PendingRead pending(*this);
    co_return co_await offload(pool_, [this] { return engine_->sorted_wal_files(); });
}

awaitable<void> Database::flush_wal(FlushWalOptions options) {
    require_open();
    PendingRead pending(*this);
    co_await offload(pool_, [&] { engine_->flush_wal(options.sync); });
}

Sequence Database::sequence() const {
    require_open();
    return engine_->latest_sequence();
}

} // namespace rlevel

#pragma once

#include "common/async_event.hpp"
#include "common/errors.hpp"
#include "db/resource.hpp"
#include "engine/engine.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <spdlog/spdlog.h>

namespace rlevel {

class ChainedBatch;
class Cursor;
class UpdateFeed;

// Result page of Database::query().
struct QueryResult {
    std::vector<Entry> rows;
    Sequence sequence = 0;   // snapshot the page was read from
    bool finished = false;   // false: more rows exist past the last one returned
};

// ── Database ─────────────────────────────────────────────────────────────────
//
// Asynchronous façade over one engine context.
//
// Threading: every member function must be called from, and every returned
// awaitable awaited on, the io_context passed to the constructor.  Blocking
// engine calls run on an internal thread pool and resume on that io_context,
// so façade state is only ever touched from there.
//
// Lifecycle:
//
//   new ──open()──▶ opening ──▶ open ──close()──▶ closing ──▶ closed
//                       │                                       │
//                       └──────────── (failure) ───────────────▶┘
//
// A closed database may be opened again.  Resources (cursors, chained batches,
// update feeds) must not outlive the Database object.
//
// Error reporting:
//   - argument errors throw from the call itself;
//   - everything else, including "not open", throws from co_await;
//   - factories (iterator(), chained_batch(), updates()) and get_property()
//     are synchronous and throw directly.

class Database {
public:
    enum class Status : uint8_t {
        New,
        Opening,
        Open,
        Closing,
        Closed,
    };

    static constexpr std::size_t kDefaultWorkerThreads = 2;

    // Throws Error(invalid_argument) for an empty location or null engine.
    Database(boost::asio::io_context& ioc,
             std::string location,
             std::unique_ptr<Engine> engine,
             std::size_t worker_threads = kDefaultWorkerThreads);

    // Same, with the engine picked by name ("rocksdb" or "memory").
    Database(boost::asio::io_context& ioc,
             std::string location,
             std::string_view engine = "rocksdb");

    // Closes synchronously if still open (logs a warning): waits for the
    // worker pool, releases every resource, then closes the engine.
    // Coroutines suspended on this database at that point are not resumed
    // safely: the io_context must not run their completions afterwards.
    ~Database();

    Database(const Database&)            = delete;
    Database& operator=(const Database&) = delete;

    // ── Lifecycle ────────────────────────────────────────────────────────────

    [[nodiscard]] boost::asio::awaitable<void> open(OpenOptions options = {});

    // Closes every tracked resource, waits for in-flight reads, then closes
    // the engine.  Idempotent; concurrent calls all wait for the same close.
    [[nodiscard]] boost::asio::awaitable<void> close();

    // ── Point operations ─────────────────────────────────────────────────────

    [[nodiscard]] boost::asio::awaitable<std::optional<std::string>>
    get(std::string key, ReadOptions options = {});

    [[nodiscard]] boost::asio::awaitable<std::vector<std::optional<std::string>>>
    get_many(std::vector<std::string> keys, ReadOptions options = {});

    // Mutations hit the engine before returning; the awaitable reports the
    // outcome on a later turn of the io_context.
    [[nodiscard]] boost::asio::awaitable<void>
    put(std::string_view key, std::string_view value, WriteOptions options = {});

    [[nodiscard]] boost::asio::awaitable<void>
    del(std::string_view key, WriteOptions options = {});

    [[nodiscard]] boost::asio::awaitable<void>
    clear(RangeOptions range = {}, WriteOptions options = {});

    [[nodiscard]] boost::asio::awaitable<void>
    batch(const std::vector<Operation>& operations, WriteOptions options = {});

    // ── Resources ────────────────────────────────────────────────────────────

    [[nodiscard]] std::shared_ptr<ChainedBatch> chained_batch();

    [[nodiscard]] std::shared_ptr<Cursor> iterator(IteratorOptions options = {});

    // One page of rows from a fresh snapshot.
    [[nodiscard]] boost::asio::awaitable<QueryResult> query(QueryOptions options = {});

    [[nodiscard]] std::shared_ptr<UpdateFeed> updates(UpdatesOptions options = {});

    // ── Introspection ────────────────────────────────────────────────────────

    // Synchronous; throws Error(invalid_state) unless open.
    [[nodiscard]] std::optional<std::string> get_property(std::string_view name) const;

    [[nodiscard]] boost::asio::awaitable<WalFile> current_wal_file();
    [[nodiscard]] boost::asio::awaitable<std::vector<WalFile>> sorted_wal_files();
    [[nodiscard]] boost::asio::awaitable<void> flush_wal(FlushWalOptions options = {});

    // Latest engine sequence.  Throws Error(invalid_state) unless open.
    [[nodiscard]] Sequence sequence() const;

    [[nodiscard]] const std::string& location() const noexcept { return location_; }
    [[nodiscard]] Status status() const noexcept { return status_; }
    [[nodiscard]] const std::vector<std::string>& columns() const noexcept { return columns_; }
    [[nodiscard]] const OpenOptions& options() const noexcept { return options_; }

    // Number of live tracked resources.
    [[nodiscard]] std::size_t resource_count() const noexcept { return tracker_.size(); }

private:
    friend class ChainedBatch;
    friend class Cursor;
    friend class UpdateFeed;
    friend class QueryScope;

    // Counts an in-flight engine read that close() must wait for.
    class PendingRead {
    public:
        explicit PendingRead(Database& db);
        ~PendingRead();
        PendingRead(const PendingRead&)            = delete;
        PendingRead& operator=(const PendingRead&) = delete;
    private:
        Database& db_;
    };

    // Runs a synchronous engine mutation.  Returns the failure, if any,
    // instead of throwing, so it can be reported through an awaitable.
    template <typename Fn>
    std::exception_ptr write(Fn&& fn);

    // Reports `error` (or success) on the next turn of the io_context.
    [[nodiscard]] boost::asio::awaitable<void> settle(std::exception_ptr error);

    void require_open() const;

    boost::asio::io_context& context() noexcept { return ioc_; }
    boost::asio::thread_pool& pool() noexcept { return pool_; }
    WriteNotifier& notifier() noexcept { return notifier_; }
    spdlog::logger& logger() const noexcept { return *logger_; }
    Engine& engine() noexcept { return *engine_; }

    boost::asio::io_context& ioc_;
    std::string location_;
    std::unique_ptr<Engine> engine_;
    std::shared_ptr<spdlog::logger> logger_;
    boost::asio::thread_pool pool_;

    Status status_ = Status::New;
    OpenOptions options_;
    std::vector<std::string> columns_;

    ResourceTracker tracker_;
    WriteNotifier notifier_;
    AsyncEvent opened_;     // set once an open attempt settles
    AsyncEvent closed_;     // set once a close settles
    AsyncEvent idle_;       // set while no engine read is in flight
    std::size_t pending_reads_ = 0;
};

template <typename Fn>
std::exception_ptr Database::write(Fn&& fn) {
    if (status_ != Status::Open) {
        return std::make_exception_ptr(not_open_error());
    }
    try {
        fn();
    } catch (const std::exception&) {
        return std::current_exception();
    }
    notifier_.notify();
    return nullptr;
}

} // namespace rlevel

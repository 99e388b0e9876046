#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string_view>

#include <boost/asio/awaitable.hpp>

#include <spdlog/spdlog.h>

namespace rlevel {

class ResourceTracker;

// ── Resource ─────────────────────────────────────────────────────────────────
//
// A façade object with an engine-side counterpart (cursor, chained batch,
// update feed, in-flight query) that must be closed before the database
// closes.
//
// The tracker holds resources weakly; a resource holds only a non-owning
// ticket back into the tracker and removes itself in its own close path.
//
// NOT thread-safe: resources live on the database's executor.

class Resource : public std::enable_shared_from_this<Resource> {
public:
    virtual ~Resource();

    Resource(const Resource&)            = delete;
    Resource& operator=(const Resource&) = delete;

    // Waits for in-flight work to settle, then releases the engine-side state
    // and detaches from the tracker.  Safe to call more than once.
    [[nodiscard]] virtual boost::asio::awaitable<void> close() = 0;

    // Immediate teardown without waiting.  Used only when the database is
    // destroyed while still open.
    virtual void release() noexcept = 0;

    [[nodiscard]] virtual bool is_closed() const noexcept = 0;

    // Short name for log lines ("iterator", "batch", ...).
    [[nodiscard]] virtual std::string_view kind() const noexcept = 0;

    [[nodiscard]] bool attached() const noexcept { return tracker_ != nullptr; }

protected:
    Resource() = default;

    // Removes this resource from its tracker, if still attached.
    void detach() noexcept;

private:
    friend class ResourceTracker;

    ResourceTracker* tracker_ = nullptr;
    uint64_t ticket_ = 0;
};

// ── ResourceTracker ──────────────────────────────────────────────────────────
//
// Registry of the resources created during one open period of a database.
//
// close_all() starts a sweep: attach() is rejected from then on, and every
// attached resource is closed exactly once.  Resources may detach themselves
// (or be destroyed) while the sweep is running.  A failing close is logged and
// does not stop the sweep.

class ResourceTracker {
public:
    explicit ResourceTracker(std::shared_ptr<spdlog::logger> logger);
    ~ResourceTracker();

    ResourceTracker(const ResourceTracker&)            = delete;
    ResourceTracker& operator=(const ResourceTracker&) = delete;

    // Throws Error(invalid_state) once a sweep has started.
    void attach(const std::shared_ptr<Resource>& resource);

    void detach(Resource& resource) noexcept;

    // Closes every attached resource and waits for each close to settle.
    [[nodiscard]] boost::asio::awaitable<void> close_all();

    // Synchronous variant of close_all() built on Resource::release().
    void release_all() noexcept;

    // Accept attachments again (database re-opened).
    void reset() noexcept { closing_ = false; }

    [[nodiscard]] bool closing() const noexcept { return closing_; }
    [[nodiscard]] std::size_t size() const noexcept { return resources_.size(); }

private:
    std::shared_ptr<spdlog::logger> logger_;
    std::map<uint64_t, std::weak_ptr<Resource>> resources_;
    uint64_t next_ticket_ = 1;
    bool closing_ = false;
};

} // namespace rlevel
